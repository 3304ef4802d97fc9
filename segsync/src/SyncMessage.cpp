#include "SyncMessage.h"

#include <array>
#include <charconv>
#include <chrono>
#include <map>

#include <glaze/glaze.hpp>

#include "Codec.h"

// ---------------------------------------------------------------------------
// Wire structures
// ---------------------------------------------------------------------------

namespace
{

/// "data" object.  Delta uses indices/values/numChanges, FullSnapshot uses
/// imageData; the geometry fields are shared.
struct WireData
{
    std::optional<std::string> indices;
    std::optional<std::string> values;
    std::optional<uint64_t> numChanges;
    std::optional<std::string> imageData;
    std::optional<std::array<int, 3>> dimensions;
    std::optional<std::array<double, 3>> spacing;
    std::optional<std::array<double, 3>> origin;
    std::optional<std::string> dataType;
    std::optional<std::map<std::string, std::string>> segmentNames;
};

struct WireEnvelope
{
    std::string type;
    std::optional<std::string> userId;
    std::optional<int64_t> timestamp;
    std::optional<WireData> data;
    std::optional<int> totalUsers;
    std::optional<std::vector<std::string>> users;
    std::optional<std::string> message;
};

} // anonymous namespace

template <>
struct glz::meta<WireData>
{
    using T = WireData;
    static constexpr auto value = object(
        "indices",      &T::indices,
        "values",       &T::values,
        "numChanges",   &T::numChanges,
        "imageData",    &T::imageData,
        "dimensions",   &T::dimensions,
        "spacing",      &T::spacing,
        "origin",       &T::origin,
        "dataType",     &T::dataType,
        "segmentNames", &T::segmentNames
    );
};

template <>
struct glz::meta<WireEnvelope>
{
    using T = WireEnvelope;
    static constexpr auto value = object(
        "type",       &T::type,
        "userId",     &T::userId,
        "timestamp",  &T::timestamp,
        "data",       &T::data,
        "totalUsers", &T::totalUsers,
        "users",      &T::users,
        "message",    &T::message
    );
};

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

namespace
{

std::array<int, 3> toArray(const glm::ivec3& v) { return {v[0], v[1], v[2]}; }
std::array<double, 3> toArray(const glm::dvec3& v) { return {v[0], v[1], v[2]}; }
glm::ivec3 toIVec(const std::array<int, 3>& a) { return glm::ivec3(a[0], a[1], a[2]); }
glm::dvec3 toDVec(const std::array<double, 3>& a) { return glm::dvec3(a[0], a[1], a[2]); }

std::optional<std::map<std::string, std::string>>
namesToWire(const std::map<uint32_t, std::string>& names)
{
    if (names.empty())
        return std::nullopt;
    std::map<std::string, std::string> out;
    for (const auto& [label, name] : names)
        out[std::to_string(label)] = name;
    return out;
}

std::map<uint32_t, std::string>
namesFromWire(const std::optional<std::map<std::string, std::string>>& wire)
{
    std::map<uint32_t, std::string> out;
    if (!wire)
        return out;
    for (const auto& [key, name] : *wire)
    {
        uint32_t label = 0;
        auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), label);
        if (ec != std::errc() || ptr != key.data() + key.size())
            throw ProtocolError("Segment name key is not a label: " + key);
        out[label] = name;
    }
    return out;
}

template <typename T>
const T& require(const std::optional<T>& field, const char* name, std::string_view type)
{
    if (!field)
        throw ProtocolError(std::string(type) + " message is missing '" + name + "'");
    return *field;
}

LabelType requireLabelType(const WireData& data, std::string_view type)
{
    const std::string& name = require(data.dataType, "dataType", type);
    auto parsed = labelTypeByName(name);
    if (!parsed)
        throw ProtocolError("Unsupported dataType: " + name);
    return *parsed;
}

glm::ivec3 requireDimensions(const WireData& data, std::string_view type)
{
    glm::ivec3 dims = toIVec(require(data.dimensions, "dimensions", type));
    if (dims[0] < 0 || dims[1] < 0 || dims[2] < 0)
        throw ProtocolError("Negative dimensions in " + std::string(type) + " message");
    return dims;
}

Delta decodeDelta(const WireData& data)
{
    constexpr std::string_view kType = "delta";
    Delta delta;
    delta.sourceDimensions = requireDimensions(data, kType);
    delta.dataType = requireLabelType(data, kType);
    if (data.spacing)
        delta.spacing = toDVec(*data.spacing);
    if (data.origin)
        delta.origin = toDVec(*data.origin);
    delta.segmentNames = namesFromWire(data.segmentNames);

    uint64_t numChanges = require(data.numChanges, "numChanges", kType);
    delta.changedIndices = decodeIndexPayload(require(data.indices, "indices", kType));
    delta.changedValues = decodeLabelPayload(require(data.values, "values", kType),
                                             delta.dataType);
    if (delta.changedIndices.size() != numChanges ||
        delta.changedValues.size() != numChanges)
        throw CodecError("Delta declares " + std::to_string(numChanges) +
                         " changes but carries " +
                         std::to_string(delta.changedIndices.size()) + " indices and " +
                         std::to_string(delta.changedValues.size()) + " values");
    return delta;
}

FullSnapshot decodeSnapshot(const WireData& data)
{
    constexpr std::string_view kType = "segmentation_update";
    FullSnapshot snap;
    snap.dimensions = requireDimensions(data, kType);
    snap.dataType = requireLabelType(data, kType);
    if (data.spacing)
        snap.spacing = toDVec(*data.spacing);
    if (data.origin)
        snap.origin = toDVec(*data.origin);
    snap.segmentNames = namesFromWire(data.segmentNames);
    snap.labels = decodeLabelPayload(require(data.imageData, "imageData", kType),
                                     snap.dataType, voxelCountFor(snap.dimensions));
    if (snap.labels.size() != voxelCountFor(snap.dimensions))
        throw CodecError("Snapshot label count does not match its dimensions");
    return snap;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Public API
// ---------------------------------------------------------------------------

SyncMessage SyncMessage::join(const std::string& userId, int64_t timestamp)
{
    SyncMessage m;
    m.type = MessageType::Join;
    m.userId = userId;
    m.timestamp = timestamp;
    return m;
}

SyncMessage SyncMessage::ping(int64_t timestamp)
{
    SyncMessage m;
    m.type = MessageType::Ping;
    m.timestamp = timestamp;
    return m;
}

SyncMessage SyncMessage::fromDelta(const std::string& userId, Delta delta)
{
    SyncMessage m;
    m.type = MessageType::Delta;
    m.userId = userId;
    m.timestamp = delta.timestamp;
    m.delta = std::move(delta);
    return m;
}

SyncMessage SyncMessage::fromSnapshot(const std::string& userId, FullSnapshot snapshot)
{
    SyncMessage m;
    m.type = MessageType::FullSnapshot;
    m.userId = userId;
    m.timestamp = snapshot.timestamp;
    m.snapshot = std::move(snapshot);
    return m;
}

std::string_view messageTypeName(MessageType type)
{
    switch (type)
    {
    case MessageType::Join:         return "join";
    case MessageType::Delta:        return "delta";
    case MessageType::FullSnapshot: return "segmentation_update";
    case MessageType::UserJoined:   return "user_joined";
    case MessageType::UserLeft:     return "user_left";
    case MessageType::UserList:     return "user_list";
    case MessageType::Error:        return "error";
    case MessageType::Ping:         return "ping";
    case MessageType::SessionEnded: return "session_ended";
    case MessageType::Unknown:      break;
    }
    return "unknown";
}

std::optional<MessageType> messageTypeByName(std::string_view name)
{
    for (int i = 0; i < static_cast<int>(MessageType::Unknown); ++i)
    {
        auto type = static_cast<MessageType>(i);
        if (messageTypeName(type) == name)
            return type;
    }
    return std::nullopt;
}

std::string encodeMessage(const SyncMessage& message)
{
    WireEnvelope env;
    env.type = message.type == MessageType::Unknown ? message.rawType
                                                    : std::string(messageTypeName(message.type));
    if (env.type.empty())
        throw ProtocolError("Cannot encode a message without a type");
    if (!message.userId.empty())
        env.userId = message.userId;
    env.timestamp = message.timestamp;

    switch (message.type)
    {
    case MessageType::Delta:
    {
        if (!message.delta)
            throw ProtocolError("Delta message has no payload");
        const Delta& d = *message.delta;
        if (d.changedIndices.size() != d.changedValues.size())
            throw CodecError("Delta index and value counts differ");
        WireData data;
        data.indices = encodeIndexPayload(d.changedIndices);
        data.values = encodeLabelPayload(d.changedValues, d.dataType);
        data.numChanges = d.changedIndices.size();
        data.dimensions = toArray(d.sourceDimensions);
        data.spacing = toArray(d.spacing);
        data.origin = toArray(d.origin);
        data.dataType = std::string(labelTypeName(d.dataType));
        data.segmentNames = namesToWire(d.segmentNames);
        env.data = std::move(data);
        break;
    }
    case MessageType::FullSnapshot:
    {
        if (!message.snapshot)
            throw ProtocolError("Snapshot message has no payload");
        const FullSnapshot& s = *message.snapshot;
        WireData data;
        data.imageData = encodeLabelPayload(s.labels, s.dataType);
        data.dimensions = toArray(s.dimensions);
        data.spacing = toArray(s.spacing);
        data.origin = toArray(s.origin);
        data.dataType = std::string(labelTypeName(s.dataType));
        data.segmentNames = namesToWire(s.segmentNames);
        env.data = std::move(data);
        break;
    }
    case MessageType::UserJoined:
    case MessageType::UserLeft:
        env.totalUsers = message.totalUsers;
        break;
    case MessageType::UserList:
        env.users = message.users;
        break;
    case MessageType::Error:
        env.message = message.errorMessage;
        break;
    default:
        break;
    }

    std::string buffer{};
    auto ec = glz::write<glz::opts{}>(env, buffer);
    if (ec)
        throw ProtocolError("Failed to serialize message to JSON");
    return buffer;
}

SyncMessage decodeMessage(std::string_view text)
{
    WireEnvelope env{};
    std::string content(text);
    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(env, content);
    if (ec)
        throw ProtocolError("Malformed message: " + glz::format_error(ec, content));
    if (env.type.empty())
        throw ProtocolError("Message is missing 'type'");

    SyncMessage m;
    m.rawType = env.type;
    m.type = messageTypeByName(env.type).value_or(MessageType::Unknown);
    m.userId = env.userId.value_or("");
    m.timestamp = env.timestamp.value_or(0);

    switch (m.type)
    {
    case MessageType::Join:
        m.userId = require(env.userId, "userId", env.type);
        break;
    case MessageType::Delta:
        m.userId = require(env.userId, "userId", env.type);
        m.delta = decodeDelta(require(env.data, "data", env.type));
        m.delta->timestamp = m.timestamp;
        break;
    case MessageType::FullSnapshot:
        m.userId = require(env.userId, "userId", env.type);
        m.snapshot = decodeSnapshot(require(env.data, "data", env.type));
        m.snapshot->timestamp = m.timestamp;
        break;
    case MessageType::UserJoined:
    case MessageType::UserLeft:
        m.totalUsers = env.totalUsers;
        break;
    case MessageType::UserList:
        m.users = require(env.users, "users", env.type);
        break;
    case MessageType::Error:
        m.errorMessage = env.message.value_or("");
        break;
    default:
        break;
    }
    return m;
}

int64_t currentTimestampMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
