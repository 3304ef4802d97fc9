#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "DiffEngine.h"
#include "SyncErrors.h"

/// Message tags of the sync protocol.
enum class MessageType
{
    Join,          // "join"                 participant announces itself
    Delta,         // "delta"                sparse label changes
    FullSnapshot,  // "segmentation_update"  whole label volume
    UserJoined,    // "user_joined"
    UserLeft,      // "user_left"
    UserList,      // "user_list"
    Error,         // "error"                relay-side error
    Ping,          // "ping"                 keepalive
    SessionEnded,  // "session_ended"        relay closed the session

    Unknown        // unrecognised tag - logged and ignored
};

/// One protocol message.  Which optional members are populated depends on
/// the type: delta for Delta, snapshot for FullSnapshot, totalUsers for
/// UserJoined/UserLeft (when the relay sends it), users for UserList,
/// errorMessage for Error.
struct SyncMessage
{
    MessageType type = MessageType::Unknown;
    std::string rawType;          // tag as received (for Unknown)
    std::string userId;           // originating participant (empty for Ping)
    int64_t timestamp = 0;        // epoch ms

    std::optional<Delta> delta;
    std::optional<FullSnapshot> snapshot;
    std::optional<int> totalUsers;
    std::vector<std::string> users;
    std::string errorMessage;

    static SyncMessage join(const std::string& userId, int64_t timestamp);
    static SyncMessage ping(int64_t timestamp);
    static SyncMessage fromDelta(const std::string& userId, Delta delta);
    static SyncMessage fromSnapshot(const std::string& userId, FullSnapshot snapshot);
};

/// Wire tag for a message type ("join", "delta", ...).
std::string_view messageTypeName(MessageType type);

/// Inverse of messageTypeName(); nullopt for unknown tags.
std::optional<MessageType> messageTypeByName(std::string_view name);

/// Serialize to a JSON text frame.  Label and index arrays are packed,
/// deflated and base64 encoded.
/// @throws CodecError if a payload cannot be packed (e.g. an index above
///         65535 or a label too wide for the element type).
/// @throws ProtocolError if a Delta/FullSnapshot message has no payload.
std::string encodeMessage(const SyncMessage& message);

/// Parse a JSON text frame.  Unrecognised tags yield MessageType::Unknown
/// rather than an exception.
/// @throws ProtocolError on malformed JSON or a missing required field.
/// @throws CodecError on a corrupt payload.
SyncMessage decodeMessage(std::string_view text);

/// Milliseconds since the Unix epoch.
int64_t currentTimestampMs();
