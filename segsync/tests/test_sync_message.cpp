// test_sync_message.cpp - Tests for the JSON wire protocol.
//
// Verifies message encoding and decoding for every tag, the payload
// fields a relay and other peers rely on, and rejection of malformed
// frames.

#include "SyncMessage.h"

#include <iostream>
#include <string>

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

template <typename Error, typename Fn>
static bool throwsError(Fn fn)
{
    try
    {
        fn();
    }
    catch (const Error&)
    {
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Test 1: Tag names
// ---------------------------------------------------------------------------
static void testTypeNames()
{
    std::cout << "  testTypeNames...";

    CHECK(messageTypeName(MessageType::Delta) == "delta", "delta tag");
    CHECK(messageTypeName(MessageType::FullSnapshot) == "segmentation_update", "snapshot tag");
    CHECK(messageTypeName(MessageType::UserJoined) == "user_joined", "user_joined tag");
    CHECK(messageTypeName(MessageType::SessionEnded) == "session_ended", "session_ended tag");

    for (int i = 0; i < static_cast<int>(MessageType::Unknown); ++i)
    {
        auto type = static_cast<MessageType>(i);
        auto parsed = messageTypeByName(messageTypeName(type));
        CHECK(parsed.has_value() && *parsed == type, "messageTypeByName inverts messageTypeName");
    }
    CHECK(!messageTypeByName("cursor_moved").has_value(), "unknown tag");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 2: Delta message
// ---------------------------------------------------------------------------
static void testDeltaMessage()
{
    std::cout << "  testDeltaMessage...";

    Delta d;
    d.changedIndices = {{2, 2, 2}, {0, 3, 1}};
    d.changedValues = {5, 1};
    d.sourceDimensions = glm::ivec3(4, 4, 4);
    d.spacing = glm::dvec3(2.0, 1.0, 0.5);
    d.origin = glm::dvec3(-1.0, 0.0, 10.0);
    d.dataType = LabelType::UInt8;
    d.segmentNames[5] = "lesion";
    d.timestamp = 1700000000123;

    std::string text = encodeMessage(SyncMessage::fromDelta("alice", d));
    CHECK(contains(text, "\"type\":\"delta\""), "type field");
    CHECK(contains(text, "\"userId\":\"alice\""), "userId field");
    CHECK(contains(text, "\"numChanges\":2"), "numChanges field");
    CHECK(contains(text, "\"dataType\":\"uint8\""), "dataType field");
    CHECK(contains(text, "\"timestamp\":1700000000123"), "timestamp in epoch ms");
    CHECK(contains(text, "\"5\":\"lesion\""), "segment names keyed by label");

    SyncMessage m = decodeMessage(text);
    CHECK(m.type == MessageType::Delta, "decoded type");
    CHECK(m.userId == "alice", "decoded userId");
    CHECK(m.timestamp == 1700000000123, "decoded timestamp");
    CHECK(m.delta.has_value(), "delta payload present");
    if (m.delta)
    {
        CHECK(m.delta->changedIndices == d.changedIndices, "indices survive");
        CHECK(m.delta->changedValues == d.changedValues, "values survive");
        CHECK(m.delta->sourceDimensions == d.sourceDimensions, "dimensions survive");
        CHECK(m.delta->spacing == d.spacing, "spacing survives");
        CHECK(m.delta->origin == d.origin, "origin survives");
        CHECK(m.delta->dataType == LabelType::UInt8, "element type survives");
        CHECK(m.delta->segmentNames == d.segmentNames, "names survive");
    }

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 3: Full snapshot message
// ---------------------------------------------------------------------------
static void testSnapshotMessage()
{
    std::cout << "  testSnapshotMessage...";

    LabelVolume vol(glm::ivec3(2, 3, 4), LabelType::Int16);
    vol.setLabelAt(1, 2, 3, 300);
    vol.segmentNames[300] = "vessel";

    std::string text = encodeMessage(
        SyncMessage::fromSnapshot("bob", FullSnapshot::fromVolume(vol, 42)));
    CHECK(contains(text, "\"type\":\"segmentation_update\""), "snapshot tag");
    CHECK(contains(text, "\"imageData\":"), "imageData field");
    CHECK(contains(text, "\"dimensions\":[2,3,4]"), "dimensions in z,y,x order");

    SyncMessage m = decodeMessage(text);
    CHECK(m.type == MessageType::FullSnapshot, "decoded type");
    CHECK(m.snapshot.has_value(), "snapshot payload present");
    if (m.snapshot)
    {
        CHECK(m.snapshot->labels == vol.labels, "labels survive");
        CHECK(m.snapshot->dimensions == vol.dimensions, "dimensions survive");
        CHECK(m.snapshot->dataType == LabelType::Int16, "element type survives");
        CHECK(m.snapshot->segmentNames.at(300) == "vessel", "names survive");
        CHECK(m.snapshot->timestamp == 42, "timestamp survives");
    }

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 4: Relay-originated messages
// ---------------------------------------------------------------------------
static void testRelayMessages()
{
    std::cout << "  testRelayMessages...";

    SyncMessage joined = decodeMessage(
        R"({"type":"user_joined","userId":"carol","totalUsers":3,"timestamp":5})");
    CHECK(joined.type == MessageType::UserJoined, "user_joined");
    CHECK(joined.userId == "carol", "user_joined userId");
    CHECK(joined.totalUsers.has_value() && *joined.totalUsers == 3, "totalUsers");

    SyncMessage left = decodeMessage(R"({"type":"user_left","userId":"carol"})");
    CHECK(left.type == MessageType::UserLeft, "user_left");
    CHECK(!left.totalUsers.has_value(), "totalUsers is optional");

    SyncMessage list = decodeMessage(R"({"type":"user_list","users":["a","b"]})");
    CHECK(list.type == MessageType::UserList, "user_list");
    CHECK(list.users.size() == 2 && list.users[1] == "b", "users array");

    SyncMessage err = decodeMessage(R"({"type":"error","message":"session full"})");
    CHECK(err.type == MessageType::Error, "error");
    CHECK(err.errorMessage == "session full", "error message");

    SyncMessage ended = decodeMessage(R"({"type":"session_ended"})");
    CHECK(ended.type == MessageType::SessionEnded, "session_ended");

    SyncMessage ping = decodeMessage(encodeMessage(SyncMessage::ping(77)));
    CHECK(ping.type == MessageType::Ping && ping.timestamp == 77, "ping round-trips");

    SyncMessage join = decodeMessage(encodeMessage(SyncMessage::join("dave", 1)));
    CHECK(join.type == MessageType::Join && join.userId == "dave", "join round-trips");

    SyncMessage unknown = decodeMessage(R"({"type":"cursor_moved","x":1})");
    CHECK(unknown.type == MessageType::Unknown, "unknown tag decodes as Unknown");
    CHECK(unknown.rawType == "cursor_moved", "raw tag kept");

    SyncMessage extra = decodeMessage(R"({"type":"ping","future_field":{"a":1}})");
    CHECK(extra.type == MessageType::Ping, "unknown keys are ignored");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 5: Malformed frames
// ---------------------------------------------------------------------------
static void testMalformedFrames()
{
    std::cout << "  testMalformedFrames...";

    CHECK(throwsError<ProtocolError>([] { decodeMessage("{not json"); }), "invalid JSON");
    CHECK(throwsError<ProtocolError>([] { decodeMessage("{}"); }), "missing type");
    CHECK(throwsError<ProtocolError>([] { decodeMessage(R"({"type":"delta"})"); }),
          "delta without userId");
    CHECK(throwsError<ProtocolError>([] {
              decodeMessage(R"({"type":"delta","userId":"x"})");
          }),
          "delta without data");
    CHECK(throwsError<ProtocolError>([] {
              decodeMessage(R"({"type":"delta","userId":"x","data":{"dimensions":[1,1,1],"dataType":"float64","numChanges":0,"indices":"","values":""}})");
          }),
          "unsupported element type");
    CHECK(throwsError<ProtocolError>([] { decodeMessage(R"({"type":"user_list"})"); }),
          "user_list without users");

    // Payload that is not valid base64.
    CHECK(throwsError<CodecError>([] {
              decodeMessage(R"({"type":"delta","userId":"x","data":{"dimensions":[1,1,1],"dataType":"uint8","numChanges":1,"indices":"@@@@","values":"@@@@"}})");
          }),
          "corrupt payload");

    // numChanges disagrees with the payloads.
    Delta d;
    d.changedIndices = {{0, 0, 0}};
    d.changedValues = {1};
    d.sourceDimensions = glm::ivec3(1, 1, 1);
    std::string text = encodeMessage(SyncMessage::fromDelta("x", d));
    size_t pos = text.find("\"numChanges\":1");
    CHECK(pos != std::string::npos, "numChanges present");
    if (pos != std::string::npos)
    {
        text.replace(pos, 14, "\"numChanges\":2");
        CHECK(throwsError<CodecError>([&] { decodeMessage(text); }), "count mismatch");
    }

    // Snapshot whose label count does not match its dimensions.
    FullSnapshot snap;
    snap.dimensions = glm::ivec3(1, 1, 2);
    snap.labels = {1, 2, 3};
    std::string bad = encodeMessage(SyncMessage::fromSnapshot("y", snap));
    CHECK(throwsError<CodecError>([&] { decodeMessage(bad); }), "snapshot size mismatch");

    // Indices beyond uint16 cannot be encoded.
    Delta huge;
    huge.changedIndices = {{70000, 0, 0}};
    huge.changedValues = {1};
    huge.sourceDimensions = glm::ivec3(70001, 1, 1);
    CHECK(throwsError<CodecError>([&] { encodeMessage(SyncMessage::fromDelta("z", huge)); }),
          "oversized index");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main()
{
    std::cout << "=== SyncMessage Tests ===\n";

    testTypeNames();
    testDeltaMessage();
    testSnapshotMessage();
    testRelayMessages();
    testMalformedFrames();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All SyncMessage tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " SyncMessage test(s) FAILED.\n";
        return 1;
    }
}
