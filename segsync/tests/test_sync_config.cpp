// test_sync_config.cpp - Tests for SyncConfig JSON serialization and file I/O.
//
// Verifies loadConfig(), saveConfig(), global/local merging, engine
// parameter validation and session URL construction.

#include "SyncConfig.h"

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
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

static bool approxEq(double a, double b, double tol = 1e-9)
{
    return std::fabs(a - b) < tol;
}

/// RAII helper to create a temp file and remove it on destruction.
struct TmpFile
{
    std::string path;

    TmpFile(const std::string& name)
        : path((std::filesystem::temp_directory_path() / name).string())
    {}

    TmpFile(const std::string& name, const std::string& content)
        : path((std::filesystem::temp_directory_path() / name).string())
    {
        std::ofstream ofs(path, std::ios::trunc);
        ofs << content;
    }

    ~TmpFile() { std::filesystem::remove(path); }
};

static bool rejects(const EngineConfig& cfg)
{
    try
    {
        validateEngineConfig(cfg);
    }
    catch (const std::invalid_argument&)
    {
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Test 1: Missing file returns the defaults
// ---------------------------------------------------------------------------
static void testMissingFileReturnsDefault()
{
    std::cout << "  testMissingFileReturnsDefault...";

    SyncConfig cfg = loadConfig("/nonexistent/path/segsync_config_that_does_not_exist.json");

    CHECK(approxEq(cfg.engine.fullResyncRatio, 0.30), "default full resync ratio is 0.30");
    CHECK(cfg.engine.debounceIntervalMs == 2000, "default debounce is 2 s");
    CHECK(cfg.engine.keepaliveIntervalMs == 5000, "default keepalive is 5 s");
    CHECK(cfg.engine.pollIntervalMs <= 100, "default poll period is at most 100 ms");
    CHECK(!cfg.engine.autoReconnect, "auto reconnect is off by default");
    CHECK(cfg.peer.endpoint.empty(), "no default endpoint");
    CHECK(cfg.peer.sessionId.empty(), "no default session");
    CHECK(cfg.peer.participantId.empty(), "no default participant");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 2: Full round-trip with all fields populated
// ---------------------------------------------------------------------------
static void testSaveAndReloadRoundTrip()
{
    std::cout << "  testSaveAndReloadRoundTrip...";
    TmpFile tmp("test_segsync_cfg_rt.json");

    SyncConfig original;
    original.engine.fullResyncRatio = 0.5;
    original.engine.debounceIntervalMs = 750;
    original.engine.keepaliveIntervalMs = 10000;
    original.engine.pollIntervalMs = 20;
    original.engine.connectTimeoutMs = 3000;
    original.engine.autoReconnect = true;
    original.engine.reconnectDelayMs = 500;
    original.engine.maxReconnectAttempts = 9;
    original.peer.endpoint = "wss://relay.example.org";
    original.peer.sessionId = "abc-123";
    original.peer.participantId = "reader-7";

    saveConfig(original, tmp.path);
    SyncConfig loaded = loadConfig(tmp.path);

    CHECK(approxEq(loaded.engine.fullResyncRatio, 0.5), "engine.fullResyncRatio");
    CHECK(loaded.engine.debounceIntervalMs == 750, "engine.debounceIntervalMs");
    CHECK(loaded.engine.keepaliveIntervalMs == 10000, "engine.keepaliveIntervalMs");
    CHECK(loaded.engine.pollIntervalMs == 20, "engine.pollIntervalMs");
    CHECK(loaded.engine.connectTimeoutMs == 3000, "engine.connectTimeoutMs");
    CHECK(loaded.engine.autoReconnect, "engine.autoReconnect");
    CHECK(loaded.engine.reconnectDelayMs == 500, "engine.reconnectDelayMs");
    CHECK(loaded.engine.maxReconnectAttempts == 9, "engine.maxReconnectAttempts");
    CHECK(loaded.peer.endpoint == "wss://relay.example.org", "peer.endpoint");
    CHECK(loaded.peer.sessionId == "abc-123", "peer.sessionId");
    CHECK(loaded.peer.participantId == "reader-7", "peer.participantId");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 3: Partial files and snake_case keys
// ---------------------------------------------------------------------------
static void testPartialFile()
{
    std::cout << "  testPartialFile...";

    TmpFile tmp("test_segsync_cfg_partial.json",
                R"({"engine": {"debounce_interval_ms": 100, "unknown_knob": 3},
                    "peer": {"session_id": "s9"},
                    "viewer": {"anything": true}})");

    SyncConfig cfg = loadConfig(tmp.path);
    CHECK(cfg.engine.debounceIntervalMs == 100, "debounce read from snake_case key");
    CHECK(approxEq(cfg.engine.fullResyncRatio, 0.30), "unset fields keep defaults");
    CHECK(cfg.peer.sessionId == "s9", "session id read");
    CHECK(cfg.peer.endpoint.empty(), "unset peer fields stay empty");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 4: Malformed JSON and invalid structure throw
// ---------------------------------------------------------------------------
static void testMalformedJsonThrows()
{
    std::cout << "  testMalformedJsonThrows...";

    TmpFile bad("test_segsync_cfg_bad.json", "{ this is not valid json !!!");
    bool caught = false;
    try { loadConfig(bad.path); }
    catch (const std::runtime_error&) { caught = true; }
    CHECK(caught, "loadConfig should throw std::runtime_error on malformed JSON");

    TmpFile badStruct("test_segsync_cfg_badstruct.json",
                      R"({"engine": 42, "peer": "not_an_object"})");
    caught = false;
    try { loadConfig(badStruct.path); }
    catch (const std::runtime_error&) { caught = true; }
    CHECK(caught, "loadConfig should throw std::runtime_error on invalid structure");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 5: Local values override global ones
// ---------------------------------------------------------------------------
static void testMergeConfigs()
{
    std::cout << "  testMergeConfigs...";

    SyncConfig global;
    global.engine.debounceIntervalMs = 1000;
    global.engine.autoReconnect = true;
    global.peer.endpoint = "ws://global:8000";
    global.peer.participantId = "global-user";

    SyncConfig local;
    local.engine.fullResyncRatio = 0.1;
    local.peer.sessionId = "local-session";
    local.peer.participantId = "local-user";

    SyncConfig merged = mergeConfigs(global, local);
    CHECK(merged.engine.debounceIntervalMs == 1000, "global value kept when local is default");
    CHECK(merged.engine.autoReconnect, "global flag kept when local is default");
    CHECK(approxEq(merged.engine.fullResyncRatio, 0.1), "local non-default value wins");
    CHECK(merged.peer.endpoint == "ws://global:8000", "global endpoint kept");
    CHECK(merged.peer.sessionId == "local-session", "local session id wins");
    CHECK(merged.peer.participantId == "local-user", "local participant wins");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 6: Engine parameter validation
// ---------------------------------------------------------------------------
static void testValidation()
{
    std::cout << "  testValidation...";

    EngineConfig cfg;
    CHECK(!rejects(cfg), "defaults are valid");

    EngineConfig c1 = cfg;
    c1.fullResyncRatio = 0.0;
    CHECK(rejects(c1), "zero ratio rejected");

    EngineConfig c2 = cfg;
    c2.fullResyncRatio = 1.0;
    CHECK(!rejects(c2), "ratio of 1 accepted");

    EngineConfig c3 = cfg;
    c3.pollIntervalMs = 101;
    CHECK(rejects(c3), "poll period above 100 ms rejected");

    EngineConfig c4 = cfg;
    c4.debounceIntervalMs = 0;
    CHECK(rejects(c4), "zero debounce rejected");

    EngineConfig c5 = cfg;
    c5.autoReconnect = true;
    c5.maxReconnectAttempts = 0;
    CHECK(rejects(c5), "auto reconnect needs at least one attempt");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 7: Session URL
// ---------------------------------------------------------------------------
static void testBuildSessionUrl()
{
    std::cout << "  testBuildSessionUrl...";

    CHECK(buildSessionUrl("ws://localhost:8000", "s1", "") ==
              "ws://localhost:8000/ws/sessions/s1",
          "plain base URL");
    CHECK(buildSessionUrl("ws://localhost:8000/", "s1", "t0k") ==
              "ws://localhost:8000/ws/sessions/s1?token=t0k",
          "trailing slash trimmed and token appended");
    CHECK(buildSessionUrl("wss://relay/ws", "abc", "") == "wss://relay/ws/sessions/abc",
          "existing /ws suffix not repeated");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 8: saveConfig creates parent directories; global path honours XDG
// ---------------------------------------------------------------------------
static void testSaveCreatesParentDirAndGlobalPath()
{
    std::cout << "  testSaveCreatesParentDirAndGlobalPath...";

    auto base = std::filesystem::temp_directory_path() / "test_segsync_cfg_sub";
    std::string nested = (base / "deeper" / "config.json").string();

    SyncConfig cfg;
    cfg.peer.sessionId = "nested";
    saveConfig(cfg, nested);
    CHECK(std::filesystem::exists(nested), "config file created in new directories");
    CHECK(loadConfig(nested).peer.sessionId == "nested", "nested config round-trips");
    std::filesystem::remove_all(base);

    setenv("XDG_CONFIG_HOME", "/tmp/segsync-xdg", 1);
    CHECK(globalConfigPath() == "/tmp/segsync-xdg/segsync/config.json",
          "global config lives under XDG_CONFIG_HOME");
    unsetenv("XDG_CONFIG_HOME");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main()
{
    std::cout << "=== SyncConfig Tests ===\n";

    testMissingFileReturnsDefault();
    testSaveAndReloadRoundTrip();
    testPartialFile();
    testMalformedJsonThrows();
    testMergeConfigs();
    testValidation();
    testBuildSessionUrl();
    testSaveCreatesParentDirAndGlobalPath();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All SyncConfig tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " SyncConfig test(s) FAILED.\n";
        return 1;
    }
}
