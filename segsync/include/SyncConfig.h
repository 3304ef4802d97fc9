#pragma once

#include <cstdint>
#include <string>

/// Tunables of the synchronization engine.
struct EngineConfig
{
    double fullResyncRatio = 0.30;        // changed fraction above which a full snapshot is sent
    uint64_t debounceIntervalMs = 2000;   // quiet window before local edits are sent
    uint64_t keepaliveIntervalMs = 5000;  // ping period while connected
    uint64_t pollIntervalMs = 50;         // inbound poll period (<= 100)
    uint64_t connectTimeoutMs = 5000;     // bounded wait in connect()
    bool autoReconnect = false;           // re-open after an unexpected drop
    uint64_t reconnectDelayMs = 2000;
    int maxReconnectAttempts = 5;
};

/// Who we are and where the relay lives.  Resolved by external
/// authentication / session services; the engine only consumes it.
struct PeerConfig
{
    std::string endpoint;        // base URL of the relay, e.g. ws://host:8000
    std::string sessionId;       // collaborative session to join
    std::string participantId;   // our identifier on the wire
};

/// Top-level config structure.
struct SyncConfig
{
    EngineConfig engine;
    PeerConfig peer;
};

/// Return the global config file path: $HOME/.config/segsync/config.json
/// ($XDG_CONFIG_HOME is honoured when set).
std::string globalConfigPath();

/// Load a config from a JSON file.  Returns a default SyncConfig if the file
/// does not exist.  Throws std::runtime_error on parse errors.
SyncConfig loadConfig(const std::string& path);

/// Save a config to a JSON file.  Creates parent directories as needed.
/// Throws std::runtime_error on I/O errors.
void saveConfig(const SyncConfig& config, const std::string& path);

/// Merge a local config on top of a global config.
/// Local values override global values where they differ from the defaults.
SyncConfig mergeConfigs(const SyncConfig& global, const SyncConfig& local);

/// Throws std::invalid_argument describing the first out-of-range field.
void validateEngineConfig(const EngineConfig& config);

/// Build the relay URL for a session: <base>/ws/sessions/<id>?token=<token>.
/// Trailing slashes are stripped, an existing /ws suffix is not repeated and
/// the token query is omitted when @p token is empty.
std::string buildSessionUrl(const std::string& baseUrl, const std::string& sessionId,
                            const std::string& token);
