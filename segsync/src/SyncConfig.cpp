#include "SyncConfig.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <glaze/glaze.hpp>

// ---- Glaze meta for custom JSON field names --------------------------------

template <>
struct glz::meta<EngineConfig>
{
    using T = EngineConfig;
    static constexpr auto value = object(
        "full_resync_ratio",      &T::fullResyncRatio,
        "debounce_interval_ms",   &T::debounceIntervalMs,
        "keepalive_interval_ms",  &T::keepaliveIntervalMs,
        "poll_interval_ms",       &T::pollIntervalMs,
        "connect_timeout_ms",     &T::connectTimeoutMs,
        "auto_reconnect",         &T::autoReconnect,
        "reconnect_delay_ms",     &T::reconnectDelayMs,
        "max_reconnect_attempts", &T::maxReconnectAttempts
    );
};

template <>
struct glz::meta<PeerConfig>
{
    using T = PeerConfig;
    static constexpr auto value = object(
        "endpoint",       &T::endpoint,
        "session_id",     &T::sessionId,
        "participant_id", &T::participantId
    );
};

template <>
struct glz::meta<SyncConfig>
{
    using T = SyncConfig;
    static constexpr auto value = object(
        "engine", &T::engine,
        "peer",   &T::peer
    );
};

// ---- Implementation --------------------------------------------------------

std::string globalConfigPath()
{
    // Prefer XDG_CONFIG_HOME, fall back to $HOME/.config
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    std::filesystem::path dir;
    if (xdg && xdg[0] != '\0')
    {
        dir = std::filesystem::path(xdg) / "segsync";
    }
    else
    {
        const char* home = std::getenv("HOME");
        if (!home || home[0] == '\0')
            throw std::runtime_error("Cannot determine home directory");
        dir = std::filesystem::path(home) / ".config" / "segsync";
    }
    return (dir / "config.json").string();
}

SyncConfig loadConfig(const std::string& path)
{
    if (!std::filesystem::exists(path))
        return {};

    std::ifstream ifs(path);
    if (!ifs)
        throw std::runtime_error("Cannot open config file: " + path);

    std::string content((std::istreambuf_iterator<char>(ifs)),
                         std::istreambuf_iterator<char>());

    SyncConfig config{};
    auto ec = glz::read<glz::opts{.error_on_unknown_keys = false}>(config, content);
    if (ec)
    {
        throw std::runtime_error("Failed to parse config file: " + path +
                                 "\n" + glz::format_error(ec, content));
    }
    return config;
}

void saveConfig(const SyncConfig& config, const std::string& path)
{
    std::filesystem::path p(path);
    std::filesystem::path dir = p.parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
            throw std::runtime_error("Cannot create config directory: " +
                                     dir.string() + " (" + ec.message() + ")");
    }

    std::string buffer{};
    auto ec = glz::write<glz::opts{.prettify = true}>(config, buffer);
    if (ec)
        throw std::runtime_error("Failed to serialize config to JSON");

    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs)
        throw std::runtime_error("Cannot write config file: " + path);
    ofs << buffer;
}

SyncConfig mergeConfigs(const SyncConfig& global, const SyncConfig& local)
{
    SyncConfig merged = global;

    // Override global settings with local ones if they differ from defaults
    const EngineConfig def{};
    const EngineConfig& le = local.engine;
    EngineConfig& me = merged.engine;
    if (le.fullResyncRatio != def.fullResyncRatio)
        me.fullResyncRatio = le.fullResyncRatio;
    if (le.debounceIntervalMs != def.debounceIntervalMs)
        me.debounceIntervalMs = le.debounceIntervalMs;
    if (le.keepaliveIntervalMs != def.keepaliveIntervalMs)
        me.keepaliveIntervalMs = le.keepaliveIntervalMs;
    if (le.pollIntervalMs != def.pollIntervalMs)
        me.pollIntervalMs = le.pollIntervalMs;
    if (le.connectTimeoutMs != def.connectTimeoutMs)
        me.connectTimeoutMs = le.connectTimeoutMs;
    if (le.autoReconnect != def.autoReconnect)
        me.autoReconnect = le.autoReconnect;
    if (le.reconnectDelayMs != def.reconnectDelayMs)
        me.reconnectDelayMs = le.reconnectDelayMs;
    if (le.maxReconnectAttempts != def.maxReconnectAttempts)
        me.maxReconnectAttempts = le.maxReconnectAttempts;

    if (!local.peer.endpoint.empty())
        merged.peer.endpoint = local.peer.endpoint;
    if (!local.peer.sessionId.empty())
        merged.peer.sessionId = local.peer.sessionId;
    if (!local.peer.participantId.empty())
        merged.peer.participantId = local.peer.participantId;

    return merged;
}

void validateEngineConfig(const EngineConfig& config)
{
    if (!(config.fullResyncRatio > 0.0 && config.fullResyncRatio <= 1.0))
        throw std::invalid_argument("full_resync_ratio must be in (0, 1]");
    if (config.debounceIntervalMs == 0)
        throw std::invalid_argument("debounce_interval_ms must be positive");
    if (config.keepaliveIntervalMs == 0)
        throw std::invalid_argument("keepalive_interval_ms must be positive");
    if (config.pollIntervalMs == 0 || config.pollIntervalMs > 100)
        throw std::invalid_argument("poll_interval_ms must be in [1, 100]");
    if (config.connectTimeoutMs == 0)
        throw std::invalid_argument("connect_timeout_ms must be positive");
    if (config.autoReconnect && config.maxReconnectAttempts < 1)
        throw std::invalid_argument("max_reconnect_attempts must be at least 1");
}

std::string buildSessionUrl(const std::string& baseUrl, const std::string& sessionId,
                            const std::string& token)
{
    std::string url = baseUrl;
    while (!url.empty() && url.back() == '/')
        url.pop_back();
    if (url.size() < 3 || url.compare(url.size() - 3, 3, "/ws") != 0)
        url += "/ws";
    url += "/sessions/" + sessionId;
    if (!token.empty())
        url += "?token=" + token;
    return url;
}
