#include <charconv>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "LabelVolume.h"
#include "SyncConfig.h"
#include "SyncSession.h"
#include "Transport.h"

namespace {

// Parse "ZxYxX" (e.g. "64x128x128") into voxel dimensions.
bool parseDims(std::string_view text, glm::ivec3& dims)
{
    for (int axis = 0; axis < 3; ++axis)
    {
        size_t end = axis < 2 ? text.find('x') : text.size();
        if (end == std::string_view::npos)
            return false;
        std::string_view part = text.substr(0, end);
        int value = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), value);
        if (ec != std::errc() || ptr != part.data() + part.size() || value <= 0)
            return false;
        dims[axis] = value;
        text.remove_prefix(axis < 2 ? end + 1 : end);
    }
    return true;
}

void printUsage()
{
    std::cerr << "Usage: segsync_peer [options]\n"
              << "\nOptions:\n"
              << "  -c, --config <path>       Load config from <path>\n"
              << "  -h, --help                Show this help message\n"
              << "      --url <ws://host>     Relay base URL\n"
              << "      --session <id>        Session to join\n"
              << "      --token <token>       Access token for the session\n"
              << "      --user <id>           Participant id on the wire\n"
              << "      --dims <ZxYxX>        Label volume dimensions (default 64x64x64)\n"
              << "      --debounce-ms <ms>    Quiet window before edits are sent\n"
              << "      --transport <name>    websocket or loopback\n"
              << "\nCommands on stdin:\n"
              << "  set <z> <y> <x> <label>\n"
              << "  box <z0> <y0> <x0> <z1> <y1> <x1> <label>\n"
              << "  name <label> <text>\n"
              << "  send | status | quit\n";
}

void printStatus(const SyncSession& session)
{
    LabelVolume vol = session.volumeSnapshot();
    std::cout << "state: " << connectionStateName(session.state())
              << "  users: " << session.connectedUsers()
              << "  sent: " << session.sentCount()
              << "  received: " << session.receivedCount()
              << "  labelled voxels: " << vol.labeledCount() << "/" << vol.voxelCount()
              << (session.changesPending() ? "  (changes pending)" : "") << "\n";
    for (const auto& [label, name] : vol.segmentNames)
        std::cout << "  " << label << ": " << name << "\n";
}

// Execute one stdin command.  Returns false on "quit".
bool runCommand(SyncSession& session, const std::string& line)
{
    std::istringstream in(line);
    std::string cmd;
    if (!(in >> cmd))
        return true;

    if (cmd == "quit" || cmd == "exit")
        return false;

    if (cmd == "set")
    {
        int z, y, x;
        uint32_t label;
        if (!(in >> z >> y >> x >> label))
        {
            std::cerr << "usage: set <z> <y> <x> <label>\n";
            return true;
        }
        session.editVolume([&](LabelVolume& vol) { vol.setLabelAt(z, y, x, label); });
    }
    else if (cmd == "box")
    {
        glm::ivec3 a, b;
        uint32_t label;
        if (!(in >> a[0] >> a[1] >> a[2] >> b[0] >> b[1] >> b[2] >> label))
        {
            std::cerr << "usage: box <z0> <y0> <x0> <z1> <y1> <x1> <label>\n";
            return true;
        }
        session.editVolume([&](LabelVolume& vol) {
            glm::ivec3 lo = glm::max(glm::min(a, b), glm::ivec3(0));
            glm::ivec3 hi = glm::min(glm::max(a, b), vol.dimensions - 1);
            for (int z = lo[0]; z <= hi[0]; ++z)
                for (int y = lo[1]; y <= hi[1]; ++y)
                    for (int x = lo[2]; x <= hi[2]; ++x)
                        vol.setLabelAt(z, y, x, label);
        });
    }
    else if (cmd == "name")
    {
        uint32_t label;
        std::string text;
        if (!(in >> label) || !std::getline(in >> std::ws, text) || text.empty())
        {
            std::cerr << "usage: name <label> <text>\n";
            return true;
        }
        session.editVolume([&](LabelVolume& vol) { vol.segmentNames[label] = text; });
    }
    else if (cmd == "send")
    {
        if (!session.flushPendingChanges() && !session.sendUpdate())
            std::cout << "nothing to send\n";
    }
    else if (cmd == "status")
    {
        printStatus(session);
    }
    else
    {
        std::cerr << "Unknown command: " << cmd << "\n";
    }
    return true;
}

} // namespace

int main(int argc, char** argv)
{
    try
    {

    std::string cliConfigPath;
    SyncConfig cliCfg;
    std::string token;
    std::string transportName = "websocket";
    glm::ivec3 dims(64, 64, 64);

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        bool hasValue = i + 1 < argc;

        if ((arg == "--config" || arg == "-c") && hasValue)
            cliConfigPath = argv[++i];
        else if (arg == "--help" || arg == "-h")
        {
            printUsage();
            return 0;
        }
        else if (arg == "--url" && hasValue)
            cliCfg.peer.endpoint = argv[++i];
        else if (arg == "--session" && hasValue)
            cliCfg.peer.sessionId = argv[++i];
        else if (arg == "--token" && hasValue)
            token = argv[++i];
        else if (arg == "--user" && hasValue)
            cliCfg.peer.participantId = argv[++i];
        else if (arg == "--transport" && hasValue)
            transportName = argv[++i];
        else if (arg == "--dims" && hasValue)
        {
            if (!parseDims(argv[++i], dims))
            {
                std::cerr << "Invalid dimensions: " << argv[i] << " (expected ZxYxX)\n";
                return 1;
            }
        }
        else if (arg == "--debounce-ms" && hasValue)
        {
            std::string_view v = argv[++i];
            uint64_t ms = 0;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), ms);
            if (ec != std::errc() || ptr != v.data() + v.size() || ms == 0)
            {
                std::cerr << "Invalid debounce interval: " << v << "\n";
                return 1;
            }
            cliCfg.engine.debounceIntervalMs = ms;
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    // --- Load and merge configs: global < local < command line ---
    SyncConfig globalCfg;
    try { globalCfg = loadConfig(globalConfigPath()); }
    catch (const std::exception& e)
    {
        std::cerr << "Warning: " << e.what() << "\n";
    }

    std::string localConfigPath = cliConfigPath;
    if (localConfigPath.empty() && std::filesystem::exists("config.json"))
        localConfigPath = "config.json";

    SyncConfig localCfg;
    if (!localConfigPath.empty())
    {
        try { localCfg = loadConfig(localConfigPath); }
        catch (const std::exception& e)
        {
            std::cerr << "Warning: " << e.what() << "\n";
        }
    }

    SyncConfig cfg = mergeConfigs(mergeConfigs(globalCfg, localCfg), cliCfg);

    if (cfg.peer.endpoint.empty() || cfg.peer.sessionId.empty() ||
        cfg.peer.participantId.empty())
    {
        std::cerr << "A relay URL, session id and participant id are required "
                     "(--url, --session, --user or the peer section of the config)\n";
        return 1;
    }

    auto type = Transport::parseTransportName(transportName);
    if (!type)
    {
        std::cerr << "Unknown transport: " << transportName << "\nAvailable transports:";
        for (TransportType t : Transport::availableTransports())
            std::cerr << " " << Transport::transportName(t);
        std::cerr << "\n";
        return 1;
    }

    SyncSession session(Transport::create(*type), cfg.peer.participantId, cfg.engine);
    session.setVolume(LabelVolume(dims));
    session.setErrorHandler([](const std::string& message) {
        std::cerr << "Error: " << message << "\n";
    });
    session.setRemoteUpdateHandler([](const std::string& userId, const ApplyReport& report) {
        std::cout << userId << " updated " << report.applied << " voxels\n";
    });

    std::string url = buildSessionUrl(cfg.peer.endpoint, cfg.peer.sessionId, token);
    std::cout << "Connecting to " << cfg.peer.endpoint << " session " << cfg.peer.sessionId
              << " as " << cfg.peer.participantId << "\n";
    if (!session.connect(url))
    {
        std::cerr << "Could not connect to " << cfg.peer.endpoint << "\n";
        return 1;
    }

    std::string line;
    while (std::getline(std::cin, line))
    {
        try
        {
            if (!runCommand(session, line))
                break;
        }
        catch (const std::exception& e)
        {
            std::cerr << "Error: " << e.what() << "\n";
        }
    }

    session.flushPendingChanges();
    session.disconnect();
    return 0;

    }
    catch (const std::exception& e)
    {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }
}
