#include "Transport.h"
#include <stdexcept>
#include <algorithm>
#include <cctype>

#include "LoopbackTransport.h"
#ifdef HAS_IXWEBSOCKET
#include "IxWebSocketTransport.h"
#endif

std::unique_ptr<Transport> Transport::create(TransportType type)
{
    switch (type)
    {
    case TransportType::Loopback:
        // A hub of its own: frames go nowhere until other peers are
        // created from the same hub.  Useful for offline editing.
        return LoopbackHub::create()->createTransport();
#ifdef HAS_IXWEBSOCKET
    case TransportType::WebSocket:
        return std::make_unique<IxWebSocketTransport>();
#endif
    default:
        throw std::runtime_error(
            std::string("Transport not available: ") + transportName(type));
    }
}

std::vector<TransportType> Transport::availableTransports()
{
    std::vector<TransportType> result;
#ifdef HAS_IXWEBSOCKET
    result.push_back(TransportType::WebSocket);
#endif
    result.push_back(TransportType::Loopback);
    return result;
}

const char* Transport::transportName(TransportType type)
{
    switch (type)
    {
    case TransportType::Loopback:  return "loopback";
    case TransportType::WebSocket: return "websocket";
    }
    return "unknown";
}

std::optional<TransportType> Transport::parseTransportName(const std::string& name)
{
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return std::tolower(c); });

    if (lower == "loopback" || lower == "local")  return TransportType::Loopback;
    if (lower == "websocket" || lower == "ws")    return TransportType::WebSocket;
    return std::nullopt;
}

const char* transportStateName(TransportState state)
{
    switch (state)
    {
    case TransportState::Closed:     return "closed";
    case TransportState::Connecting: return "connecting";
    case TransportState::Open:       return "open";
    case TransportState::Failed:     return "failed";
    }
    return "unknown";
}
