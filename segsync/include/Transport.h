#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

enum class TransportType
{
    Loopback,    // in-process relay (tests, demos)
    WebSocket    // ixwebsocket client
};

enum class TransportState
{
    Closed,      // never opened, or closed by us
    Connecting,  // open() issued, waiting for the channel
    Open,        // frames may be sent and received
    Failed       // channel dropped or could not be opened; see lastError()
};

/// Abstract duplex, message-framed text channel.
///
/// The engine only assumes ordered text frames.  Implementations deliver
/// inbound frames into a queue drained by receive(); connection events are
/// observed through state() by the session's poll loop, so no callbacks
/// cross into the engine from the transport's own thread.
class Transport
{
public:
    virtual ~Transport() = default;

    // --- Lifecycle ---

    /// Start opening a channel to @p url.  May return before the channel is
    /// open; poll state() for the Open/Failed transition.
    /// @throws TransportError if the request cannot even be issued.
    virtual void open(const std::string& url) = 0;

    /// Close the channel and drop queued inbound frames.  Idempotent.
    virtual void close() = 0;

    virtual TransportState state() const = 0;

    /// Description of the last failure (empty if none).
    virtual std::string lastError() const = 0;

    // --- Frames ---

    /// Queue one text frame for sending.
    /// @return false if the channel is not open or the send failed.
    virtual bool send(const std::string& text) = 0;

    /// Next inbound frame, or nullopt if none is waiting.  Non-blocking.
    virtual std::optional<std::string> receive() = 0;

    // --- Factory ---

    /// Create a transport of the given type.
    /// @throws std::runtime_error if the type was not compiled in.
    static std::unique_ptr<Transport> create(TransportType type);

    static std::vector<TransportType> availableTransports();
    static const char* transportName(TransportType type);
    static std::optional<TransportType> parseTransportName(const std::string& name);
};

const char* transportStateName(TransportState state);
