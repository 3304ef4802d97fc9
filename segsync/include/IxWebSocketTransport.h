#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "Transport.h"

namespace ix { class WebSocket; }

/// WebSocket client transport on top of ixwebsocket.
///
/// ixwebsocket runs its own network thread; its message callback only
/// queues frames and records state changes, which the session picks up on
/// its next poll.  ixwebsocket's built-in reconnection is disabled because
/// the session owns reconnection and must re-bootstrap on every new channel.
class IxWebSocketTransport : public Transport
{
public:
    IxWebSocketTransport();
    ~IxWebSocketTransport() override;

    IxWebSocketTransport(const IxWebSocketTransport&) = delete;
    IxWebSocketTransport& operator=(const IxWebSocketTransport&) = delete;

    void open(const std::string& url) override;
    void close() override;
    TransportState state() const override;
    std::string lastError() const override;
    bool send(const std::string& text) override;
    std::optional<std::string> receive() override;

private:
    void setState(TransportState state, const std::string& error = {});

    /// Guards ws_ itself: send() may run on another thread than open()/close().
    /// Never held by the network callback, so ws_->stop() cannot deadlock.
    std::mutex wsMutex_;
    std::unique_ptr<ix::WebSocket> ws_;
    mutable std::mutex mutex_;
    std::deque<std::string> inbox_;
    TransportState state_ = TransportState::Closed;
    std::string lastError_;
};
