#pragma once

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "Transport.h"

class LoopbackTransport;

/// In-process relay standing in for the collaboration server.  Every frame
/// sent by one attached transport is delivered to every other open one
/// (and back to the sender when reflection is enabled).  All frames that
/// pass through the hub are recorded for inspection.
///
/// Thread safety: all public methods are mutex-protected.
class LoopbackHub : public std::enable_shared_from_this<LoopbackHub>
{
public:
    static std::shared_ptr<LoopbackHub> create();

    /// New transport attached to this hub (initially Closed).
    std::unique_ptr<LoopbackTransport> createTransport();

    /// Also deliver each frame back to the transport that sent it.
    void setReflectToSender(bool reflect);

    /// Make subsequent open() calls fail with @p reason (empty = accept).
    void setRefuseConnections(const std::string& reason);

    /// Deliver a relay-originated frame (e.g. user_joined) to every open peer.
    void broadcast(const std::string& text);

    /// Put every open peer into the Failed state, as a network outage would.
    void dropAll(const std::string& reason);

    size_t openPeers() const;

    /// Frames sent by peers (not broadcast()) in relay order.
    std::vector<std::string> relayedFrames() const;
    void clearRelayedFrames();

private:
    friend class LoopbackTransport;

    LoopbackHub() = default;

    void attach(LoopbackTransport* peer);
    void detach(LoopbackTransport* peer);
    bool admit(std::string& reason) const;
    void relay(LoopbackTransport* from, const std::string& text);

    mutable std::mutex mutex_;
    std::vector<LoopbackTransport*> peers_;
    std::vector<std::string> frames_;
    std::string refuseReason_;
    bool reflect_ = false;
};

/// Transport endpoint attached to a LoopbackHub.  The URL passed to open()
/// is recorded but otherwise ignored.
class LoopbackTransport : public Transport
{
public:
    explicit LoopbackTransport(std::shared_ptr<LoopbackHub> hub);
    ~LoopbackTransport() override;

    LoopbackTransport(const LoopbackTransport&) = delete;
    LoopbackTransport& operator=(const LoopbackTransport&) = delete;

    void open(const std::string& url) override;
    void close() override;
    TransportState state() const override;
    std::string lastError() const override;
    bool send(const std::string& text) override;
    std::optional<std::string> receive() override;

    const std::string& url() const { return url_; }
    size_t openCount() const { return openCount_; }

private:
    friend class LoopbackHub;

    void deliver(const std::string& text);
    void fail(const std::string& reason);
    bool isOpen() const;

    std::shared_ptr<LoopbackHub> hub_;
    mutable std::mutex mutex_;
    std::deque<std::string> inbox_;
    TransportState state_ = TransportState::Closed;
    std::string lastError_;
    std::string url_;
    size_t openCount_ = 0;
};
