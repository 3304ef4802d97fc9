#include "LoopbackTransport.h"

#include <algorithm>

// --- LoopbackHub ---

std::shared_ptr<LoopbackHub> LoopbackHub::create()
{
    return std::shared_ptr<LoopbackHub>(new LoopbackHub());
}

std::unique_ptr<LoopbackTransport> LoopbackHub::createTransport()
{
    return std::make_unique<LoopbackTransport>(shared_from_this());
}

void LoopbackHub::setReflectToSender(bool reflect)
{
    std::lock_guard<std::mutex> lk(mutex_);
    reflect_ = reflect;
}

void LoopbackHub::setRefuseConnections(const std::string& reason)
{
    std::lock_guard<std::mutex> lk(mutex_);
    refuseReason_ = reason;
}

void LoopbackHub::broadcast(const std::string& text)
{
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto* peer : peers_)
        peer->deliver(text);
}

void LoopbackHub::dropAll(const std::string& reason)
{
    std::lock_guard<std::mutex> lk(mutex_);
    for (auto* peer : peers_)
        peer->fail(reason);
    peers_.clear();
}

size_t LoopbackHub::openPeers() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return peers_.size();
}

std::vector<std::string> LoopbackHub::relayedFrames() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return frames_;
}

void LoopbackHub::clearRelayedFrames()
{
    std::lock_guard<std::mutex> lk(mutex_);
    frames_.clear();
}

void LoopbackHub::attach(LoopbackTransport* peer)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (std::find(peers_.begin(), peers_.end(), peer) == peers_.end())
        peers_.push_back(peer);
}

void LoopbackHub::detach(LoopbackTransport* peer)
{
    std::lock_guard<std::mutex> lk(mutex_);
    peers_.erase(std::remove(peers_.begin(), peers_.end(), peer), peers_.end());
}

bool LoopbackHub::admit(std::string& reason) const
{
    std::lock_guard<std::mutex> lk(mutex_);
    reason = refuseReason_;
    return refuseReason_.empty();
}

void LoopbackHub::relay(LoopbackTransport* from, const std::string& text)
{
    std::lock_guard<std::mutex> lk(mutex_);
    frames_.push_back(text);
    for (auto* peer : peers_)
    {
        if (peer != from || reflect_)
            peer->deliver(text);
    }
}

// --- LoopbackTransport ---

LoopbackTransport::LoopbackTransport(std::shared_ptr<LoopbackHub> hub)
    : hub_(std::move(hub))
{}

LoopbackTransport::~LoopbackTransport()
{
    hub_->detach(this);
}

void LoopbackTransport::open(const std::string& url)
{
    std::string reason;
    bool admitted = hub_->admit(reason);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        url_ = url;
        inbox_.clear();
        if (!admitted)
        {
            state_ = TransportState::Failed;
            lastError_ = reason;
            return;
        }
        state_ = TransportState::Open;
        lastError_.clear();
        ++openCount_;
    }
    hub_->attach(this);
}

void LoopbackTransport::close()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (state_ == TransportState::Closed)
            return;
        state_ = TransportState::Closed;
        inbox_.clear();
    }
    hub_->detach(this);
}

TransportState LoopbackTransport::state() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

std::string LoopbackTransport::lastError() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return lastError_;
}

bool LoopbackTransport::isOpen() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return state_ == TransportState::Open;
}

bool LoopbackTransport::send(const std::string& text)
{
    if (!isOpen())
        return false;
    hub_->relay(this, text);
    return true;
}

std::optional<std::string> LoopbackTransport::receive()
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (inbox_.empty())
        return std::nullopt;
    std::string front = std::move(inbox_.front());
    inbox_.pop_front();
    return front;
}

void LoopbackTransport::deliver(const std::string& text)
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == TransportState::Open)
        inbox_.push_back(text);
}

void LoopbackTransport::fail(const std::string& reason)
{
    std::lock_guard<std::mutex> lk(mutex_);
    state_ = TransportState::Failed;
    lastError_ = reason;
    inbox_.clear();
}
