#include "IxWebSocketTransport.h"

#include <iostream>

#include <ixwebsocket/IXNetSystem.h>
#include <ixwebsocket/IXWebSocket.h>

#include "SyncErrors.h"

IxWebSocketTransport::IxWebSocketTransport()
{
    ix::initNetSystem();
}

IxWebSocketTransport::~IxWebSocketTransport()
{
    close();
    ix::uninitNetSystem();
}

void IxWebSocketTransport::setState(TransportState state, const std::string& error)
{
    std::lock_guard<std::mutex> lk(mutex_);
    // A close we asked for must not be turned back into Failed by a late
    // error callback from the network thread.
    if (state_ == TransportState::Closed && state != TransportState::Connecting)
        return;
    state_ = state;
    if (!error.empty())
        lastError_ = error;
}

void IxWebSocketTransport::open(const std::string& url)
{
    if (url.empty())
        throw TransportError("Empty WebSocket URL");

    close();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        inbox_.clear();
        lastError_.clear();
        state_ = TransportState::Connecting;
    }

    std::lock_guard<std::mutex> wsLock(wsMutex_);
    ws_ = std::make_unique<ix::WebSocket>();
    ws_->setUrl(url);
    ws_->disableAutomaticReconnection();
    ws_->setOnMessageCallback([this](const ix::WebSocketMessagePtr& msg) {
        switch (msg->type)
        {
        case ix::WebSocketMessageType::Open:
            setState(TransportState::Open);
            break;
        case ix::WebSocketMessageType::Message:
            if (!msg->binary)
            {
                std::lock_guard<std::mutex> lk(mutex_);
                if (state_ == TransportState::Open)
                    inbox_.push_back(msg->str);
            }
            break;
        case ix::WebSocketMessageType::Error:
            setState(TransportState::Failed, msg->errorInfo.reason);
            break;
        case ix::WebSocketMessageType::Close:
            setState(TransportState::Failed,
                     "closed by peer (" + std::to_string(msg->closeInfo.code) + " " +
                         msg->closeInfo.reason + ")");
            break;
        default:
            break;
        }
    });
    ws_->start();
}

void IxWebSocketTransport::close()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        state_ = TransportState::Closed;
        inbox_.clear();
    }
    std::lock_guard<std::mutex> wsLock(wsMutex_);
    if (ws_)
    {
        ws_->stop();
        ws_.reset();
    }
}

TransportState IxWebSocketTransport::state() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

std::string IxWebSocketTransport::lastError() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return lastError_;
}

bool IxWebSocketTransport::send(const std::string& text)
{
    std::lock_guard<std::mutex> wsLock(wsMutex_);
    if (!ws_ || state() != TransportState::Open)
        return false;
    ix::WebSocketSendInfo info = ws_->sendText(text);
    if (!info.success)
    {
        std::cerr << "[transport] send failed (" << text.size() << " bytes)\n";
        return false;
    }
    return true;
}

std::optional<std::string> IxWebSocketTransport::receive()
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (inbox_.empty())
        return std::nullopt;
    std::string front = std::move(inbox_.front());
    inbox_.pop_front();
    return front;
}
