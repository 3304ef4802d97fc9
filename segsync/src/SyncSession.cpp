#include "SyncSession.h"

#include <algorithm>
#include <exception>
#include <iostream>
#include <stdexcept>

#include "SyncErrors.h"

const char* connectionStateName(ConnectionState state)
{
    switch (state)
    {
    case ConnectionState::Disconnected: return "disconnected";
    case ConnectionState::Connecting:   return "connecting";
    case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

SyncSession::SyncSession(std::unique_ptr<Transport> transport, std::string participantId,
                         EngineConfig config)
    : config_(config),
      participantId_(std::move(participantId)),
      transport_(std::move(transport)),
      diffEngine_(config.fullResyncRatio),
      reconciler_(baseline_, applyingRemote_)
{
    if (!transport_)
        throw std::invalid_argument("SyncSession requires a transport");
    if (participantId_.empty())
        throw std::invalid_argument("SyncSession requires a participant id");
    validateEngineConfig(config_);

    coalescer_ = std::make_unique<ChangeCoalescer>(
        std::chrono::milliseconds(config_.debounceIntervalMs),
        [this] { sendUpdate(); });
}

SyncSession::~SyncSession()
{
    coalescer_->shutdown();
    disconnect();
}

// ---------------------------------------------------------------------------
// Volume
// ---------------------------------------------------------------------------

void SyncSession::setVolume(LabelVolume volume)
{
    if (!volume.isConsistent())
        throw std::invalid_argument("Label array does not match volume dimensions");
    std::lock_guard<std::mutex> lk(mutex_);
    volume_ = std::move(volume);
    baseline_.reset();
    unsentLocalChanges_ = false;
}

void SyncSession::clearVolume()
{
    coalescer_->cancelPending();
    std::lock_guard<std::mutex> lk(mutex_);
    volume_.reset();
    baseline_.reset();
    unsentLocalChanges_ = false;
}

bool SyncSession::hasVolume() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return volume_.has_value();
}

LabelVolume SyncSession::volumeSnapshot() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    if (!volume_)
        throw std::runtime_error("No volume selected");
    return volume_->snapshot();
}

void SyncSession::editVolume(const std::function<void(LabelVolume&)>& edit)
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!volume_)
            throw std::runtime_error("No volume selected");
        edit(*volume_);
    }
    notifyLocalMutation();
}

void SyncSession::notifyLocalMutation()
{
    if (applyingRemote_.load())
        return;
    coalescer_->notifyMutation();
}

// ---------------------------------------------------------------------------
// Connection lifecycle
// ---------------------------------------------------------------------------

std::string SyncSession::withToken(const std::string& endpoint, const std::string& credentials)
{
    if (credentials.empty() || endpoint.find("token=") != std::string::npos)
        return endpoint;
    char sep = endpoint.find('?') == std::string::npos ? '?' : '&';
    return endpoint + sep + "token=" + credentials;
}

bool SyncSession::connect(const std::string& endpoint, const std::string& credentials)
{
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (state_ != ConnectionState::Disconnected)
        {
            std::cerr << "[sync] connect ignored: already "
                      << connectionStateName(state_) << "\n";
            return state_ == ConnectionState::Connected;
        }
        url_ = withToken(endpoint, credentials);
        userDisconnect_ = false;
        reconnectPending_ = false;
        reconnectAttempts_ = 0;
        connectStarted_ = Clock::now();
    }

    // A new channel always re-bootstraps from a full snapshot.
    resetSyncState();
    setState(ConnectionState::Connecting);

    try
    {
        std::lock_guard<std::mutex> lk(transportMutex_);
        transport_->open(url_);
    }
    catch (const TransportError& e)
    {
        std::cerr << "[sync] connect failed: " << e.what() << "\n";
        setState(ConnectionState::Disconnected);
        if (errorHandler_)
            errorHandler_(e.what());
        return false;
    }

    startWorker();
    pollOnce();

    {
        std::unique_lock<std::mutex> lk(stateMutex_);
        stateCv_.wait_for(lk, std::chrono::milliseconds(config_.connectTimeoutMs),
                          [this] { return state_ != ConnectionState::Connecting; });
        if (state_ == ConnectionState::Connected)
            return true;
        // Reconnection only follows a connection that was established.
        reconnectPending_ = false;
    }

    // Still connecting (timed out) or failed during the handshake.
    handleTransportLost("connect to " + endpoint + " did not complete", false);
    return false;
}

void SyncSession::disconnect()
{
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        userDisconnect_ = true;
        reconnectPending_ = false;
    }
    stopWorker();
    coalescer_->cancelPending();
    {
        std::lock_guard<std::mutex> lk(transportMutex_);
        transport_->close();
    }
    resetSyncState();
    setState(ConnectionState::Disconnected);
}

ConnectionState SyncSession::state() const
{
    std::lock_guard<std::mutex> lk(stateMutex_);
    return state_;
}

void SyncSession::setState(ConnectionState state)
{
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (state_ == state)
            return;
        state_ = state;
    }
    stateCv_.notify_all();
    std::cout << "[sync] " << participantId_ << ": " << connectionStateName(state) << "\n";
    if (statusHandler_)
        statusHandler_(state);
}

void SyncSession::resetSyncState()
{
    std::lock_guard<std::mutex> lk(mutex_);
    sentCount_ = 0;
    receivedCount_ = 0;
    connectedUsers_ = 0;
    baseline_.reset();
    lastSentKind_ = DiffKind::NoChange;
}

void SyncSession::handleTransportOpen()
{
    std::string frame = encodeMessage(SyncMessage::join(participantId_, currentTimestampMs()));
    if (!sendFrame(frame))
    {
        handleTransportLost("join handshake could not be sent", true);
        return;
    }

    nextPing_ = Clock::now() + std::chrono::milliseconds(config_.keepaliveIntervalMs);
    lastInbound_ = Clock::now();
    silenceReported_ = false;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        reconnectAttempts_ = 0;
        reconnectPending_ = false;
    }
    setState(ConnectionState::Connected);

    // Edits made while offline were never sent; push them with the
    // bootstrap snapshot.
    bool resend = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        resend = unsentLocalChanges_;
        unsentLocalChanges_ = false;
    }
    if (resend)
        coalescer_->notifyMutation();
}

void SyncSession::handleTransportLost(const std::string& reason, bool allowReconnect)
{
    bool retry = false;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (state_ == ConnectionState::Disconnected)
            return;
        retry = allowReconnect && config_.autoReconnect && !userDisconnect_;
        if (retry && reconnectAttempts_ >= config_.maxReconnectAttempts)
        {
            std::cerr << "[sync] giving up after " << reconnectAttempts_
                      << " reconnect attempts\n";
            retry = false;
        }
        reconnectPending_ = retry;
        if (retry)
            nextReconnect_ = Clock::now() + std::chrono::milliseconds(config_.reconnectDelayMs);
    }

    std::cerr << "[sync] connection lost: " << reason << "\n";
    coalescer_->cancelPending();
    {
        std::lock_guard<std::mutex> lk(transportMutex_);
        transport_->close();
    }
    resetSyncState();
    setState(ConnectionState::Disconnected);
    if (errorHandler_)
        errorHandler_(reason);
}

void SyncSession::attemptReconnect()
{
    std::string url;
    {
        std::lock_guard<std::mutex> lk(stateMutex_);
        if (!reconnectPending_ || userDisconnect_ || Clock::now() < nextReconnect_)
            return;
        reconnectPending_ = false;
        ++reconnectAttempts_;
        connectStarted_ = Clock::now();
        url = url_;
        std::cout << "[sync] reconnect attempt " << reconnectAttempts_ << "/"
                  << config_.maxReconnectAttempts << "\n";
    }

    resetSyncState();
    setState(ConnectionState::Connecting);
    try
    {
        std::lock_guard<std::mutex> lk(transportMutex_);
        transport_->open(url);
    }
    catch (const TransportError& e)
    {
        handleTransportLost(e.what(), true);
    }
}

// ---------------------------------------------------------------------------
// Poll worker
// ---------------------------------------------------------------------------

void SyncSession::startWorker()
{
    std::lock_guard<std::mutex> lk(workerMutex_);
    if (worker_.joinable())
        return;
    workerExit_ = false;
    worker_ = std::thread(&SyncSession::workerLoop, this);
}

void SyncSession::stopWorker()
{
    {
        std::lock_guard<std::mutex> lk(workerMutex_);
        workerExit_ = true;
    }
    workerCv_.notify_one();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

void SyncSession::workerLoop()
{
    const auto interval = std::chrono::milliseconds(config_.pollIntervalMs);
    std::unique_lock<std::mutex> lk(workerMutex_);
    while (!workerExit_)
    {
        lk.unlock();
        try
        {
            pollOnce();
        }
        catch (const std::exception& e)
        {
            std::cerr << "[sync] poll failed: " << e.what() << "\n";
        }
        lk.lock();
        workerCv_.wait_for(lk, interval, [this] { return workerExit_; });
    }
}

void SyncSession::pollOnce()
{
    std::lock_guard<std::mutex> pollLock(pollMutex_);
    const auto now = Clock::now();
    const TransportState ts = transport_->state();

    ConnectionState cs = state();
    if (cs == ConnectionState::Connecting)
    {
        Clock::time_point started;
        {
            std::lock_guard<std::mutex> lk(stateMutex_);
            started = connectStarted_;
        }
        if (ts == TransportState::Open)
            handleTransportOpen();
        else if (ts == TransportState::Failed || ts == TransportState::Closed)
            handleTransportLost(transport_->lastError().empty() ? "could not open channel"
                                                                 : transport_->lastError(),
                                true);
        else if (now - started > std::chrono::milliseconds(config_.connectTimeoutMs))
            handleTransportLost("connect timed out", true);
        cs = state();
    }

    if (cs == ConnectionState::Connected)
    {
        if (ts == TransportState::Failed || ts == TransportState::Closed)
        {
            handleTransportLost(transport_->lastError().empty() ? "channel closed"
                                                                 : transport_->lastError(),
                                true);
            return;
        }

        while (state() == ConnectionState::Connected)
        {
            std::optional<std::string> frame = transport_->receive();
            if (!frame)
                break;
            lastInbound_ = Clock::now();
            silenceReported_ = false;
            handleMessage(*frame);
        }

        if (state() != ConnectionState::Connected)
            return;

        if (now >= nextPing_)
        {
            sendPing();
            nextPing_ = now + std::chrono::milliseconds(config_.keepaliveIntervalMs);
        }

        // No traffic for several keepalive periods is only reported; the
        // transport's own close/error event decides when the link is gone.
        auto silence = now - lastInbound_;
        if (!silenceReported_ &&
            silence > 3 * std::chrono::milliseconds(config_.keepaliveIntervalMs))
        {
            std::cerr << "[sync] no inbound traffic for "
                      << std::chrono::duration_cast<std::chrono::seconds>(silence).count()
                      << " s\n";
            silenceReported_ = true;
        }
        return;
    }

    if (cs == ConnectionState::Disconnected)
        attemptReconnect();
}

bool SyncSession::sendFrame(const std::string& frame)
{
    std::lock_guard<std::mutex> lk(transportMutex_);
    return transport_->send(frame);
}

void SyncSession::sendPing()
{
    std::string frame = encodeMessage(SyncMessage::ping(currentTimestampMs()));
    if (!sendFrame(frame))
        std::cerr << "[sync] keepalive send failed\n";
}

// ---------------------------------------------------------------------------
// Outgoing
// ---------------------------------------------------------------------------

bool SyncSession::sendUpdate()
{
    // Called from inside a remote apply (or racing one on another thread):
    // retry after the window instead of diffing a buffer mid-mutation.
    if (applyingRemote_.load())
    {
        coalescer_->notifyMutation();
        return false;
    }

    if (state() != ConnectionState::Connected)
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (volume_)
            unsentLocalChanges_ = true;
        return false;
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (!volume_)
        return false;

    const int64_t now = currentTimestampMs();
    DiffResult diff = diffEngine_.computeDelta(baseline_, *volume_, now);
    if (diff.kind == DiffKind::NoChange)
        return false;

    std::string frame;
    if (diff.kind == DiffKind::Delta)
    {
        try
        {
            frame = encodeMessage(SyncMessage::fromDelta(participantId_, std::move(diff.delta)));
        }
        catch (const CodecError& e)
        {
            // Grids too large for uint16 indices travel as full snapshots.
            std::cerr << "[sync] delta not encodable (" << e.what()
                      << "), sending full snapshot\n";
            diff.kind = DiffKind::FullRequired;
        }
    }
    if (diff.kind == DiffKind::FullRequired)
    {
        try
        {
            frame = encodeMessage(SyncMessage::fromSnapshot(
                participantId_, FullSnapshot::fromVolume(*volume_, now)));
        }
        catch (const CodecError& e)
        {
            std::cerr << "[sync] snapshot not encodable: " << e.what() << "\n";
            return false;
        }
    }

    if (!sendFrame(frame))
    {
        std::cerr << "[sync] send failed, changes kept for the next attempt\n";
        unsentLocalChanges_ = true;
        return false;
    }

    ++sentCount_;
    baseline_ = volume_->snapshot();
    lastSentKind_ = diff.kind;
    unsentLocalChanges_ = false;

    if (diff.kind == DiffKind::Delta)
        std::cout << "[sync] sent delta #" << sentCount_ << " (" << diff.changedCount
                  << " voxels, " << frame.size() << " bytes)\n";
    else
        std::cout << "[sync] sent full snapshot #" << sentCount_ << " ("
                  << frame.size() << " bytes)\n";
    return true;
}

bool SyncSession::flushPendingChanges()
{
    return coalescer_->flushNow();
}

// ---------------------------------------------------------------------------
// Incoming
// ---------------------------------------------------------------------------

void SyncSession::handleMessage(const std::string& text)
{
    SyncMessage message;
    try
    {
        message = decodeMessage(text);
    }
    catch (const ProtocolError& e)
    {
        std::cerr << "[sync] dropped message: " << e.what() << "\n";
        return;
    }
    catch (const CodecError& e)
    {
        std::cerr << "[sync] dropped corrupt payload: " << e.what() << "\n";
        return;
    }
    dispatch(message);
}

void SyncSession::dispatch(const SyncMessage& message)
{
    switch (message.type)
    {
    case MessageType::Delta:
    case MessageType::FullSnapshot:
        applyRemote(message);
        break;

    case MessageType::UserJoined:
    {
        std::lock_guard<std::mutex> lk(mutex_);
        connectedUsers_ = message.totalUsers ? *message.totalUsers : connectedUsers_ + 1;
        std::cout << "[sync] user joined: " << message.userId << " (" << connectedUsers_
                  << " connected)\n";
        break;
    }
    case MessageType::UserLeft:
    {
        std::lock_guard<std::mutex> lk(mutex_);
        connectedUsers_ = message.totalUsers ? *message.totalUsers
                                             : std::max(0, connectedUsers_ - 1);
        std::cout << "[sync] user left: " << message.userId << " (" << connectedUsers_
                  << " connected)\n";
        break;
    }
    case MessageType::UserList:
    {
        std::lock_guard<std::mutex> lk(mutex_);
        connectedUsers_ = static_cast<int>(message.users.size());
        break;
    }
    case MessageType::Error:
        std::cerr << "[sync] relay error: " << message.errorMessage << "\n";
        if (errorHandler_)
            errorHandler_(message.errorMessage);
        break;

    case MessageType::SessionEnded:
        handleTransportLost("session ended by relay", false);
        break;

    case MessageType::Join:
    case MessageType::Ping:
        break;

    case MessageType::Unknown:
        std::cerr << "[sync] ignoring unknown message type '" << message.rawType << "'\n";
        break;
    }
}

void SyncSession::applyRemote(const SyncMessage& message)
{
    if (message.userId == participantId_)
        return;  // our own update reflected back by the relay

    ApplyReport report;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!volume_)
        {
            std::cerr << "[sync] no volume selected, dropping update from "
                      << message.userId << "\n";
            return;
        }
        try
        {
            if (message.delta)
                report = reconciler_.applyDelta(*volume_, *message.delta);
            else if (message.snapshot)
                report = reconciler_.applyFull(*volume_, *message.snapshot);
            else
                return;
        }
        catch (const ApplyError& e)
        {
            std::cerr << "[sync] could not apply update from " << message.userId << ": "
                      << e.what() << "\n";
            return;
        }
        ++receivedCount_;
    }

    std::cout << "[sync] applied " << messageTypeName(message.type) << " from "
              << message.userId << " (" << report.applied << " voxels";
    if (report.skipped > 0)
        std::cout << ", " << report.skipped << " out of range";
    if (report.rescaled)
        std::cout << ", rescaled";
    std::cout << ")\n";

    if (remoteUpdateHandler_)
        remoteUpdateHandler_(message.userId, report);
}

// ---------------------------------------------------------------------------
// Handlers / statistics
// ---------------------------------------------------------------------------

void SyncSession::setStatusHandler(StatusHandler handler)
{
    statusHandler_ = std::move(handler);
}

void SyncSession::setErrorHandler(ErrorHandler handler)
{
    errorHandler_ = std::move(handler);
}

void SyncSession::setRemoteUpdateHandler(RemoteUpdateHandler handler)
{
    remoteUpdateHandler_ = std::move(handler);
}

uint64_t SyncSession::sentCount() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return sentCount_;
}

uint64_t SyncSession::receivedCount() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return receivedCount_;
}

int SyncSession::connectedUsers() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return connectedUsers_;
}

bool SyncSession::hasBaseline() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return baseline_.has_value();
}

DiffKind SyncSession::lastSentKind() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return lastSentKind_;
}
