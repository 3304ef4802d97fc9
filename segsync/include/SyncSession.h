#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "ChangeCoalescer.h"
#include "DiffEngine.h"
#include "LabelVolume.h"
#include "Reconciler.h"
#include "SyncConfig.h"
#include "SyncMessage.h"
#include "Transport.h"

enum class ConnectionState
{
    Disconnected,
    Connecting,
    Connected
};

const char* connectionStateName(ConnectionState state);

/// One participant's view of a shared label volume.
///
/// Owns the volume being edited, the diffing baseline, the transport and
/// the timers.  Outgoing path: local edit -> ChangeCoalescer -> DiffEngine
/// -> Codec -> Delta/FullSnapshot frame -> transport.  Incoming path: poll
/// loop -> decodeMessage -> echo suppression -> Reconciler.
///
/// Threads: the caller's thread (edits, connect/disconnect), the poll
/// worker (inbound frames, keepalive, reconnection) and the coalescer's
/// timer thread (debounced sends).  Volume, baseline and counters are
/// guarded by one mutex; the applying-remote flag stops edit notifications
/// raised during a remote apply from turning into outgoing diffs.
///
/// Handlers set with setStatusHandler() etc. must be installed before
/// connect() and must not call disconnect().
class SyncSession
{
public:
    using StatusHandler = std::function<void(ConnectionState)>;
    using ErrorHandler = std::function<void(const std::string&)>;
    using RemoteUpdateHandler = std::function<void(const std::string& userId,
                                                   const ApplyReport& report)>;

    /// @throws std::invalid_argument on a null transport, an empty
    ///         participant id or an out-of-range config.
    SyncSession(std::unique_ptr<Transport> transport, std::string participantId,
                EngineConfig config = {});
    ~SyncSession();

    SyncSession(const SyncSession&) = delete;
    SyncSession& operator=(const SyncSession&) = delete;

    // --- Volume ---

    /// Select the volume to edit.  The baseline is cleared, so the next send
    /// is a full snapshot.
    void setVolume(LabelVolume volume);
    void clearVolume();
    bool hasVolume() const;

    /// Deep copy of the current volume.
    /// @throws std::runtime_error if no volume is selected.
    LabelVolume volumeSnapshot() const;

    /// Run @p edit on the volume under the session lock, then report a
    /// local mutation.
    /// @throws std::runtime_error if no volume is selected.
    void editVolume(const std::function<void(LabelVolume&)>& edit);

    /// Report a local mutation made through other means.  Ignored while a
    /// remote payload is being applied.
    void notifyLocalMutation();

    // --- Connection ---

    /// Open the channel and wait (up to connectTimeoutMs) for the join
    /// handshake.  @p credentials is appended as a token query parameter
    /// unless the endpoint already carries one.
    /// @return true once Connected.
    bool connect(const std::string& endpoint, const std::string& credentials = {});

    /// Stop timers, close the channel and reset counters and baseline.
    /// Idempotent and safe from any state.
    void disconnect();

    ConnectionState state() const;

    // --- Sending ---

    /// Diff against the baseline and send immediately, bypassing the
    /// debounce window.  @return true if a frame was sent.
    bool sendUpdate();

    /// Send a pending debounced update now.  @return true if one was pending.
    bool flushPendingChanges();

    // --- Inbound (driven by the poll worker; public for event-driven hosts) ---

    /// One poll step: observe transport state, drain inbound frames, send
    /// a keepalive or attempt a reconnect when due.
    void pollOnce();

    /// Decode and dispatch one inbound frame.  Never throws; bad frames are
    /// logged and dropped.
    void handleMessage(const std::string& text);

    // --- Handlers ---

    void setStatusHandler(StatusHandler handler);
    void setErrorHandler(ErrorHandler handler);
    void setRemoteUpdateHandler(RemoteUpdateHandler handler);

    // --- Statistics ---

    uint64_t sentCount() const;
    uint64_t receivedCount() const;
    int connectedUsers() const;
    bool hasBaseline() const;
    bool applyingRemote() const { return applyingRemote_.load(); }
    bool changesPending() const { return coalescer_->pending(); }

    /// Kind of the last frame sent by sendUpdate() (NoChange if none yet).
    DiffKind lastSentKind() const;

    const std::string& participantId() const { return participantId_; }
    const EngineConfig& config() const { return config_; }

private:
    using Clock = std::chrono::steady_clock;

    void startWorker();
    void stopWorker();
    void workerLoop();

    void handleTransportOpen();
    void handleTransportLost(const std::string& reason, bool allowReconnect);
    void attemptReconnect();
    void resetSyncState();
    void setState(ConnectionState state);
    void dispatch(const SyncMessage& message);
    void applyRemote(const SyncMessage& message);
    bool sendFrame(const std::string& frame);
    void sendPing();

    static std::string withToken(const std::string& endpoint, const std::string& credentials);

    const EngineConfig config_;
    const std::string participantId_;
    std::unique_ptr<Transport> transport_;
    DiffEngine diffEngine_;

    /// Protected by mutex_.
    mutable std::mutex mutex_;
    std::optional<LabelVolume> volume_;
    std::optional<LabelVolume> baseline_;
    uint64_t sentCount_ = 0;
    uint64_t receivedCount_ = 0;
    int connectedUsers_ = 0;
    DiffKind lastSentKind_ = DiffKind::NoChange;
    bool unsentLocalChanges_ = false;

    std::atomic<bool> applyingRemote_{false};
    Reconciler reconciler_;

    /// Protected by stateMutex_.
    mutable std::mutex stateMutex_;
    std::condition_variable stateCv_;
    ConnectionState state_ = ConnectionState::Disconnected;
    std::string url_;
    bool userDisconnect_ = false;
    bool reconnectPending_ = false;
    int reconnectAttempts_ = 0;
    Clock::time_point connectStarted_{};
    Clock::time_point nextReconnect_{};

    /// Touched only inside pollOnce() (serialized by pollMutex_).
    std::mutex pollMutex_;
    Clock::time_point nextPing_{};
    Clock::time_point lastInbound_{};
    bool silenceReported_ = false;

    /// Serializes open(), close() and send() issued from different threads.
    /// Lock order: mutex_ before transportMutex_.
    std::mutex transportMutex_;

    /// Poll worker.
    std::thread worker_;
    std::mutex workerMutex_;
    std::condition_variable workerCv_;
    bool workerExit_ = false;

    StatusHandler statusHandler_;
    ErrorHandler errorHandler_;
    RemoteUpdateHandler remoteUpdateHandler_;

    std::unique_ptr<ChangeCoalescer> coalescer_;
};
