#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

/// Debounces bursts of local mutation events into a single flush.
///
/// Every notifyMutation() (re)starts a quiet window.  When the window
/// expires without another notification, the flush callback runs once on
/// the coalescer's background thread.  The callback is expected to compute
/// its diff against the state at that moment, so a burst of N edits
/// produces exactly one outgoing message carrying their union.
///
/// Usage:
///   1. Construct with the window length and the flush callback.
///   2. Call notifyMutation() after each qualifying local edit.
///   3. Call shutdown() before destruction (or let the destructor do it).
///
/// Thread safety: all public methods may be called from any thread.  The
/// flush callback is never invoked while the internal mutex is held, so it
/// may call back into notifyMutation() or pending().
class ChangeCoalescer {
public:
    using Clock = std::chrono::steady_clock;
    using FlushFn = std::function<void()>;

    ChangeCoalescer(std::chrono::milliseconds window, FlushFn flush);
    ~ChangeCoalescer();

    // Not copyable or movable (owns a thread).
    ChangeCoalescer(const ChangeCoalescer&) = delete;
    ChangeCoalescer& operator=(const ChangeCoalescer&) = delete;

    /// Record a local mutation and push the flush deadline to now + window.
    void notifyMutation();

    /// Run a pending flush immediately on the calling thread.
    /// @return true if a flush was pending (and has now run).
    bool flushNow();

    /// Forget any pending flush without running it.
    void cancelPending();

    /// Signal the background thread to exit and join it.  A pending flush
    /// is discarded.  Safe to call multiple times.
    void shutdown();

    bool pending() const;

    /// Number of mutations folded into the currently pending flush.
    size_t pendingMutations() const;

    /// Number of flushes run so far (timer or flushNow()).
    size_t flushCount() const;

    std::chrono::milliseconds window() const { return window_; }

private:
    void workerLoop();
    void runFlush();

    const std::chrono::milliseconds window_;
    FlushFn flush_;

    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    /// All fields below are protected by mutex_.
    bool pending_ = false;
    size_t pendingMutations_ = 0;
    size_t flushCount_ = 0;
    Clock::time_point deadline_{};
    bool exit_ = false;
};
