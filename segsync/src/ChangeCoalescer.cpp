#include "ChangeCoalescer.h"

#include <exception>
#include <iostream>

ChangeCoalescer::ChangeCoalescer(std::chrono::milliseconds window, FlushFn flush)
    : window_(window), flush_(std::move(flush))
{
    thread_ = std::thread(&ChangeCoalescer::workerLoop, this);
}

ChangeCoalescer::~ChangeCoalescer()
{
    shutdown();
}

void ChangeCoalescer::notifyMutation()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (exit_)
            return;
        pending_ = true;
        ++pendingMutations_;
        deadline_ = Clock::now() + window_;
    }
    cv_.notify_one();
}

bool ChangeCoalescer::flushNow()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!pending_)
            return false;
        pending_ = false;
        pendingMutations_ = 0;
        ++flushCount_;
    }
    cv_.notify_one();
    runFlush();
    return true;
}

void ChangeCoalescer::cancelPending()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        pending_ = false;
        pendingMutations_ = 0;
    }
    cv_.notify_one();
}

void ChangeCoalescer::shutdown()
{
    {
        std::lock_guard<std::mutex> lk(mutex_);
        exit_ = true;
        pending_ = false;
        pendingMutations_ = 0;
    }
    cv_.notify_one();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id())
        thread_.join();
}

bool ChangeCoalescer::pending() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_;
}

size_t ChangeCoalescer::pendingMutations() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return pendingMutations_;
}

size_t ChangeCoalescer::flushCount() const
{
    std::lock_guard<std::mutex> lk(mutex_);
    return flushCount_;
}

void ChangeCoalescer::runFlush()
{
    if (!flush_)
        return;
    try
    {
        flush_();
    }
    catch (const std::exception& e)
    {
        std::cerr << "[coalescer] flush failed: " << e.what() << "\n";
    }
}

void ChangeCoalescer::workerLoop()
{
    std::unique_lock<std::mutex> lk(mutex_);
    while (!exit_)
    {
        if (!pending_)
        {
            cv_.wait(lk);
            continue;
        }

        if (Clock::now() < deadline_)
        {
            // Wakes early on a new mutation (deadline moved), cancel or exit.
            cv_.wait_until(lk, deadline_);
            continue;
        }

        pending_ = false;
        pendingMutations_ = 0;
        ++flushCount_;
        lk.unlock();
        runFlush();
        lk.lock();
    }
}
