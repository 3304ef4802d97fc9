// test_change_coalescer.cpp - Tests for debouncing local edit notifications.
//
// Verifies that a burst of mutations yields a single flush after the quiet
// window, that flushNow()/cancelPending() behave, and that shutdown()
// discards pending work and joins the timer thread.

#include "ChangeCoalescer.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

static int failures = 0;

static void check(bool cond, const char* msg, int line)
{
    if (!cond)
    {
        std::cerr << "FAIL (line " << line << "): " << msg << "\n";
        ++failures;
    }
}

#define CHECK(cond, msg) check((cond), (msg), __LINE__)

using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Test 1: A burst of edits produces one flush
// ---------------------------------------------------------------------------
static void testBurstCoalesces()
{
    std::cout << "  testBurstCoalesces...";

    std::atomic<int> flushes{0};
    ChangeCoalescer coalescer(200ms, [&] { ++flushes; });

    // 10 mutations 50 ms apart: each one lands inside the previous window.
    for (int i = 0; i < 10; ++i)
    {
        coalescer.notifyMutation();
        std::this_thread::sleep_for(50ms);
    }
    CHECK(flushes.load() == 0, "no flush while mutations keep arriving");
    CHECK(coalescer.pending(), "a flush is pending");
    CHECK(coalescer.pendingMutations() == 10, "all ten mutations are folded together");

    std::this_thread::sleep_for(500ms);
    CHECK(flushes.load() == 1, "exactly one flush after the quiet window");
    CHECK(!coalescer.pending(), "nothing pending after the flush");
    CHECK(coalescer.flushCount() == 1, "flush count reports one flush");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 2: Separate bursts flush separately
// ---------------------------------------------------------------------------
static void testSeparateBursts()
{
    std::cout << "  testSeparateBursts...";

    std::atomic<int> flushes{0};
    ChangeCoalescer coalescer(50ms, [&] { ++flushes; });

    coalescer.notifyMutation();
    std::this_thread::sleep_for(300ms);
    coalescer.notifyMutation();
    coalescer.notifyMutation();
    std::this_thread::sleep_for(300ms);

    CHECK(flushes.load() == 2, "two quiet-separated bursts produce two flushes");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 3: flushNow and cancelPending
// ---------------------------------------------------------------------------
static void testFlushNowAndCancel()
{
    std::cout << "  testFlushNowAndCancel...";

    std::atomic<int> flushes{0};
    std::thread::id flushThread;
    ChangeCoalescer coalescer(10s, [&] {
        flushThread = std::this_thread::get_id();
        ++flushes;
    });

    CHECK(!coalescer.flushNow(), "flushNow without pending work does nothing");
    CHECK(flushes.load() == 0, "no flush ran");

    coalescer.notifyMutation();
    CHECK(coalescer.flushNow(), "flushNow runs a pending flush");
    CHECK(flushes.load() == 1, "flush ran once");
    CHECK(flushThread == std::this_thread::get_id(), "flushNow runs on the caller's thread");
    CHECK(!coalescer.pending(), "nothing pending afterwards");

    coalescer.notifyMutation();
    coalescer.cancelPending();
    CHECK(!coalescer.pending(), "cancel clears the pending flag");
    CHECK(!coalescer.flushNow(), "cancelled work is not flushed");
    CHECK(flushes.load() == 1, "flush count unchanged after cancel");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 4: Shutdown discards pending work
// ---------------------------------------------------------------------------
static void testShutdownDiscards()
{
    std::cout << "  testShutdownDiscards...";

    std::atomic<int> flushes{0};
    ChangeCoalescer coalescer(100ms, [&] { ++flushes; });

    coalescer.notifyMutation();
    coalescer.shutdown();
    coalescer.shutdown();  // idempotent
    std::this_thread::sleep_for(250ms);
    CHECK(flushes.load() == 0, "pending flush discarded on shutdown");

    coalescer.notifyMutation();
    CHECK(!coalescer.pending(), "notifications after shutdown are ignored");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 5: A throwing flush does not stop the timer thread
// ---------------------------------------------------------------------------
static void testFlushFailureIsContained()
{
    std::cout << "  testFlushFailureIsContained...";

    std::atomic<int> calls{0};
    ChangeCoalescer coalescer(30ms, [&] {
        if (++calls == 1)
            throw std::runtime_error("transport gone");
    });

    coalescer.notifyMutation();
    std::this_thread::sleep_for(200ms);
    coalescer.notifyMutation();
    std::this_thread::sleep_for(200ms);
    CHECK(calls.load() == 2, "second burst still flushes after a failed flush");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Test 6: The flush may re-arm the coalescer
// ---------------------------------------------------------------------------
static void testFlushCanRearm()
{
    std::cout << "  testFlushCanRearm...";

    std::atomic<int> calls{0};
    ChangeCoalescer* self = nullptr;
    ChangeCoalescer coalescer(30ms, [&] {
        if (++calls == 1)
            self->notifyMutation();
    });
    self = &coalescer;

    coalescer.notifyMutation();
    std::this_thread::sleep_for(300ms);
    CHECK(calls.load() == 2, "a flush that re-notifies gets a second flush");

    std::cout << " done\n";
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main()
{
    std::cout << "=== ChangeCoalescer Tests ===\n";

    testBurstCoalesces();
    testSeparateBursts();
    testFlushNowAndCancel();
    testShutdownDiscards();
    testFlushFailureIsContained();
    testFlushCanRearm();

    std::cout << "\n";
    if (failures == 0)
    {
        std::cout << "All ChangeCoalescer tests PASSED.\n";
        return 0;
    }
    else
    {
        std::cout << failures << " ChangeCoalescer test(s) FAILED.\n";
        return 1;
    }
}
