// ============================================================================
// EVENT LOOP UNIT TESTS
// ============================================================================
// Tests for tick() dispatch/drain semantics, sync vs async blocking,
// completion-order draining and the cancellation hook
// ============================================================================

#include <gtest/gtest.h>
#include <tickloop/core/loop/event_loop.hpp>
#include "test_utils.hpp"
#include <atomic>
#include <future>
#include <set>
#include <sstream>
#include <thread>
#include <vector>

using namespace TickLoop;
using TickLoopTest::RecordingSink;
using TickLoopTest::waitFor;

namespace {

    Handler echo() {
        return [](const std::string& payload) { return "echo:" + payload; };
    }

    Handler sleeping(std::chrono::milliseconds d, std::string out) {
        return [d, out](const std::string&) {
            std::this_thread::sleep_for(d);
            return out;
        };
    }

} // namespace

// ============================================================================
// TEST CLASS
// ============================================================================
class EventLoopTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();

    std::unique_ptr<EventLoop> makeLoop(size_t workers = 4) {
        EventLoop::Options options;
        options.async_workers = workers;
        return std::make_unique<EventLoop>(sink, options);
    }

    // Ticks until every async task finished and the completed queue is empty
    std::vector<EventResult> drainAll(EventLoop& loop) {
        std::vector<EventResult> drained;
        EXPECT_TRUE(waitFor([&] { return loop.inFlight() == 0; }));
        while (loop.completedCount() > 0) {
            auto report = loop.tick();
            if (report.drained) {
                drained.push_back(*report.drained);
            }
        }
        return drained;
    }
};

// ============================================================================
// DISPATCH ORDER TESTS
// ============================================================================

TEST_F(EventLoopTest, DispatchesInSubmissionOrderRegardlessOfMode) {
    auto loop = makeLoop();
    std::vector<std::string> keys;
    for (int i = 0; i < 6; ++i) {
        std::string key = "task-" + std::to_string(i);
        keys.push_back(key);
        ExecutionMode mode = (i % 2 == 0) ? ExecutionMode::SYNC : ExecutionMode::ASYNC;
        loop->on(key, echo()).submit(Event(key, "p", mode));
    }

    std::vector<std::string> dispatched;
    for (int i = 0; i < 6; ++i) {
        auto report = loop->tick();
        ASSERT_TRUE(report.dispatched());
        dispatched.push_back(*report.dispatchedKey);
    }

    EXPECT_EQ(dispatched, keys);
    EXPECT_EQ(loop->pendingCount(), 0);
    EXPECT_FALSE(loop->tick().dispatched());
}

TEST_F(EventLoopTest, EmptyLoopTickIsNoOp) {
    auto loop = makeLoop();
    auto report = loop->tick();
    EXPECT_FALSE(report.dispatched());
    EXPECT_FALSE(report.didDrain());
    EXPECT_FALSE(report.execution.has_value());
    EXPECT_EQ(sink->count(), 0);
}

// ============================================================================
// MISSING HANDLER TESTS
// ============================================================================

TEST_F(EventLoopTest, UnregisteredKeyProducesNoResult) {
    auto loop = makeLoop();
    loop->submit(Event("ghost-0", "boo", ExecutionMode::ASYNC));

    TickReport report;
    EXPECT_NO_THROW(report = loop->tick());

    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::NO_HANDLER);
    EXPECT_FALSE(report.execution->result.has_value());
    EXPECT_EQ(*report.dispatchedKey, "ghost-0");

    EXPECT_TRUE(waitFor([&] { return loop->inFlight() == 0; }));
    EXPECT_EQ(loop->completedCount(), 0);
    EXPECT_EQ(sink->count(), 0);
    EXPECT_EQ(loop->pendingCount(), 0);
}

// ============================================================================
// BLOCKING BEHAVIOUR TESTS
// ============================================================================

TEST_F(EventLoopTest, SyncDispatchBlocksForHandlerDuration) {
    auto loop = makeLoop();
    const auto d = std::chrono::milliseconds(120);
    loop->on("slow-0", sleeping(d, "done")).submit(Event("slow-0", "", ExecutionMode::SYNC));

    auto start = std::chrono::steady_clock::now();
    auto report = loop->tick();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_GE(elapsed, d);
    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::COMPLETED);
    EXPECT_GE(report.execution->blocked, d);

    // Sync results go straight to the sink, never through the completed queue
    ASSERT_EQ(sink->count(), 1);
    EXPECT_EQ(sink->results()[0].key, "slow-0");
    EXPECT_EQ(sink->results()[0].result, "done");
    EXPECT_FALSE(report.didDrain());
    EXPECT_EQ(loop->completedCount(), 0);
}

TEST_F(EventLoopTest, AsyncDispatchReturnsImmediately) {
    auto loop = makeLoop();
    const auto d = std::chrono::milliseconds(300);
    loop->on("slow-1", sleeping(d, "later")).submit(Event("slow-1", "", ExecutionMode::ASYNC));

    auto start = std::chrono::steady_clock::now();
    auto report = loop->tick();
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(elapsed, std::chrono::milliseconds(100));
    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::DEFERRED);
    EXPECT_LT(report.execution->blocked, std::chrono::milliseconds(100));
    EXPECT_EQ(sink->count(), 0);

    auto drained = drainAll(*loop);
    ASSERT_EQ(drained.size(), 1);
    EXPECT_EQ(drained[0].key, "slow-1");
    EXPECT_EQ(drained[0].result, "later");
    EXPECT_EQ(sink->count(), 1);
}

// ============================================================================
// DRAIN ORDER TESTS
// ============================================================================

TEST_F(EventLoopTest, DrainsInCompletionOrder) {
    auto loop = makeLoop();
    loop->on("A", sleeping(std::chrono::milliseconds(300), "slow"))
         .on("B", sleeping(std::chrono::milliseconds(10), "fast"))
         .submit(Event("A", "", ExecutionMode::ASYNC))
         .submit(Event("B", "", ExecutionMode::ASYNC));

    std::vector<EventResult> drained;
    for (int i = 0; i < 2; ++i) {
        auto report = loop->tick();
        if (report.drained) {
            drained.push_back(*report.drained);
        }
    }
    auto rest = drainAll(*loop);
    drained.insert(drained.end(), rest.begin(), rest.end());

    ASSERT_EQ(drained.size(), 2);
    EXPECT_EQ(drained[0].key, "B");
    EXPECT_EQ(drained[1].key, "A");
}

TEST_F(EventLoopTest, AtMostOneDispatchAndOneDrainPerTick) {
    auto loop = makeLoop();

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    Handler gated = [opened](const std::string& payload) {
        opened.wait();
        return payload;
    };

    for (int i = 0; i < 3; ++i) {
        std::string key = "async-" + std::to_string(i);
        loop->on(key, gated).submit(Event(key, key, ExecutionMode::ASYNC));
    }
    for (int i = 0; i < 3; ++i) {
        auto report = loop->tick();
        EXPECT_TRUE(report.dispatched());
        EXPECT_FALSE(report.didDrain());
    }

    gate.set_value();
    ASSERT_TRUE(waitFor([&] { return loop->completedCount() == 3 && loop->inFlight() == 0; }));

    for (int i = 0; i < 3; ++i) {
        std::string key = "sync-" + std::to_string(i);
        loop->on(key, echo()).submit(Event(key, key, ExecutionMode::SYNC));
    }
    ASSERT_EQ(loop->pendingCount(), 3);
    ASSERT_EQ(loop->completedCount(), 3);

    auto report = loop->tick();

    EXPECT_TRUE(report.dispatched());
    EXPECT_TRUE(report.didDrain());
    EXPECT_EQ(loop->pendingCount(), 2);
    EXPECT_EQ(loop->completedCount(), 2);
    // one sync result plus one drained result
    EXPECT_EQ(sink->count(), 2);
}

TEST_F(EventLoopTest, ManyConcurrentAsyncResultsDrainExactlyOnce) {
    auto loop = makeLoop(4);
    constexpr int N = 200;
    for (int i = 0; i < N; ++i) {
        std::string key = "bulk-" + std::to_string(i);
        loop->on(key, echo()).submit(Event(key, std::to_string(i), ExecutionMode::ASYNC));
    }

    std::vector<EventResult> drained;
    for (int i = 0; i < N; ++i) {
        auto report = loop->tick();
        if (report.drained) {
            drained.push_back(*report.drained);
        }
    }
    auto rest = drainAll(*loop);
    drained.insert(drained.end(), rest.begin(), rest.end());

    ASSERT_EQ(drained.size(), static_cast<size_t>(N));
    std::set<std::string> keys;
    for (const auto& r : drained) {
        keys.insert(r.key);
    }
    EXPECT_EQ(keys.size(), static_cast<size_t>(N));
}

// ============================================================================
// REGISTRY TESTS
// ============================================================================

TEST_F(EventLoopTest, LaterRegistrationOverwritesEarlierOne) {
    auto loop = makeLoop();
    std::atomic<int> firstCalls{0};
    loop->on("K", [&](const std::string&) { firstCalls++; return std::string("H1"); });
    loop->on("K", [](const std::string&) { return std::string("H2"); });
    EXPECT_EQ(loop->handlerCount(), 1);

    loop->submit(Event("K", "", ExecutionMode::SYNC));
    auto report = loop->tick();

    ASSERT_TRUE(report.execution && report.execution->result);
    EXPECT_EQ(report.execution->result->result, "H2");
    EXPECT_EQ(firstCalls.load(), 0);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST_F(EventLoopTest, ThrowingHandlerBecomesErrorResult) {
    auto loop = makeLoop();
    loop->on("bad", [](const std::string&) -> std::string {
        throw std::runtime_error("disk on fire");
    });
    loop->submit(Event("bad", "", ExecutionMode::SYNC))
         .submit(Event("bad", "", ExecutionMode::ASYNC));

    EXPECT_NO_THROW(loop->tick());
    EXPECT_NO_THROW(loop->tick());
    drainAll(*loop);

    auto results = sink->results();
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].result, "Error: disk on fire");
    EXPECT_EQ(results[1].result, "Error: disk on fire");
}

TEST_F(EventLoopTest, NonStandardThrowBecomesUnknownError) {
    auto loop = makeLoop();
    loop->on("odd", [](const std::string&) -> std::string {
        throw 42;
    });
    loop->submit(Event("odd", "", ExecutionMode::SYNC))
         .submit(Event("odd", "", ExecutionMode::ASYNC));

    EXPECT_NO_THROW(loop->tick());
    EXPECT_NO_THROW(loop->tick());
    auto drained = drainAll(*loop);

    EXPECT_EQ(loop->inFlight(), 0);
    ASSERT_EQ(drained.size(), 1);
    auto results = sink->results();
    ASSERT_EQ(results.size(), 2);
    EXPECT_EQ(results[0].result, "Error: unknown exception");
    EXPECT_EQ(results[1].result, "Error: unknown exception");
}

TEST_F(EventLoopTest, BrokenOutputStreamIsFatal) {
    std::ostringstream broken;
    broken.setstate(std::ios::badbit);
    EventLoop loop(std::make_shared<ConsoleOutputSink>(broken));
    loop.on("k", echo()).submit(Event("k", "x", ExecutionMode::SYNC));

    EXPECT_THROW(loop.tick(), std::runtime_error);
}

TEST_F(EventLoopTest, ConsoleSinkFormatsResult) {
    std::ostringstream out;
    EventLoop loop(std::make_shared<ConsoleOutputSink>(out));
    loop.on("hello-0", echo()).submit(Event("hello-0", "hi", ExecutionMode::SYNC));
    loop.tick();

    EXPECT_EQ(out.str(), "Output for Event \"hello-0\": echo:hi\n\n");
}

TEST_F(EventLoopTest, CallbackAndLoggingSinksReceiveResults) {
    std::vector<std::string> seen;
    EventLoop callbackLoop(std::make_shared<CallbackOutputSink>(
        [&seen](const EventResult& r) { seen.push_back(r.key + "=" + r.result); }));
    callbackLoop.on("cb", echo()).submit(Event("cb", "1", ExecutionMode::SYNC));
    callbackLoop.tick();
    ASSERT_EQ(seen.size(), 1);
    EXPECT_EQ(seen[0], "cb=echo:1");

    EventLoop loggingLoop(std::make_shared<LoggingOutputSink>());
    loggingLoop.on("log", echo()).submit(Event("log", "2", ExecutionMode::SYNC));
    auto report = loggingLoop.tick();
    ASSERT_TRUE(report.execution && report.execution->result);
    EXPECT_EQ(report.execution->result->result, "echo:2");
}

TEST_F(EventLoopTest, NullSinkDiscardsResults) {
    auto nullSink = std::make_shared<NullOutputSink>();
    EXPECT_STREQ(nullSink->name(), "NullOutputSink");

    EventLoop quietLoop(nullSink);
    quietLoop.on("quiet", echo()).submit(Event("quiet", "3", ExecutionMode::SYNC));
    TickReport report;
    EXPECT_NO_THROW(report = quietLoop.tick());
    ASSERT_TRUE(report.execution && report.execution->result);
    EXPECT_EQ(report.execution->result->result, "echo:3");
}

TEST_F(EventLoopTest, AsyncAfterShutdownIsRejected) {
    auto loop = makeLoop();
    loop->shutdown();
    loop->on("late", echo()).submit(Event("late", "", ExecutionMode::ASYNC));

    auto report = loop->tick();
    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::REJECTED);
    EXPECT_EQ(loop->inFlight(), 0);
}

// ============================================================================
// CANCELLATION TESTS
// ============================================================================

TEST_F(EventLoopTest, CancelledTokenSkipsExecution) {
    auto loop = makeLoop();
    std::atomic<int> calls{0};
    loop->on("c", [&](const std::string&) { calls++; return std::string("ran"); });

    auto token = CancellationToken::create();
    token.cancel();
    loop->submit(Event("c", "", ExecutionMode::ASYNC), token);

    auto report = loop->tick();
    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::CANCELLED);
    EXPECT_TRUE(waitFor([&] { return loop->inFlight() == 0; }));
    EXPECT_EQ(calls.load(), 0);
    EXPECT_EQ(loop->completedCount(), 0);
}

TEST_F(EventLoopTest, ExpiredDeadlineSkipsExecution) {
    auto loop = makeLoop();
    loop->on("d", echo());
    auto token = CancellationToken::withDeadline(Clock::now() - std::chrono::milliseconds(1));
    loop->submit(Event("d", "", ExecutionMode::SYNC), token);

    auto report = loop->tick();
    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::CANCELLED);
    EXPECT_EQ(sink->count(), 0);
}

TEST_F(EventLoopTest, CancelBeforeWorkerStartsDropsResult) {
    auto loop = makeLoop(1);

    std::promise<void> gate;
    std::shared_future<void> opened = gate.get_future().share();
    loop->on("blocker", [opened](const std::string&) { opened.wait(); return std::string("b"); })
         .on("victim", echo())
         .submit(Event("blocker", "", ExecutionMode::ASYNC));

    auto token = CancellationToken::create();
    loop->submit(Event("victim", "", ExecutionMode::ASYNC), token);

    loop->tick();
    auto report = loop->tick();
    ASSERT_TRUE(report.execution.has_value());
    EXPECT_EQ(report.execution->outcome, ExecutionOutcome::DEFERRED);

    // Worker is still busy with "blocker", so "victim" has not started
    token.cancel();
    gate.set_value();

    auto drained = drainAll(*loop);
    ASSERT_EQ(drained.size(), 1);
    EXPECT_EQ(drained[0].key, "blocker");
}

TEST_F(EventLoopTest, InertTokenNeverCancels) {
    CancellationToken token;
    token.cancel();
    EXPECT_FALSE(token.canBeCancelled());
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.shouldSkip());
}
