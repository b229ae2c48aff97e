#pragma once
#include <tickloop/core/events/event.hpp>
#include <tickloop/core/events/handler_registry.hpp>
#include <tickloop/core/executor/cancellation.hpp>
#include <tickloop/core/executor/execution_engine.hpp>
#include <tickloop/core/output/output_sink.hpp>
#include <tickloop/core/queues/fifo_queue.hpp>
#include <tickloop/core/queues/mpsc_queue.hpp>
#include <tickloop/core/utils/thread_pool.hpp>
#include <memory>
#include <optional>
#include <string>

namespace TickLoop {

/**
 * @struct TickReport
 * @brief What a single tick() did
 */
struct TickReport {
    std::optional<std::string> dispatchedKey;
    std::optional<ExecutionReport> execution;
    std::optional<EventResult> drained;

    bool dispatched() const { return dispatchedKey.has_value(); }
    bool didDrain() const { return drained.has_value(); }
};

/**
 * @class EventLoop
 * @brief Cooperative scheduler driven one tick() at a time.
 *
 * Owns the handler registry, the pending queue (submission order), the
 * completed queue (async completion order) and the worker pool running
 * async handlers.
 *
 * Each tick() dispatches at most one pending event and drains at most one
 * completed result, whatever the queue depths. Sync results go straight to
 * the sink during dispatch; async results reach it through the drain of a
 * later tick. tick() never waits for async work.
 *
 * tick() is meant for a single driver thread. on() and submit() may be
 * called from any thread.
 */
class EventLoop {
public:
    struct Options {
        size_t async_workers = 4;
    };

    explicit EventLoop(OutputSinkPtr sink = nullptr);
    EventLoop(OutputSinkPtr sink, const Options& options);
    ~EventLoop() noexcept;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    // Last registration for a key wins
    EventLoop& on(const std::string& key, Handler handler);
    EventLoop& submit(Event event, CancellationToken token = {});

    TickReport tick();

    // Stops the worker pool after its queued tasks ran. Later async
    // dispatches are reported as REJECTED.
    void shutdown();

    size_t pendingCount() const { return pending_.size(); }
    size_t completedCount() const { return completed_.size(); }
    size_t handlerCount() const { return registry_.size(); }
    size_t inFlight() const { return engine_.inFlight(); }

private:
    struct PendingEvent {
        Event event;
        CancellationToken token;
    };

    void dispatchOne(TickReport& report);
    void drainOne(TickReport& report);

    OutputSinkPtr sink_;
    HandlerRegistry registry_;
    FifoQueue<PendingEvent> pending_;
    MpscQueue<EventResult> completed_;
    std::unique_ptr<ThreadPool> pool_;
    ExecutionEngine engine_;
};

} // namespace TickLoop
