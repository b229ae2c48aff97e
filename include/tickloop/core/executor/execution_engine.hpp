#pragma once
#include <tickloop/core/events/event.hpp>
#include <tickloop/core/events/handler_registry.hpp>
#include <tickloop/core/executor/cancellation.hpp>
#include <tickloop/core/queues/mpsc_queue.hpp>
#include <tickloop/core/utils/clock.hpp>
#include <tickloop/core/utils/thread_pool.hpp>
#include <atomic>
#include <optional>

namespace TickLoop {

enum class ExecutionOutcome {
    COMPLETED,   // sync handler ran inline, result attached
    DEFERRED,    // async task spawned, result arrives on the completed queue
    NO_HANDLER,  // key not registered, nothing ran
    CANCELLED,   // token cancelled or past its deadline before the handler started
    REJECTED     // worker pool already shut down
};

const char* toString(ExecutionOutcome outcome);

struct ExecutionReport {
    ExecutionOutcome outcome = ExecutionOutcome::NO_HANDLER;
    std::optional<EventResult> result;
    Clock::Duration blocked{0};  // time the caller spent inside execute()

    bool handlerFound() const {
        return outcome != ExecutionOutcome::NO_HANDLER;
    }
};

/**
 * @class ExecutionEngine
 * @brief Runs one event's handler, inline or on the worker pool.
 *
 * SYNC events block the caller for the handler's full duration and return
 * the result immediately. ASYNC events are posted to the pool; the task
 * pushes its result onto the completed queue when the handler returns, so
 * the caller only pays for the spawn.
 *
 * The handler resolved at dispatch time is the one that runs. Handlers are
 * never retried or time-limited; one that never returns keeps its worker.
 */
class ExecutionEngine {
public:
    ExecutionEngine(MpscQueue<EventResult>& completed, ThreadPool& pool)
        : completed_(completed), pool_(pool) {}

    ExecutionReport execute(const Event& event,
                            const HandlerRegistry& registry,
                            const CancellationToken& token = {});

    // Async tasks spawned but not yet finished
    size_t inFlight() const {
        return in_flight_.load(std::memory_order_acquire);
    }

private:
    // Handler exceptions become "Error: <what>" results
    static EventResult invoke(const Handler& handler, const Event& event);

    MpscQueue<EventResult>& completed_;
    ThreadPool& pool_;
    std::atomic<size_t> in_flight_{0};
};

} // namespace TickLoop
