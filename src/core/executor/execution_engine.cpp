#include <tickloop/core/executor/execution_engine.hpp>
#include <spdlog/spdlog.h>
#include <exception>

namespace TickLoop {

const char* toString(ExecutionOutcome outcome) {
    switch (outcome) {
        case ExecutionOutcome::COMPLETED:  return "completed";
        case ExecutionOutcome::DEFERRED:   return "deferred";
        case ExecutionOutcome::NO_HANDLER: return "no-handler";
        case ExecutionOutcome::CANCELLED:  return "cancelled";
        case ExecutionOutcome::REJECTED:   return "rejected";
    }
    return "unknown";
}

ExecutionReport ExecutionEngine::execute(const Event& event,
                                         const HandlerRegistry& registry,
                                         const CancellationToken& token) {
    ExecutionReport report;

    auto handler = registry.lookup(event.key);
    if (!handler) {
        spdlog::info("No handler found for {}", event.key);
        report.outcome = ExecutionOutcome::NO_HANDLER;
        return report;
    }

    if (token.shouldSkip()) {
        spdlog::info("[ExecutionEngine] Event {} skipped: {}", event.key,
                     token.isCancelled() ? "cancelled" : "deadline passed");
        report.outcome = ExecutionOutcome::CANCELLED;
        return report;
    }

    auto start = Clock::now();

    if (event.mode == ExecutionMode::SYNC) {
        report.result = invoke(*handler, event);
        report.outcome = ExecutionOutcome::COMPLETED;
        report.blocked = Clock::elapsedSince(start);
        return report;
    }

    in_flight_.fetch_add(1, std::memory_order_acq_rel);
    bool accepted = pool_.submit([this, fn = std::move(*handler), event, token]() {
        if (token.shouldSkip()) {
            spdlog::info("[ExecutionEngine] Async event {} skipped before start: {}", event.key,
                         token.isCancelled() ? "cancelled" : "deadline passed");
        } else {
            completed_.push(invoke(fn, event));
            spdlog::debug("[ExecutionEngine] Async event {} completed", event.key);
        }
        in_flight_.fetch_sub(1, std::memory_order_acq_rel);
    });

    if (!accepted) {
        in_flight_.fetch_sub(1, std::memory_order_acq_rel);
        spdlog::warn("[ExecutionEngine] Worker pool stopped, async event {} not run", event.key);
        report.outcome = ExecutionOutcome::REJECTED;
    } else {
        report.outcome = ExecutionOutcome::DEFERRED;
    }
    report.blocked = Clock::elapsedSince(start);
    return report;
}

EventResult ExecutionEngine::invoke(const Handler& handler, const Event& event) {
    try {
        return EventResult(event.key, handler(event.payload));
    } catch (const std::exception& e) {
        spdlog::error("[ExecutionEngine] Handler for {} threw: {}", event.key, e.what());
        return EventResult(event.key, std::string("Error: ") + e.what());
    } catch (...) {
        spdlog::error("[ExecutionEngine] Handler for {} threw a non-standard exception", event.key);
        return EventResult(event.key, "Error: unknown exception");
    }
}

} // namespace TickLoop
