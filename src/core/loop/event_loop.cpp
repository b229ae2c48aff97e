#include <tickloop/core/loop/event_loop.hpp>
#include <spdlog/spdlog.h>

using namespace TickLoop;

EventLoop::EventLoop(OutputSinkPtr sink) : EventLoop(std::move(sink), Options{}) {}

EventLoop::EventLoop(OutputSinkPtr sink, const Options& options)
    : sink_(sink ? std::move(sink) : std::make_shared<ConsoleOutputSink>())
    , pool_(std::make_unique<ThreadPool>(options.async_workers))
    , engine_(completed_, *pool_) {
    spdlog::info("[EventLoop] Created (async workers: {}, sink: {})",
                 options.async_workers, sink_->name());
}

EventLoop::~EventLoop() noexcept {
    // Tasks reference completed_ and engine_, so workers must be joined first
    shutdown();
    if (!completed_.empty() || !pending_.empty()) {
        spdlog::info("[EventLoop] Destroyed with {} pending events and {} undrained results",
                     pending_.size(), completed_.size());
    }
}

EventLoop& EventLoop::on(const std::string& key, Handler handler) {
    registry_.registerHandler(key, std::move(handler));
    return *this;
}

EventLoop& EventLoop::submit(Event event, CancellationToken token) {
    spdlog::debug("[EventLoop] Submitted {} ({})", event.key, toString(event.mode));
    pending_.push(PendingEvent{std::move(event), std::move(token)});
    return *this;
}

TickReport EventLoop::tick() {
    TickReport report;
    dispatchOne(report);
    drainOne(report);
    return report;
}

void EventLoop::shutdown() {
    pool_->shutdown();
}

void EventLoop::dispatchOne(TickReport& report) {
    auto next = pending_.pop();
    if (!next) {
        return;
    }

    const Event& event = next->event;
    spdlog::info("Received Event: {}", event.key);
    report.dispatchedKey = event.key;

    ExecutionReport exec = engine_.execute(event, registry_, next->token);
    if (exec.handlerFound()) {
        spdlog::info("Event loop was blocked for {} ms due to this operation",
                     Clock::toMillis(exec.blocked));
    }

    if (exec.result) {
        sink_->emit(*exec.result);
    }
    report.execution = std::move(exec);
}

void EventLoop::drainOne(TickReport& report) {
    auto done = completed_.pop();
    if (!done) {
        return;
    }
    sink_->emit(*done);
    report.drained = std::move(*done);
}
