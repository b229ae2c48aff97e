#pragma once

#include <tickloop/core/events/event.hpp>
#include <functional>
#include <memory>
#include <ostream>

namespace TickLoop {

/**
 * @class OutputSink
 * @brief Renders completed results, one per call.
 *
 * emit() has no failure channel. An implementation that cannot write
 * throws std::runtime_error and the event loop lets it propagate: a broken
 * output is fatal to the driver.
 */
class OutputSink {
public:
    virtual ~OutputSink() = default;

    virtual void emit(const EventResult& result) = 0;

    virtual const char* name() const = 0;
};

using OutputSinkPtr = std::shared_ptr<OutputSink>;

/**
 * @class ConsoleOutputSink
 * @brief Writes `Output for Event "<key>": <result>` to a stream
 */
class ConsoleOutputSink : public OutputSink {
public:
    ConsoleOutputSink();
    explicit ConsoleOutputSink(std::ostream& out) : out_(out) {}

    void emit(const EventResult& result) override;
    const char* name() const override { return "ConsoleOutputSink"; }

private:
    std::ostream& out_;
};

class LoggingOutputSink : public OutputSink {
public:
    void emit(const EventResult& result) override;
    const char* name() const override { return "LoggingOutputSink"; }
};

class CallbackOutputSink : public OutputSink {
public:
    using Callback = std::function<void(const EventResult&)>;

    explicit CallbackOutputSink(Callback cb, const char* name = "CallbackOutputSink")
        : callback_(std::move(cb)), name_(name) {}

    void emit(const EventResult& result) override {
        if (callback_) {
            callback_(result);
        }
    }

    const char* name() const override { return name_; }

private:
    Callback callback_;
    const char* name_;
};

// Discards every result
class NullOutputSink : public OutputSink {
public:
    void emit(const EventResult&) override {}
    const char* name() const override { return "NullOutputSink"; }
};

} // namespace TickLoop
