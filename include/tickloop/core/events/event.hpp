#pragma once
#include <functional>
#include <string>

namespace TickLoop {

    enum struct ExecutionMode {
        SYNC,
        ASYNC,
    };

    // Unit of submitted work. Immutable once it sits in the pending queue.
    struct Event {
        std::string key;
        std::string payload;
        ExecutionMode mode = ExecutionMode::SYNC;

        Event() = default;
        Event(std::string k, std::string p, ExecutionMode m)
            : key(std::move(k)), payload(std::move(p)), mode(m) {}
    };

    struct EventResult {
        std::string key;
        std::string result;

        EventResult() = default;
        EventResult(std::string k, std::string r)
            : key(std::move(k)), result(std::move(r)) {}
    };

    // Computes a result from an event payload. Failures are encoded in the returned string.
    using Handler = std::function<std::string(const std::string& payload)>;

    inline const char* toString(ExecutionMode mode) {
        return mode == ExecutionMode::ASYNC ? "async" : "sync";
    }

} // namespace TickLoop
