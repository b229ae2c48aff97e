#pragma once

#include <chrono>
#include <cstdint>

namespace TickLoop {

class Clock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Duration = std::chrono::nanoseconds;

    static inline TimePoint now() {
        return std::chrono::steady_clock::now();
    }

    static inline Duration elapsedSince(TimePoint start) {
        return std::chrono::duration_cast<Duration>(now() - start);
    }

    static inline int64_t toMillis(Duration d) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    }
};

} // namespace TickLoop
