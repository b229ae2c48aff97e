#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace TickLoop {

// "{base}-{counter}"
std::string makeEventKey(std::string_view base, uint64_t counter);

/**
 * @class KeyGenerator
 * @brief Hands out event keys backed by one run-wide sequence counter.
 *
 * The counter is shared across bases, so "hello-0" is followed by
 * "read-file-1" and no key repeats within a run.
 */
class KeyGenerator {
public:
    explicit KeyGenerator(uint64_t first = 0) : next_id_(first) {}

    std::string next(std::string_view base);
    uint64_t peek() const { return next_id_.load(std::memory_order_relaxed); }

private:
    std::atomic<uint64_t> next_id_;
};

} // namespace TickLoop
