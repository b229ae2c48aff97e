#include <tickloop/core/events/key_generator.hpp>
#include <spdlog/fmt/fmt.h>

namespace TickLoop {

    std::string makeEventKey(std::string_view base, uint64_t counter) {
        return fmt::format("{}-{}", base, counter);
    }

    std::string KeyGenerator::next(std::string_view base) {
        return makeEventKey(base, next_id_.fetch_add(1, std::memory_order_relaxed));
    }

} // namespace TickLoop
