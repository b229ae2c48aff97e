#pragma once
#include <tickloop/core/events/event.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <shared_mutex>
#include <spdlog/spdlog.h>

namespace TickLoop {

/**
 * @class HandlerRegistry
 * @brief Maps event keys to the handler that computes their result.
 *
 * Registering under an existing key replaces the previous handler.
 * Lookups of unknown keys return std::nullopt; callers treat that as a no-op.
 */
class HandlerRegistry {
public:
    HandlerRegistry() = default;

    void registerHandler(const std::string& key, Handler handler);
    std::optional<Handler> lookup(const std::string& key) const;

    bool contains(const std::string& key) const;
    size_t size() const;

private:
    mutable std::shared_mutex share_mutex;
    std::unordered_map<std::string, Handler> Table;
};

} // namespace TickLoop
