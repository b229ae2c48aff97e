#include <tickloop/core/events/handler_registry.hpp>
#include <mutex>

using namespace TickLoop;

void HandlerRegistry::registerHandler(const std::string& key, Handler handler) {
    std::unique_lock lock(share_mutex);
    Table[key] = std::move(handler);
    spdlog::debug("[HandlerRegistry] Registered handler for {} ({} total)", key, Table.size());
}

std::optional<Handler> HandlerRegistry::lookup(const std::string& key) const {
    std::shared_lock lock(share_mutex);
    auto it = Table.find(key);
    if (it == Table.end() || !it->second) {
        return std::nullopt;
    }
    return it->second;
}

bool HandlerRegistry::contains(const std::string& key) const {
    std::shared_lock lock(share_mutex);
    return Table.find(key) != Table.end();
}

size_t HandlerRegistry::size() const {
    std::shared_lock lock(share_mutex);
    return Table.size();
}
