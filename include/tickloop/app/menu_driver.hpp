#pragma once
#include <tickloop/core/config/app_config.hpp>
#include <tickloop/core/events/key_generator.hpp>
#include <tickloop/core/loop/event_loop.hpp>
#include <atomic>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

namespace TickLoop {

/**
 * @class MenuDriver
 * @brief Interactive front end: one menu choice, one tick.
 *
 * Options 1-3 register a handler under a fresh key, submit an event in the
 * chosen mode and tick once. Option 4 only ticks, which drains a finished
 * async result if there is one. Option 5, end of input or a cleared
 * running flag end the session.
 */
class MenuDriver {
public:
    enum class Choice {
        HELLO = 1,
        READ_FILE = 2,
        FETCH_RECORD = 3,
        TICK_ONLY = 4,
        EXIT = 5
    };

    MenuDriver(EventLoop& loop,
               AppConfig::CollaboratorsConfig collaborators,
               std::istream& in,
               std::ostream& out,
               const std::atomic<bool>* running = nullptr);

    // Runs rounds until exit; returns the number of ticks performed
    size_t run();

    // One round; false when the session should end
    bool step();

private:
    std::optional<Choice> promptChoice();
    std::optional<ExecutionMode> promptMode();
    std::optional<std::string> readLine();
    bool stopped() const;
    void submitFor(Choice choice, ExecutionMode mode);

    EventLoop& loop_;
    AppConfig::CollaboratorsConfig collaborators_;
    std::istream& in_;
    std::ostream& out_;
    const std::atomic<bool>* running_;
    KeyGenerator keys_;
    size_t ticks_ = 0;
};

} // namespace TickLoop
