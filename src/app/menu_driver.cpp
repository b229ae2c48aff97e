#include <tickloop/app/menu_driver.hpp>
#include <tickloop/collaborators/file_content_provider.hpp>
#include <tickloop/collaborators/greeter.hpp>
#include <tickloop/collaborators/remote_record_fetcher.hpp>
#include <spdlog/spdlog.h>

namespace TickLoop {

namespace {

    constexpr const char* kGreetingPayload = "How are you doing today?";

    std::string trim(const std::string& s) {
        size_t a = s.find_first_not_of(" \t\r\n");
        if (a == std::string::npos) return {};
        size_t b = s.find_last_not_of(" \t\r\n");
        return s.substr(a, b - a + 1);
    }

} // namespace

MenuDriver::MenuDriver(EventLoop& loop,
                       AppConfig::CollaboratorsConfig collaborators,
                       std::istream& in,
                       std::ostream& out,
                       const std::atomic<bool>* running)
    : loop_(loop)
    , collaborators_(std::move(collaborators))
    , in_(in)
    , out_(out)
    , running_(running) {}

size_t MenuDriver::run() {
    while (step()) {}
    spdlog::info("[MenuDriver] Session ended after {} ticks", ticks_);
    return ticks_;
}

bool MenuDriver::stopped() const {
    return running_ && !running_->load(std::memory_order_acquire);
}

bool MenuDriver::step() {
    if (stopped()) {
        return false;
    }

    auto choice = promptChoice();
    if (!choice || *choice == Choice::EXIT) {
        return false;
    }

    if (*choice != Choice::TICK_ONLY) {
        auto mode = promptMode();
        if (!mode) {
            return false;
        }
        if (stopped()) {
            return false;
        }
        submitFor(*choice, *mode);
    }

    if (stopped()) {
        return false;
    }
    loop_.tick();
    ++ticks_;
    return true;
}

std::optional<MenuDriver::Choice> MenuDriver::promptChoice() {
    while (true) {
        out_ << "What kind of task would you like to submit to the Event Loop?\n"
             << " 1. Wish me Hello\n"
             << " 2. Print the contents of a file named " << collaborators_.file.path << "\n"
             << " 3. Retrieve data from API & print it\n"
             << " 4. Print output of previously submitted Async task\n"
             << " 5. Exit!\n"
             << " > " << std::flush;

        auto line = readLine();
        if (!line) {
            return std::nullopt;
        }
        if (line->size() == 1 && (*line)[0] >= '1' && (*line)[0] <= '5') {
            return static_cast<Choice>((*line)[0] - '0');
        }
        out_ << "Invalid input. Please select a valid option (1-5).\n";
    }
}

std::optional<ExecutionMode> MenuDriver::promptMode() {
    while (true) {
        out_ << "How would you like to execute this operation?\n"
             << " 1. Synchronously (this would block the Event Loop until the operation completes)\n"
             << " 2. Asynchronously (this won't block Event Loop in any way)\n"
             << " > " << std::flush;

        auto line = readLine();
        if (!line) {
            return std::nullopt;
        }
        if (*line == "1") return ExecutionMode::SYNC;
        if (*line == "2") return ExecutionMode::ASYNC;
        out_ << "Invalid input. Please select a valid option (1 or 2).\n";
    }
}

// A signal interrupts the blocking read (EINTR) and fails the stream, so
// both end of input and a cleared running flag surface here as nullopt.
std::optional<std::string> MenuDriver::readLine() {
    std::string line;
    if (!std::getline(in_, line) || stopped()) {
        return std::nullopt;
    }
    return trim(line);
}

void MenuDriver::submitFor(Choice choice, ExecutionMode mode) {
    switch (choice) {
        case Choice::HELLO: {
            std::string key = keys_.next("hello");
            loop_.on(key, greet).submit(Event(key, kGreetingPayload, mode));
            break;
        }
        case Choice::READ_FILE: {
            std::string key = keys_.next("read-file");
            FileContentProvider provider(collaborators_.file.placeholder);
            loop_.on(key, provider.asHandler())
                 .submit(Event(key, collaborators_.file.path, mode));
            break;
        }
        case Choice::FETCH_RECORD: {
            std::string key = keys_.next("fetch-from-api");
            RemoteRecordFetcher fetcher(collaborators_.fetcher);
            loop_.on(key, fetcher.asHandler())
                 .submit(Event(key, collaborators_.fetcher.record_id, mode));
            break;
        }
        case Choice::TICK_ONLY:
        case Choice::EXIT:
            break;
    }
}

} // namespace TickLoop
