#include <spdlog/spdlog.h>
#include <csignal>
#include <signal.h>
#include <cstdlib>
#include <atomic>
#include <iostream>
#include <memory>

#include <tickloop/app/menu_driver.hpp>
#include <tickloop/core/config/loader.hpp>
#include <tickloop/core/loop/event_loop.hpp>
#include <tickloop/core/output/output_sink.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    (void)signum;
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("TickLoop v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void applyLogLevel(const std::string& level) {
    spdlog::set_level(spdlog::level::from_str(level));
}

// No SA_RESTART: a blocked read on stdin fails with EINTR instead of
// resuming, so the menu notices the cleared flag right away.
static void setupSignalHandlers() {
    struct sigaction action {};
    action.sa_handler = signalHandler;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    for (int signum : {SIGINT, SIGTERM}) {
        if (sigaction(signum, &action, nullptr) != 0) {
            spdlog::warn("Failed to install handler for signal {}", signum);
        }
    }
}

static TickLoop::AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return TickLoop::ConfigLoader::loadConfig(configPath);
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        applyLogLevel(config.logging.level);
        spdlog::info("Configuration loaded successfully ({} {})", config.app_name, config.version);

        TickLoop::EventLoop::Options options;
        options.async_workers = config.scheduler.async_workers;
        TickLoop::EventLoop loop(std::make_shared<TickLoop::ConsoleOutputSink>(std::cout), options);

        TickLoop::MenuDriver driver(loop, config.collaborators, std::cin, std::cout, &g_running);
        driver.run();

        // Workers finish queued tasks before the loop goes away
        loop.shutdown();

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("TickLoop terminated gracefully");
    return EXIT_SUCCESS;
}
