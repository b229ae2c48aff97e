#pragma once
#include <cstdint>
#include <string>

namespace TickLoop::AppConfig {

    struct LoggingConfig {
        std::string level = "info";
    };

    struct SchedulerConfig {
        size_t async_workers = 4;
    };

    struct FileProviderConfig {
        std::string path = "hello.txt";
        std::string placeholder = "New file created";
    };

    struct FetcherConfig {
        std::string host = "jsonplaceholder.typicode.com";
        uint16_t port = 443;
        bool use_tls = true;
        std::string target_prefix = "/posts/";
        std::string record_id = "2";
        uint32_t timeout_ms = 5000;
    };

    struct CollaboratorsConfig {
        FileProviderConfig file;
        FetcherConfig fetcher;
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        LoggingConfig logging;
        SchedulerConfig scheduler;
        CollaboratorsConfig collaborators;
    };

} // namespace TickLoop::AppConfig
