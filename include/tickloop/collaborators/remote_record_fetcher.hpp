#pragma once
#include <tickloop/core/config/app_config.hpp>
#include <tickloop/core/events/event.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace TickLoop {

struct RemoteRecord {
    int id = 0;
    int userId = 0;
    std::string title;
    std::string body;
};

/**
 * @class RemoteRecordFetcher
 * @brief Handler body that GETs {target_prefix}{id} and describes the JSON record.
 *
 * Plain HTTP or HTTPS (Boost.Beast over Asio, OpenSSL) depending on the
 * configuration. The whole request is bounded by timeout_ms. Network
 * failures return "Error fetching data from API", malformed JSON returns
 * "Error decoding data from API".
 */
class RemoteRecordFetcher {
public:
    explicit RemoteRecordFetcher(AppConfig::FetcherConfig config) : config_(std::move(config)) {}

    std::string operator()(const std::string& id) const;

    Handler asHandler() const {
        return [fetcher = *this](const std::string& id) { return fetcher(id); };
    }

    // Missing members decode as zero/empty; malformed JSON or mistyped members yield nullopt
    static std::optional<RemoteRecord> decodeRecord(std::string_view json);

    // "Fetched post from API: {<id> <userId> <title> <body>}"
    static std::string describe(const RemoteRecord& record);

    const AppConfig::FetcherConfig& config() const { return config_; }

private:
    // Throws boost::system::system_error on network failure
    std::string fetchBody(const std::string& target) const;

    AppConfig::FetcherConfig config_;
};

} // namespace TickLoop
