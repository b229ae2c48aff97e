#include <tickloop/collaborators/remote_record_fetcher.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <sstream>

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = net::ssl;
namespace pt = boost::property_tree;
using tcp = net::ip::tcp;

namespace TickLoop {

namespace {

    // Runs one async operation to completion. tcp_stream deadlines only
    // apply to async operations, so every step goes through the io_context.
    template<typename Initiate>
    void runStep(net::io_context& ioc, const char* step, Initiate&& initiate) {
        beast::error_code ec;
        initiate([&ec](beast::error_code e, auto&&...) { ec = e; });
        ioc.restart();
        ioc.run();
        if (ec) {
            throw beast::system_error(ec, step);
        }
    }

    template<typename T>
    T readMember(const pt::ptree& tree, const char* name) {
        auto child = tree.get_child_optional(name);
        if (!child) {
            return T{};
        }
        return child->get_value<T>();
    }

    http::request<http::empty_body> makeRequest(const std::string& host, const std::string& target) {
        http::request<http::empty_body> req{http::verb::get, target, 11};
        req.set(http::field::host, host);
        req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
        req.set(http::field::accept, "application/json");
        return req;
    }

    bool isCleanShutdown(const beast::error_code& ec) {
        return !ec || ec == net::error::eof || ec == ssl::error::stream_truncated;
    }

} // namespace

std::string RemoteRecordFetcher::operator()(const std::string& id) const {
    const std::string target = config_.target_prefix + id;

    std::string body;
    try {
        body = fetchBody(target);
    } catch (const boost::system::system_error& e) {
        spdlog::warn("[RemoteRecordFetcher] GET {}:{}{} failed: {}",
                     config_.host, config_.port, target, e.what());
        return "Error fetching data from API";
    }

    auto record = decodeRecord(body);
    if (!record) {
        spdlog::warn("[RemoteRecordFetcher] Could not decode response for {} ({} bytes)",
                     target, body.size());
        return "Error decoding data from API";
    }
    return describe(*record);
}

std::string RemoteRecordFetcher::fetchBody(const std::string& target) const {
    net::io_context ioc;
    const auto timeout = std::chrono::milliseconds(config_.timeout_ms);

    tcp::resolver resolver(ioc);
    auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port));

    auto req = makeRequest(config_.host, target);
    beast::flat_buffer buffer;
    http::response<http::string_body> res;

    if (config_.use_tls) {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), config_.host.c_str())) {
            throw beast::system_error(
                beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category()),
                "sni");
        }
        stream.set_verify_callback(ssl::host_name_verification(config_.host));

        auto& lowest = beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        runStep(ioc, "connect", [&](auto handler) { lowest.async_connect(endpoints, std::move(handler)); });
        runStep(ioc, "handshake", [&](auto handler) {
            stream.async_handshake(ssl::stream_base::client, std::move(handler));
        });
        runStep(ioc, "write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
        runStep(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

        beast::error_code ec;
        stream.async_shutdown([&ec](beast::error_code e) { ec = e; });
        ioc.restart();
        ioc.run();
        if (!isCleanShutdown(ec)) {
            spdlog::debug("[RemoteRecordFetcher] TLS shutdown: {}", ec.message());
        }
    } else {
        beast::tcp_stream stream(ioc);
        stream.expires_after(timeout);
        runStep(ioc, "connect", [&](auto handler) { stream.async_connect(endpoints, std::move(handler)); });
        runStep(ioc, "write", [&](auto handler) { http::async_write(stream, req, std::move(handler)); });
        runStep(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, res, std::move(handler)); });

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        if (!isCleanShutdown(ec) && ec != beast::errc::not_connected) {
            spdlog::debug("[RemoteRecordFetcher] Socket shutdown: {}", ec.message());
        }
    }

    if (res.result_int() < 200 || res.result_int() >= 300) {
        spdlog::warn("[RemoteRecordFetcher] {} answered {} for {}", config_.host, res.result_int(), target);
    }
    return std::move(res.body());
}

std::optional<RemoteRecord> RemoteRecordFetcher::decodeRecord(std::string_view json) {
    try {
        std::istringstream in{std::string(json)};
        pt::ptree tree;
        pt::read_json(in, tree);

        RemoteRecord record;
        record.id = readMember<int>(tree, "id");
        record.userId = readMember<int>(tree, "userId");
        record.title = readMember<std::string>(tree, "title");
        record.body = readMember<std::string>(tree, "body");
        return record;
    } catch (const pt::ptree_error& e) {
        spdlog::debug("[RemoteRecordFetcher] JSON decode failed: {}", e.what());
        return std::nullopt;
    }
}

std::string RemoteRecordFetcher::describe(const RemoteRecord& record) {
    return fmt::format("Fetched post from API: {{{} {} {} {}}}",
                       record.id, record.userId, record.title, record.body);
}

} // namespace TickLoop
