#include <tickloop/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <array>
#include <algorithm>
#include <filesystem>
#include <limits>
#include <stdexcept>

namespace TickLoop {

namespace {

    std::runtime_error configError(const std::string& field, const std::string& what) {
        return std::runtime_error("config field '" + field + "': " + what);
    }

    YAML::Node child(const YAML::Node& parent, const char* key) {
        if (!parent || !parent.IsMap()) {
            return YAML::Node();
        }
        return parent[key];
    }

    template<typename T>
    T convert(const YAML::Node& node, const std::string& field) {
        if (!node.IsScalar()) {
            throw configError(field, "expected a scalar value");
        }
        try {
            return node.as<T>();
        } catch (const YAML::BadConversion&) {
            throw configError(field, "invalid type (" + node.Scalar() + ")");
        }
    }

    template<typename T>
    T requiredField(const YAML::Node& parent, const char* key, const std::string& field) {
        YAML::Node node = child(parent, key);
        if (!node) {
            throw configError(field, "missing required field");
        }
        return convert<T>(node, field);
    }

    template<typename T>
    T optionalField(const YAML::Node& parent, const char* key, const std::string& field, T fallback) {
        YAML::Node node = child(parent, key);
        if (!node) {
            return fallback;
        }
        return convert<T>(node, field);
    }

    long long inRange(long long value, long long lo, long long hi, const std::string& field) {
        if (value < lo || value > hi) {
            throw configError(field, "value " + std::to_string(value) + " outside [" +
                              std::to_string(lo) + ", " + std::to_string(hi) + "]");
        }
        return value;
    }

    void validateLevel(const std::string& level) {
        static const std::array<const char*, 7> levels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"
        };
        bool known = std::any_of(levels.begin(), levels.end(),
                                 [&](const char* l) { return level == l; });
        if (!known) {
            throw configError("logging.level", "unknown level '" + level + "'");
        }
    }

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    if (!std::filesystem::exists(filepath)) {
        throw std::runtime_error("config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("failed to parse config " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("config root must be a mapping: " + filepath);
    }

    AppConfig::AppConfiguration config;
    config.app_name = requiredField<std::string>(root, "app_name", "app_name");
    config.version = requiredField<std::string>(root, "version", "version");

    YAML::Node logging = child(root, "logging");
    config.logging.level = optionalField<std::string>(logging, "level", "logging.level", config.logging.level);
    validateLevel(config.logging.level);

    YAML::Node scheduler = child(root, "scheduler");
    if (!scheduler) {
        throw configError("scheduler", "missing required field");
    }
    config.scheduler.async_workers = static_cast<size_t>(inRange(
        requiredField<long long>(scheduler, "async_workers", "scheduler.async_workers"),
        1, 1024, "scheduler.async_workers"));

    YAML::Node collaborators = child(root, "collaborators");
    YAML::Node file = child(collaborators, "file");
    auto& fileCfg = config.collaborators.file;
    fileCfg.path = optionalField<std::string>(file, "path", "collaborators.file.path", fileCfg.path);
    fileCfg.placeholder = optionalField<std::string>(file, "placeholder", "collaborators.file.placeholder",
                                                fileCfg.placeholder);
    if (fileCfg.path.empty()) {
        throw configError("collaborators.file.path", "must not be empty");
    }

    YAML::Node fetcher = child(collaborators, "fetcher");
    auto& fetchCfg = config.collaborators.fetcher;
    fetchCfg.host = optionalField<std::string>(fetcher, "host", "collaborators.fetcher.host", fetchCfg.host);
    fetchCfg.port = static_cast<uint16_t>(inRange(
        optionalField<long long>(fetcher, "port", "collaborators.fetcher.port", fetchCfg.port),
        1, std::numeric_limits<uint16_t>::max(), "collaborators.fetcher.port"));
    fetchCfg.use_tls = optionalField<bool>(fetcher, "use_tls", "collaborators.fetcher.use_tls", fetchCfg.use_tls);
    fetchCfg.target_prefix = optionalField<std::string>(fetcher, "target_prefix",
                                                   "collaborators.fetcher.target_prefix",
                                                   fetchCfg.target_prefix);
    fetchCfg.record_id = optionalField<std::string>(fetcher, "record_id", "collaborators.fetcher.record_id",
                                               fetchCfg.record_id);
    fetchCfg.timeout_ms = static_cast<uint32_t>(inRange(
        optionalField<long long>(fetcher, "timeout_ms", "collaborators.fetcher.timeout_ms", fetchCfg.timeout_ms),
        1, 600000, "collaborators.fetcher.timeout_ms"));
    if (fetchCfg.host.empty()) {
        throw configError("collaborators.fetcher.host", "must not be empty");
    }

    spdlog::debug("[ConfigLoader] Loaded {} {} from {}", config.app_name, config.version, filepath);
    return config;
}

} // namespace TickLoop
