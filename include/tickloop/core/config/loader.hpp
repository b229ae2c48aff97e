#pragma once
#include <tickloop/core/config/app_config.hpp>
#include <string>

namespace TickLoop {

class ConfigLoader {
public:
    // Throws std::runtime_error on a missing file, missing required field,
    // wrongly typed field or out-of-range value
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);
};

} // namespace TickLoop
