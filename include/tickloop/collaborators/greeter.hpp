#pragma once
#include <string>

namespace TickLoop {

inline std::string greet(const std::string& payload) {
    return "Hello! " + payload;
}

} // namespace TickLoop
