#pragma once

#include <string>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace nl::config {

// spdlog::level::from_str maps anything it doesn't know to "off", which would silently
// mute a subsystem on a typo.
inline spdlog::level::level_enum parseLogLevel(const std::string& str) {
    if (str.empty()) throw std::invalid_argument("Log level cannot be empty");

    const auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off")
        throw std::invalid_argument("Invalid log level: " + str);
    return level;
}

inline std::string logLevelToString(const spdlog::level::level_enum level) {
    const auto sv = spdlog::level::to_string_view(level);
    return {sv.data(), sv.size()};
}

}
