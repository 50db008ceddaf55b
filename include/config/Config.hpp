#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

namespace nl::config {

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum noxlayers = spdlog::level::info;   // Library-level events
    spdlog::level::level_enum config    = spdlog::level::warn;   // Loaded configuration, dumped at debug
    spdlog::level::level_enum labels    = spdlog::level::warn;   // Label overrides and gaps in the label table
};

struct LoggingConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::warn;
    std::optional<std::filesystem::path> file;   // no file sink unless set
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LayerLabelsConfig {
    bool use_default_labels = true;
    std::map<unsigned int, std::string> labels;   // index -> label, applied over the defaults
};

struct Config {
    LoggingConfig logging;
    LayerLabelsConfig layers;
};

Config loadConfig(const std::filesystem::path& path);
Config loadConfigFromString(const std::string& yaml);

std::string dumpConfig(const Config& config);

}
