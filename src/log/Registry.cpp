#include "log/Registry.hpp"
#include "config/ConfigRegistry.hpp"

#include <filesystem>
#include <stdexcept>
#include <vector>

using namespace nl::log;
using namespace nl::config;

void Registry::init() {
    if (initialized_) {
        spdlog::warn("[Registry] Already initialized, ignoring second init()");
        return;
    }

    const auto& cnf = ConfigRegistry::get().logging;

    // console
    console_sink_ = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink_->set_level(cnf.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks = { console_sink_ };

    // optional rotating file sink
    if (cnf.file) {
        namespace fs = std::filesystem;
        if (const auto dir = cnf.file->parent_path(); !dir.empty() && !fs::exists(dir))
            fs::create_directories(dir);

        file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(cnf.file->string(), max_bytes_, max_files_);
        file_sink_->set_level(cnf.file_log_level);
        file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        if (spdlog::get(name)) spdlog::drop(name);
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.subsystem_levels;
    makeLogger("noxlayers", sub_levels.noxlayers);
    makeLogger("config",    sub_levels.config);
    makeLogger("labels",    sub_levels.labels);

    initialized_ = true;

    config()->debug("[Registry] Loaded configuration:\n{}", dumpConfig(ConfigRegistry::get()));
    noxlayers()->info("[Registry] Initialized");
}

std::shared_ptr<spdlog::logger> Registry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[Registry] Registry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[Registry] Logger not found: " + name);
    }
    return logger;
}

bool Registry::isInitialized() { return initialized_; }
