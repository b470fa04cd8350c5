#include "logging/LogRegistry.hpp"

#include <stdexcept>
#include <vector>

namespace sb::logging {

void LogRegistry::init(const config::LoggingConfig& cnf) {
    if (initialized_) {
        spdlog::warn("[LogRegistry] Already initialized, ignoring second init()");
        return;
    }

    // stdout is reserved for the run summary
    console_sink_ = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink_->set_level(cnf.levels.console_log_level);
    console_sink_->set_color_mode(spdlog::color_mode::automatic);
    console_sink_->set_pattern(LOG_FORMAT);

    std::vector<spdlog::sink_ptr> sinks = { console_sink_ };

    if (!cnf.log_dir.empty()) {
        log_dir_ = cnf.log_dir;
        main_log_path_ = log_dir_ / "splitbridge.log";

        namespace fs = std::filesystem;
        if (!fs::exists(log_dir_)) fs::create_directories(log_dir_);

        main_file_sink_ = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            main_log_path_.string(), main_max_bytes_, main_max_files_);
        main_file_sink_->set_level(cnf.levels.file_log_level);
        main_file_sink_->set_pattern(LOG_FORMAT);
        sinks.push_back(main_file_sink_);
    }

    auto makeLogger = [&](const std::string& name, const spdlog::level::level_enum lvl) {
        const auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(lvl);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    };

    const auto& sub_levels = cnf.levels.subsystem_levels;
    makeLogger("splitbridge", sub_levels.splitbridge);
    makeLogger("source",      sub_levels.source);
    makeLogger("sink",        sub_levels.sink);
    makeLogger("sync",        sub_levels.sync);
    makeLogger("http",        sub_levels.http);
    makeLogger("config",      sub_levels.config);

    initialized_ = true;
    splitbridge()->debug("[LogRegistry] Initialized");
}

std::shared_ptr<spdlog::logger> LogRegistry::get(const std::string& name) {
    auto logger = spdlog::get(name);
    if (!logger) {
        if (!initialized_) throw std::runtime_error("[LogRegistry] LogRegistry not initialized, cannot get logger: " + name);
        throw std::runtime_error("[LogRegistry] Logger not found: " + name);
    }
    return logger;
}

bool LogRegistry::isInitialized() { return initialized_; }

void LogRegistry::setGlobalLevel(const spdlog::level::level_enum level) {
    if (!initialized_) return;
    console_sink_->set_level(level);
    spdlog::apply_all([level](const std::shared_ptr<spdlog::logger>& lg) { lg->set_level(level); });
}

}
