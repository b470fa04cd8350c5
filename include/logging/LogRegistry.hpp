#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace sb::logging {

class LogRegistry {
public:
    // Initialize all loggers with sinks/levels.
    static void init(const config::LoggingConfig& cnf = {});

    // Generic access by name
    static std::shared_ptr<spdlog::logger> get(const std::string& name);

    // Subsystem shorthands
    static std::shared_ptr<spdlog::logger> splitbridge() { return get("splitbridge"); }
    static std::shared_ptr<spdlog::logger> source()      { return get("source"); }
    static std::shared_ptr<spdlog::logger> sink()        { return get("sink"); }
    static std::shared_ptr<spdlog::logger> sync()        { return get("sync"); }
    static std::shared_ptr<spdlog::logger> http()        { return get("http"); }
    static std::shared_ptr<spdlog::logger> config()      { return get("config"); }

    [[nodiscard]] static bool isInitialized();

    // Raise or lower every subsystem at once (--verbose, --log-level).
    static void setGlobalLevel(spdlog::level::level_enum level);

private:
    static constexpr const auto* LOG_FORMAT = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v";

    static inline bool initialized_ = false;

    static inline std::filesystem::path log_dir_;
    static inline std::filesystem::path main_log_path_;

    static inline std::shared_ptr<spdlog::sinks::stderr_color_sink_mt> console_sink_;
    static inline std::shared_ptr<spdlog::sinks::rotating_file_sink_mt> main_file_sink_;

    static inline size_t main_max_bytes_ = 10 * 1024 * 1024; // 10 MiB
    static inline size_t main_max_files_ = 5;
};

}
