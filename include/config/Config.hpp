#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>
#include <nlohmann/json_fwd.hpp>

namespace sb::config {

struct SourceConfig {
    std::string base_url = "https://secure.splitwise.com/api/v3.0";
    std::string api_key;              // SPLITWISE_API_KEY
    unsigned int page_size = 100;
    int64_t user_id = 0;              // 0 = the authenticated user
    unsigned int timeout_seconds = 30;
};

struct SinkConfig {
    std::string base_url = "https://api.ynab.com/v1";
    std::string access_token;         // YNAB_ACCESS_TOKEN
    std::string budget_id = "last-used";
    std::string account_name = "Splitwise (Wallet)";
    unsigned int batch_size = 50;
    unsigned int memo_max_length = 200;
    unsigned int payee_max_length = 200;
    unsigned int lookback_days = 30;
    unsigned int timeout_seconds = 30;
};

struct SyncConfig {
    std::string start_date;           // YYYY-MM-DD, inclusive
    bool dry_run = false;
    bool skip_filter = false;
};

struct SubsystemLogLevelsConfig {
    spdlog::level::level_enum splitbridge = spdlog::level::info;  // run lifecycle and summary
    spdlog::level::level_enum source      = spdlog::level::info;  // expense fetches and parse rejects
    spdlog::level::level_enum sink        = spdlog::level::info;  // account lookup, batch outcomes
    spdlog::level::level_enum sync        = spdlog::level::info;  // derivation and duplicate decisions
    spdlog::level::level_enum http        = spdlog::level::warn;  // failed requests
    spdlog::level::level_enum config      = spdlog::level::warn;
};

struct LogLevelsConfig {
    spdlog::level::level_enum console_log_level = spdlog::level::info;
    spdlog::level::level_enum file_log_level = spdlog::level::debug;
    SubsystemLogLevelsConfig subsystem_levels;
};

struct LoggingConfig {
    std::filesystem::path log_dir;    // empty = console only
    LogLevelsConfig levels;
};

struct Config {
    SourceConfig source;
    SinkConfig sink;
    SyncConfig sync;
    LoggingConfig logging;
};

std::filesystem::path defaultConfigPath();

// Missing file yields the defaults; a malformed one throws ConfigurationError.
Config loadConfig(const std::filesystem::path& path);

// SPLITWISE_API_KEY, SPLITWISE_API_URL, YNAB_ACCESS_TOKEN, YNAB_API_URL,
// YNAB_ACCOUNT_NAME, YNAB_BUDGET_ID
void applyEnvironment(Config& cfg);

void validateConfig(const Config& cfg);

void to_json(nlohmann::json& j, const Config& c);
void to_json(nlohmann::json& j, const SourceConfig& c);
void to_json(nlohmann::json& j, const SinkConfig& c);
void to_json(nlohmann::json& j, const SyncConfig& c);
void to_json(nlohmann::json& j, const LoggingConfig& c);

}
