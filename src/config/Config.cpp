#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "types/Date.hpp"
#include "util/errors.hpp"

#include <cstdlib>
#include <regex>
#include <type_traits>
#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>

namespace sb::config {

namespace {

constexpr std::size_t kMinCredentialLength = 10;
constexpr unsigned int kMinMemoLength = 32;

void overrideFromEnv(const char* name, std::string& target) {
    if (const char* value = std::getenv(name); value && *value) target = value;
}

std::string redact(const std::string& secret) {
    if (secret.empty()) return "";
    if (secret.size() <= 4) return "****";
    return "****" + secret.substr(secret.size() - 4);
}

}

std::filesystem::path defaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        return std::filesystem::path(xdg) / "splitbridge" / "config.yaml";
    if (const char* home = std::getenv("HOME"); home && *home)
        return std::filesystem::path(home) / ".config" / "splitbridge" / "config.yaml";
    return "splitbridge.yaml";
}

Config loadConfig(const std::filesystem::path& path) {
    Config cfg;
    if (path.empty() || !std::filesystem::exists(path)) return cfg;

    try {
        const YAML::Node root = YAML::LoadFile(path.string());

        const auto section = [&](const char* name, auto& target) {
            const auto node = root[name];
            if (!node) return;
            if (!YAML::convert<std::decay_t<decltype(target)>>::decode(node, target))
                throw ConfigurationError("Invalid config file " + path.string(),
                                         std::string("section '") + name + "' must be a mapping");
        };

        if (!root.IsNull() && !root.IsMap())
            throw ConfigurationError("Invalid config file " + path.string(), "top level must be a mapping");

        section("source", cfg.source);
        section("sink", cfg.sink);
        section("sync", cfg.sync);
        section("logging", cfg.logging);
    } catch (const YAML::Exception& e) {
        throw ConfigurationError("Failed to load config file " + path.string(), e.what());
    }

    return cfg;
}

void applyEnvironment(Config& cfg) {
    overrideFromEnv("SPLITWISE_API_KEY", cfg.source.api_key);
    overrideFromEnv("SPLITWISE_API_URL", cfg.source.base_url);
    overrideFromEnv("YNAB_ACCESS_TOKEN", cfg.sink.access_token);
    overrideFromEnv("YNAB_API_URL", cfg.sink.base_url);
    overrideFromEnv("YNAB_ACCOUNT_NAME", cfg.sink.account_name);
    overrideFromEnv("YNAB_BUDGET_ID", cfg.sink.budget_id);
}

void validateConfig(const Config& cfg) {
    static const std::regex re_url(R"(^https?://[A-Za-z0-9.-]+(:\d{1,5})?(/.*)?$)");

    if (cfg.source.api_key.empty())
        throw ConfigurationError("Missing Splitwise API key", "Set SPLITWISE_API_KEY or source.api_key");
    if (cfg.source.api_key.size() < kMinCredentialLength)
        throw ConfigurationError("Invalid Splitwise API key format", "API key should be a long alphanumeric string");
    if (cfg.sink.access_token.empty())
        throw ConfigurationError("Missing YNAB access token", "Set YNAB_ACCESS_TOKEN or sink.access_token");
    if (cfg.sink.access_token.size() < kMinCredentialLength)
        throw ConfigurationError("Invalid YNAB access token format", "Access token should be a long alphanumeric string");

    if (cfg.sink.account_name.find_first_not_of(" \t") == std::string::npos)
        throw ConfigurationError("Invalid YNAB account name", "Account name cannot be empty");
    if (cfg.sink.budget_id.empty())
        throw ConfigurationError("Invalid YNAB budget id", "Use 'last-used' or a budget UUID");

    if (!std::regex_match(cfg.source.base_url, re_url))
        throw ConfigurationError("Invalid Splitwise API URL: " + cfg.source.base_url);
    if (!std::regex_match(cfg.sink.base_url, re_url))
        throw ConfigurationError("Invalid YNAB API URL: " + cfg.sink.base_url);

    if (cfg.source.page_size == 0) throw ConfigurationError("source.page_size must be positive");
    if (cfg.sink.batch_size == 0) throw ConfigurationError("sink.batch_size must be positive");
    if (cfg.sink.memo_max_length < kMinMemoLength)
        throw ConfigurationError("sink.memo_max_length must be at least " + std::to_string(kMinMemoLength));
    if (cfg.sink.payee_max_length == 0) throw ConfigurationError("sink.payee_max_length must be positive");

    if (cfg.sync.start_date.empty())
        throw ConfigurationError("Missing start date", "Pass --start-date YYYY-MM-DD or set sync.start_date");
    try {
        (void)types::Date::parse(cfg.sync.start_date);
    } catch (const ValidationError&) {
        throw ConfigurationError("Invalid start date: " + cfg.sync.start_date, "Use YYYY-MM-DD (e.g. 2024-01-01)");
    }
}

void to_json(nlohmann::json& j, const Config& c) {
    j = {
        {"source", c.source},
        {"sink", c.sink},
        {"sync", c.sync},
        {"logging", c.logging}
    };
}

void to_json(nlohmann::json& j, const SourceConfig& c) {
    j = {
        {"base_url", c.base_url},
        {"api_key", redact(c.api_key)},
        {"page_size", c.page_size},
        {"user_id", c.user_id},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const SinkConfig& c) {
    j = {
        {"base_url", c.base_url},
        {"access_token", redact(c.access_token)},
        {"budget_id", c.budget_id},
        {"account_name", c.account_name},
        {"batch_size", c.batch_size},
        {"memo_max_length", c.memo_max_length},
        {"payee_max_length", c.payee_max_length},
        {"lookback_days", c.lookback_days},
        {"timeout_seconds", c.timeout_seconds}
    };
}

void to_json(nlohmann::json& j, const SyncConfig& c) {
    j = {
        {"start_date", c.start_date},
        {"dry_run", c.dry_run},
        {"skip_filter", c.skip_filter}
    };
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    const auto level = [](const spdlog::level::level_enum l) {
        const auto sv = spdlog::level::to_string_view(l);
        return std::string(sv.data(), sv.size());
    };

    const auto& sub = c.levels.subsystem_levels;
    j = {
        {"log_dir", c.log_dir.string()},
        {"console_log_level", level(c.levels.console_log_level)},
        {"file_log_level", level(c.levels.file_log_level)},
        {"subsystem_levels", {
            {"splitbridge", level(sub.splitbridge)},
            {"source", level(sub.source)},
            {"sink", level(sub.sink)},
            {"sync", level(sub.sync)},
            {"http", level(sub.http)},
            {"config", level(sub.config)}
        }}
    };
}

}
