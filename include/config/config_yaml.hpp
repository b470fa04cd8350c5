#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace sb::config;

template<>
struct convert<SourceConfig> {
    static Node encode(const SourceConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["page_size"] = rhs.page_size;
        node["user_id"] = rhs.user_id;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, SourceConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("https://secure.splitwise.com/api/v3.0");
        rhs.api_key = node["api_key"].as<std::string>("");
        rhs.page_size = node["page_size"].as<unsigned int>(100);
        rhs.user_id = node["user_id"].as<int64_t>(0);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        return true;
    }
};

template<>
struct convert<SinkConfig> {
    static Node encode(const SinkConfig& rhs) {
        Node node;
        node["base_url"] = rhs.base_url;
        node["budget_id"] = rhs.budget_id;
        node["account_name"] = rhs.account_name;
        node["batch_size"] = rhs.batch_size;
        node["memo_max_length"] = rhs.memo_max_length;
        node["payee_max_length"] = rhs.payee_max_length;
        node["lookback_days"] = rhs.lookback_days;
        node["timeout_seconds"] = rhs.timeout_seconds;
        return node;
    }

    static bool decode(const Node& node, SinkConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.base_url = node["base_url"].as<std::string>("https://api.ynab.com/v1");
        rhs.access_token = node["access_token"].as<std::string>("");
        rhs.budget_id = node["budget_id"].as<std::string>("last-used");
        rhs.account_name = node["account_name"].as<std::string>("Splitwise (Wallet)");
        rhs.batch_size = node["batch_size"].as<unsigned int>(50);
        rhs.memo_max_length = node["memo_max_length"].as<unsigned int>(200);
        rhs.payee_max_length = node["payee_max_length"].as<unsigned int>(200);
        rhs.lookback_days = node["lookback_days"].as<unsigned int>(30);
        rhs.timeout_seconds = node["timeout_seconds"].as<unsigned int>(30);
        return true;
    }
};

template<>
struct convert<SyncConfig> {
    static Node encode(const SyncConfig& rhs) {
        Node node;
        node["start_date"] = rhs.start_date;
        node["dry_run"] = rhs.dry_run;
        node["skip_filter"] = rhs.skip_filter;
        return node;
    }

    static bool decode(const Node& node, SyncConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.start_date = node["start_date"].as<std::string>("");
        rhs.dry_run = node["dry_run"].as<bool>(false);
        rhs.skip_filter = node["skip_filter"].as<bool>(false);
        return true;
    }
};

static std::string to_std_string(const spdlog::string_view_t sv) { return {sv.data(), sv.size()}; }

template<>
struct convert<SubsystemLogLevelsConfig> {
    static Node encode(const SubsystemLogLevelsConfig& rhs) {
        Node node;
        node["splitbridge"] = to_std_string(spdlog::level::to_string_view(rhs.splitbridge));
        node["source"]      = to_std_string(spdlog::level::to_string_view(rhs.source));
        node["sink"]        = to_std_string(spdlog::level::to_string_view(rhs.sink));
        node["sync"]        = to_std_string(spdlog::level::to_string_view(rhs.sync));
        node["http"]        = to_std_string(spdlog::level::to_string_view(rhs.http));
        node["config"]      = to_std_string(spdlog::level::to_string_view(rhs.config));
        return node;
    }

    static bool decode(const Node& node, SubsystemLogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.splitbridge = spdlog::level::from_str(node["splitbridge"].as<std::string>("info"));
        rhs.source = spdlog::level::from_str(node["source"].as<std::string>("info"));
        rhs.sink = spdlog::level::from_str(node["sink"].as<std::string>("info"));
        rhs.sync = spdlog::level::from_str(node["sync"].as<std::string>("info"));
        rhs.http = spdlog::level::from_str(node["http"].as<std::string>("warn"));
        rhs.config = spdlog::level::from_str(node["config"].as<std::string>("warn"));
        return true;
    }
};

template<>
struct convert<LogLevelsConfig> {
    static Node encode(const LogLevelsConfig& rhs) {
        Node node;
        node["console_log_level"] = to_std_string(spdlog::level::to_string_view(rhs.console_log_level));
        node["file_log_level"]    = to_std_string(spdlog::level::to_string_view(rhs.file_log_level));
        node["subsystem_levels"]  = rhs.subsystem_levels;
        return node;
    }

    static bool decode(const Node& node, LogLevelsConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.console_log_level = spdlog::level::from_str(node["console_log_level"].as<std::string>("info"));
        rhs.file_log_level = spdlog::level::from_str(node["file_log_level"].as<std::string>("debug"));
        if (node["subsystem_levels"]) rhs.subsystem_levels = node["subsystem_levels"].as<SubsystemLogLevelsConfig>();
        return true;
    }
};

template<>
struct convert<LoggingConfig> {
    static Node encode(const LoggingConfig& rhs) {
        Node node;
        node["log_dir"] = rhs.log_dir.string();
        node["log_levels"] = rhs.levels;
        return node;
    }

    static bool decode(const Node& node, LoggingConfig& rhs) {
        if (!node.IsMap()) return false;
        rhs.log_dir = node["log_dir"].as<std::string>("");
        if (node["log_levels"]) rhs.levels = node["log_levels"].as<LogLevelsConfig>();
        return true;
    }
};

}
