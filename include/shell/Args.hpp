#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <spdlog/common.h>

namespace sb::shell {

struct CliArgs {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> start_date;
    std::optional<std::string> select;
    std::optional<std::string> account;
    std::optional<std::string> log_level;
    bool dry_run = false;
    bool skip_filter = false;
    bool json = false;
    bool verbose = false;
    bool print_config = false;
    bool help = false;
};

struct ArgsParse {
    bool ok = false;
    CliArgs args;
    std::string error;
};

// argv without the program name; "--key=value" and "--key value" are equivalent.
ArgsParse parseArgs(const std::vector<std::string>& argv);
ArgsParse parseArgs(int argc, char** argv);

std::string usageText(const std::string& program = "splitbridge");

// debug, info, warning (or warn), error; case-insensitive
std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& text);

// CLI flags win over the config file and the environment.
void applyOverrides(const CliArgs& args, config::Config& cfg);

}
