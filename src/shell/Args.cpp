#include "shell/Args.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace sb::shell {

namespace {

constexpr std::array kValueFlags = {"--config", "--start-date", "--select", "--account", "--log-level"};

bool takesValue(const std::string_view flag) {
    return std::ranges::any_of(kValueFlags, [flag](const char* f) { return flag == f; });
}

// Split --key=value so every flag and value is its own token
std::vector<std::string> normalize(const std::vector<std::string>& argv) {
    std::vector<std::string> out;
    out.reserve(argv.size() + 4);
    for (const auto& a : argv) {
        if (a.rfind("--", 0) == 0) {
            if (const auto eq = a.find('='); eq != std::string::npos) {
                out.emplace_back(a.substr(0, eq));
                out.emplace_back(a.substr(eq + 1));
                continue;
            }
        }
        out.emplace_back(a);
    }
    return out;
}

ArgsParse invalid(std::string msg) {
    ArgsParse p;
    p.error = std::move(msg);
    return p;
}

}

ArgsParse parseArgs(const std::vector<std::string>& argv) {
    const auto toks = normalize(argv);
    ArgsParse p;
    auto& a = p.args;

    for (size_t i = 0; i < toks.size(); ++i) {
        const auto& flag = toks[i];

        if (takesValue(flag)) {
            if (i + 1 >= toks.size()) return invalid("Option " + flag + " requires a value");
            const auto& value = toks[++i];
            if (flag == "--config") a.config_path = value;
            else if (flag == "--start-date") a.start_date = value;
            else if (flag == "--select") a.select = value;
            else if (flag == "--account") a.account = value;
            else if (flag == "--log-level") {
                if (!parseLogLevel(value)) return invalid("Invalid log level: " + value);
                a.log_level = value;
            }
            continue;
        }

        if (flag == "--dry-run") a.dry_run = true;
        else if (flag == "--skip-filter") a.skip_filter = true;
        else if (flag == "--json") a.json = true;
        else if (flag == "--verbose" || flag == "-v") a.verbose = true;
        else if (flag == "--print-config") a.print_config = true;
        else if (flag == "--help" || flag == "-h") a.help = true;
        else if (flag.rfind('-', 0) == 0) return invalid("Unknown option: " + flag);
        else return invalid("Unexpected argument: " + flag);
    }

    p.ok = true;
    return p;
}

ArgsParse parseArgs(const int argc, char** argv) {
    std::vector<std::string> args;
    args.reserve(argc > 1 ? static_cast<size_t>(argc) - 1 : 0);
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parseArgs(args);
}

std::string usageText(const std::string& program) {
    return "Usage: " + program + R"usage( [options]

Sync Splitwise expenses to YNAB. Each expense you share in becomes one
transaction in your YNAB account carrying your net share.

Options:
  --config PATH           Config file (default: ~/.config/splitbridge/config.yaml)
  --start-date YYYY-MM-DD Sync expenses dated on or after this day (prompted if omitted)
  --dry-run               Preview transactions without importing them to YNAB
  --skip-filter           Import every new transaction without the selection menu
  --select EXPR           Non-interactive selection: all, <N, >N, A-B or a list like 1,3-5
  --account NAME          YNAB account to import into (default: "Splitwise (Wallet)")
  --json                  Print the run summary as JSON
  --verbose, -v           Enable debug logging
  --log-level LEVEL       debug, info, warning or error (default: info)
  --print-config          Print the effective configuration (secrets redacted) and exit
  --help, -h              Show this message

Environment:
  SPLITWISE_API_KEY, YNAB_ACCESS_TOKEN    API credentials (required)
  YNAB_ACCOUNT_NAME, YNAB_BUDGET_ID       Target account and budget
  SPLITWISE_API_URL, YNAB_API_URL         API base URLs
)usage";
}

std::optional<spdlog::level::level_enum> parseLogLevel(const std::string& text) {
    std::string s = text;
    std::ranges::transform(s, s.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (s == "trace") return spdlog::level::trace;
    if (s == "debug") return spdlog::level::debug;
    if (s == "info") return spdlog::level::info;
    if (s == "warning" || s == "warn") return spdlog::level::warn;
    if (s == "error" || s == "err") return spdlog::level::err;
    if (s == "critical") return spdlog::level::critical;
    if (s == "off") return spdlog::level::off;
    return std::nullopt;
}

void applyOverrides(const CliArgs& args, config::Config& cfg) {
    if (args.start_date) cfg.sync.start_date = *args.start_date;
    if (args.account) cfg.sink.account_name = *args.account;
    if (args.dry_run) cfg.sync.dry_run = true;
    if (args.skip_filter) cfg.sync.skip_filter = true;

    if (args.verbose) cfg.logging.levels.console_log_level = spdlog::level::debug;
    else if (args.log_level) {
        if (const auto lvl = parseLogLevel(*args.log_level)) cfg.logging.levels.console_log_level = *lvl;
    }
}

}
