#include "config/Config.hpp"
#include "ledger/SplitwiseClient.hpp"
#include "ledger/YnabClient.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/Args.hpp"
#include "shell/InteractiveSelector.hpp"
#include "shell/Render.hpp"
#include "sync/Orchestrator.hpp"
#include "util/errors.hpp"

#include <unistd.h>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>

using namespace sb;
using namespace sb::config;
using namespace sb::logging;
using namespace sb::shell;

namespace {

constexpr int kExitOk = EXIT_SUCCESS;
constexpr int kExitFailed = EXIT_FAILURE;
constexpr int kExitUsage = 2;

void printError(const Error& e) {
    std::cerr << "Error: " << e.what() << "\n";
    if (!e.details().empty()) std::cerr << "   Details: " << e.details() << "\n";
}

std::shared_ptr<sync::CandidateSelector> makeSelector(const CliArgs& args, const Config& cfg,
                                                      const bool interactive, std::ostream& prompts) {
    if (args.select) return std::make_shared<sync::FixedSelector>(sync::IndexPredicate::parse(*args.select));
    if (cfg.sync.skip_filter || cfg.sync.dry_run || !interactive) return nullptr;
    return std::make_shared<InteractiveSelector>(std::cin, prompts);
}

}

int main(const int argc, char** argv) {
    const auto parsed = parseArgs(argc, argv);
    if (!parsed.ok) {
        std::cerr << "Error: " << parsed.error << "\n\n" << usageText();
        return kExitUsage;
    }

    const auto& args = parsed.args;
    if (args.help) {
        std::cout << usageText();
        return kExitOk;
    }

    try {
        const auto configPath = args.config_path.value_or(defaultConfigPath());
        if (args.config_path && !std::filesystem::exists(*args.config_path))
            throw ConfigurationError("Config file not found: " + args.config_path->string());

        auto cfg = loadConfig(configPath);
        applyEnvironment(cfg);
        applyOverrides(args, cfg);

        LogRegistry::init(cfg.logging);
        if (args.verbose) LogRegistry::setGlobalLevel(spdlog::level::debug);
        else if (args.log_level) LogRegistry::setGlobalLevel(*parseLogLevel(*args.log_level));
        LogRegistry::config()->debug("[main] Configuration loaded from {}", configPath.string());

        if (args.print_config) {
            std::cout << nlohmann::json(cfg).dump(2) << "\n";
            return kExitOk;
        }

        const bool interactive = ::isatty(STDIN_FILENO) == 1;
        std::ostream& prompts = args.json ? std::cerr : std::cout;

        if (cfg.sync.start_date.empty() && interactive) {
            if (const auto answer = promptLine(std::cin, prompts, "Enter start date for syncing expenses (YYYY-MM-DD)"))
                cfg.sync.start_date = *answer;
        }

        validateConfig(cfg);
        const auto opts = sync::RunOptions::fromConfig(cfg);

        std::shared_ptr<sync::CandidateSelector> selector;
        try {
            selector = makeSelector(args, cfg, interactive, prompts);
        } catch (const ValidationError& e) {
            printError(e);
            return kExitUsage;
        }

        LogRegistry::splitbridge()->info("[main] Syncing expenses from {} into '{}'{}", opts.start_date.str(),
                                         opts.account_name, opts.dry_run ? " (dry run)" : "");

        const auto transport = std::make_shared<http::CurlTransport>();
        const auto source = std::make_shared<ledger::SplitwiseClient>(cfg.source, transport);
        const auto target = std::make_shared<ledger::YnabClient>(cfg.sink, transport);

        sync::Orchestrator orchestrator(opts, source, target, selector);
        const auto report = orchestrator.run();

        if (args.json) std::cout << renderSummaryJson(report) << "\n";
        else {
            if (opts.dry_run && !report.planned.empty()) std::cout << "\n" << renderPreview(report.planned);
            std::cout << renderSummary(report);
        }

        return report.summary.succeeded() ? kExitOk : kExitFailed;
    } catch (const Error& e) {
        if (LogRegistry::isInitialized()) LogRegistry::splitbridge()->error("[main] {}", e.what());
        printError(e);
        return kExitFailed;
    } catch (const std::exception& e) {
        if (LogRegistry::isInitialized()) LogRegistry::splitbridge()->error("[main] Unexpected error: {}", e.what());
        std::cerr << "Unexpected error: " << e.what() << "\n";
        return kExitFailed;
    }
}
