#pragma once

#include "config/Config.hpp"
#include "ledger/SourceLedger.hpp"
#include "ledger/TargetLedger.hpp"
#include "sync/Selection.hpp"
#include "types/RunSummary.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sb::sync {

// Everything a run needs to know, fixed at construction.
struct RunOptions {
    types::Date start_date;
    std::string account_name = "Splitwise (Wallet)";
    types::UserId user_id{0};          // 0 = the source's authenticated user
    bool dry_run{false};
    bool skip_filter{false};
    size_t batch_size{50};
    size_t memo_max_length{200};
    size_t payee_max_length{200};
    unsigned int lookback_days{30};    // snapshot margin before start_date

    // Throws ConfigurationError when the start date is missing or unparseable.
    static RunOptions fromConfig(const config::Config& cfg);
};

struct RunReport {
    types::RunSummary summary;
    std::vector<types::CandidateTransaction> planned;      // submitted, or would be in a dry run
    std::vector<types::CandidateTransaction> duplicates;
    std::vector<types::CandidateTransaction> ambiguous;
    std::vector<ledger::ItemOutcome> outcomes;
};

/**
 * Drives one sync run:
 *
 *   FETCHING -> DERIVING -> RESOLVING -> (FILTERING) -> IMPORTING -> DONE
 *
 * with FAILED reachable from every stage. run() does not throw; fatal errors
 * end the run in FAILED with RunSummary::fatal_error set and the counters
 * reflecting the work completed so far.
 */
class Orchestrator {
public:
    Orchestrator(RunOptions opts,
                 std::shared_ptr<ledger::SourceLedger> source,
                 std::shared_ptr<ledger::TargetLedger> target,
                 std::shared_ptr<CandidateSelector> selector = nullptr);

    RunReport run();

    [[nodiscard]] types::Stage stage() const { return stage_; }
    [[nodiscard]] const RunOptions& options() const { return opts_; }

private:
    const RunOptions opts_;
    std::shared_ptr<ledger::SourceLedger> source_;
    std::shared_ptr<ledger::TargetLedger> target_;
    std::shared_ptr<CandidateSelector> selector_;
    types::Stage stage_{types::Stage::Fetching};

    void enter(types::Stage stage, types::RunSummary& summary);

    std::vector<types::CandidateTransaction> deriveAll(const ledger::ExpenseFeed& feed, types::UserId user,
                                                       types::RunSummary& summary) const;

    void importAll(const ledger::AccountHandle& account, RunReport& report);

    // Fails every planned transaction from index `from` on and ends the run.
    void abandon(size_t from, const std::string& cause, RunReport& report);

    static void tally(const std::vector<types::CandidateTransaction>& batch,
                      const std::vector<ledger::ItemOutcome>& outcomes, RunReport& report);
};

}
