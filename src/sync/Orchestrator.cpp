#include "sync/Orchestrator.hpp"
#include "sync/Deriver.hpp"
#include "sync/DuplicateResolver.hpp"
#include "logging/LogRegistry.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <unordered_map>
#include <fmt/format.h>

using namespace sb::sync;
using namespace sb::types;
using namespace sb::ledger;
using namespace sb::logging;

RunOptions RunOptions::fromConfig(const config::Config& cfg) {
    if (cfg.sync.start_date.empty()) throw ConfigurationError("Start date is required");

    RunOptions o;
    try {
        o.start_date = Date::parse(cfg.sync.start_date);
    } catch (const ValidationError& e) {
        throw ConfigurationError(e.what(), "Please use YYYY-MM-DD format (e.g., 2024-01-01)");
    }

    o.account_name = cfg.sink.account_name;
    o.user_id = cfg.source.user_id;
    o.dry_run = cfg.sync.dry_run;
    o.skip_filter = cfg.sync.skip_filter;
    o.batch_size = cfg.sink.batch_size;
    o.memo_max_length = cfg.sink.memo_max_length;
    o.payee_max_length = cfg.sink.payee_max_length;
    o.lookback_days = cfg.sink.lookback_days;
    return o;
}

Orchestrator::Orchestrator(RunOptions opts,
                           std::shared_ptr<SourceLedger> source,
                           std::shared_ptr<TargetLedger> target,
                           std::shared_ptr<CandidateSelector> selector)
    : opts_(std::move(opts)), source_(std::move(source)), target_(std::move(target)), selector_(std::move(selector)) {
    if (!source_ || !target_) throw std::invalid_argument("Orchestrator requires a source and a target ledger");
}

void Orchestrator::enter(const Stage stage, RunSummary& summary) {
    stage_ = stage;
    summary.stage = stage;
    LogRegistry::sync()->debug("[Orchestrator] Entering {}", to_string(stage));
}

RunReport Orchestrator::run() {
    RunReport report;
    auto& s = report.summary;
    s.dry_run = opts_.dry_run;

    try {
        enter(Stage::Fetching, s);

        UserId user = opts_.user_id;
        if (user == 0) {
            const auto me = source_->currentUser();
            user = me.id;
            LogRegistry::splitbridge()->info("[Orchestrator] Syncing for {} (id {})", me.displayName(), user);
        }

        const auto account = target_->findAccount(opts_.account_name);
        const auto feed = source_->fetchExpenses(opts_.start_date);
        const auto snapshot = target_->fetchAccountTransactions(
            account, opts_.start_date.addDays(-static_cast<int>(opts_.lookback_days)));
        s.fetched = feed.size();

        LogRegistry::splitbridge()->info("[Orchestrator] Fetched {} expenses since {}, {} existing transactions in '{}'",
                                         s.fetched, opts_.start_date.str(), snapshot.size(), account.name);

        enter(Stage::Deriving, s);
        const auto candidates = deriveAll(feed, user, s);
        s.candidates = candidates.size();

        enter(Stage::Resolving, s);
        auto res = DuplicateResolver::resolve(candidates, snapshot);
        s.duplicates = res.duplicates.size();
        s.ambiguous = res.ambiguous.size();
        for (const auto& c : res.collisions)
            s.recordIssue(ErrorKind::DuplicateCollision, c.source_id,
                          fmt::format("import id {} derived again at position {} (first at {})",
                                      c.import_id, c.position + 1, c.first_position + 1));

        std::ranges::stable_sort(res.importable, {}, &CandidateTransaction::date);
        report.duplicates = std::move(res.duplicates);
        report.ambiguous = std::move(res.ambiguous);
        report.planned = std::move(res.importable);

        if (!opts_.skip_filter && selector_ && !report.planned.empty()) {
            enter(Stage::Filtering, s);
            const auto predicate = selector_->select(report.planned);
            if (!predicate) {
                LogRegistry::splitbridge()->info("[Orchestrator] Selection cancelled, nothing imported");
                s.cancelled = true;
                s.deselected = report.planned.size();
                report.planned.clear();
                enter(Stage::Done, s);
                return report;
            }

            auto selected = predicate->apply(report.planned);
            s.deselected = report.planned.size() - selected.size();
            LogRegistry::sync()->info("[Orchestrator] Selection '{}' kept {} of {} candidates",
                                      predicate->str(), selected.size(), report.planned.size());
            report.planned = std::move(selected);
        }

        if (opts_.dry_run) {
            LogRegistry::splitbridge()->info("[Orchestrator] Dry run: {} transactions would be imported",
                                             report.planned.size());
            enter(Stage::Done, s);
            return report;
        }

        enter(Stage::Importing, s);
        importAll(account, report);
        if (s.stage != Stage::Failed) enter(Stage::Done, s);
    } catch (const Error& e) {
        const auto detail = e.details().empty() ? std::string(e.what()) : fmt::format("{} ({})", e.what(), e.details());
        LogRegistry::splitbridge()->error("[Orchestrator] Run failed in {}: {}", to_string(stage_), detail);
        s.fatal_error = detail;
        enter(Stage::Failed, s);
    } catch (const std::exception& e) {
        LogRegistry::splitbridge()->error("[Orchestrator] Unexpected error in {}: {}", to_string(stage_), e.what());
        s.fatal_error = e.what();
        enter(Stage::Failed, s);
    }

    LogRegistry::splitbridge()->info("[Orchestrator] Run finished in {}: {} imported, {} duplicates, {} failed",
                                     to_string(s.stage), s.imported, s.duplicates + s.sink_duplicates, s.failed);
    return report;
}

std::vector<CandidateTransaction> Orchestrator::deriveAll(const ExpenseFeed& feed, const UserId user,
                                                          RunSummary& summary) const {
    for (const auto& r : feed.rejected) {
        ++summary.failed;
        summary.recordIssue(ErrorKind::Validation, r.source_id, r.reason);
    }

    const DeriveOptions dopts{user, opts_.memo_max_length, opts_.payee_max_length};
    std::vector<CandidateTransaction> candidates;
    candidates.reserve(feed.expenses.size());

    for (const auto& expense : feed.expenses) {
        if (expense.deleted) {
            ++summary.skipped_deleted;
            continue;
        }

        try {
            auto item = derive(expense, dopts);
            LogRegistry::sync()->debug("[Orchestrator] Expense {} derived as {}", expense.id, to_string(item.kind));
            switch (item.kind) {
                case Derivation::NotParticipant: ++summary.skipped_not_participant; break;
                case Derivation::ZeroNet: ++summary.skipped_zero_net; break;
                case Derivation::Candidate: candidates.push_back(std::move(*item.transaction)); break;
            }
        } catch (const ValidationError& e) {
            const auto reason = e.details().empty() ? std::string(e.what()) : fmt::format("{}: {}", e.what(), e.details());
            LogRegistry::sync()->warn("[Orchestrator] Skipping expense {}: {}", expense.id, reason);
            ++summary.failed;
            summary.recordIssue(ErrorKind::Validation, expense.id, reason);
        }
    }

    LogRegistry::sync()->info("[Orchestrator] Derived {} candidates ({} not participant, {} zero net, {} deleted)",
                              candidates.size(), summary.skipped_not_participant, summary.skipped_zero_net,
                              summary.skipped_deleted);
    return candidates;
}

void Orchestrator::importAll(const AccountHandle& account, RunReport& report) {
    const auto& planned = report.planned;
    const size_t batchSize = std::max<size_t>(opts_.batch_size, 1);

    for (size_t offset = 0; offset < planned.size(); offset += batchSize) {
        const auto end = std::min(planned.size(), offset + batchSize);
        const std::vector<CandidateTransaction> batch(planned.begin() + static_cast<std::ptrdiff_t>(offset),
                                                      planned.begin() + static_cast<std::ptrdiff_t>(end));

        try {
            tally(batch, target_->createTransactions(account, batch), report);
        } catch (const PartialBatchError& e) {
            const auto answered = std::min(e.completed().size(), batch.size());
            const std::vector<CandidateTransaction> sent(batch.begin(),
                                                         batch.begin() + static_cast<std::ptrdiff_t>(answered));
            tally(sent, e.completed(), report);
            abandon(offset + answered, e.what(), report);
            return;
        } catch (const std::exception& e) {
            abandon(offset, e.what(), report);
            return;
        }
    }
}

void Orchestrator::abandon(const size_t from, const std::string& cause, RunReport& report) {
    auto& s = report.summary;
    const auto& planned = report.planned;
    const auto reason = fmt::format("not imported: {}", cause);
    for (size_t i = from; i < planned.size(); ++i) {
        ++s.failed;
        s.recordIssue(ErrorKind::Transport, planned[i].source_id, reason);
    }
    LogRegistry::splitbridge()->error("[Orchestrator] Import stopped at {} of {}, {} transactions left unsent: {}",
                                      from + 1, planned.size(), planned.size() - from, cause);
    s.fatal_error = cause;
    enter(Stage::Failed, s);
}

void Orchestrator::tally(const std::vector<CandidateTransaction>& batch,
                         const std::vector<ItemOutcome>& outcomes, RunReport& report) {
    auto& s = report.summary;

    std::unordered_map<std::string, const ItemOutcome*> byId;
    for (const auto& o : outcomes) byId.emplace(o.import_id, &o);

    for (const auto& t : batch) {
        const auto it = byId.find(t.import_id);
        if (it == byId.end()) {
            ++s.failed;
            s.recordIssue(ErrorKind::SinkRejection, t.source_id, "no outcome reported by sink");
            report.outcomes.push_back({t.import_id, ItemStatus::Rejected, "no outcome reported by sink"});
            continue;
        }

        const auto& o = *it->second;
        switch (o.status) {
            case ItemStatus::Accepted: ++s.imported; break;
            case ItemStatus::DuplicatePerSink: ++s.sink_duplicates; break;
            case ItemStatus::Rejected:
                ++s.failed;
                s.recordIssue(ErrorKind::SinkRejection, t.source_id, o.reason);
                break;
        }
        report.outcomes.push_back(o);
    }
}
