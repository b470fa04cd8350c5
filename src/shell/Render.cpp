#include "shell/Render.hpp"
#include "shell/Table.hpp"
#include "util/money.hpp"
#include "util/parse.hpp"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

using namespace sb::types;
using namespace sb::util;

namespace sb::shell {

namespace {

const std::string kRule(80, '-');

std::string previewMemo(const std::string& memo) {
    if (memo.size() <= kPreviewMemoWidth) return memo;
    return std::string(utf8Prefix(memo, kPreviewMemoWidth - 3)) + "...";
}

std::string headline(const RunSummary& s) {
    if (s.stage == Stage::Failed) return "Sync failed: " + s.fatal_error;
    if (s.cancelled) return "Import cancelled, YNAB was not modified";
    if (s.dry_run) return "Dry run completed - no transactions were imported";
    return "Sync completed successfully";
}

}

std::string renderPreview(const std::vector<CandidateTransaction>& transactions) {
    std::string out = "Transaction Preview:\n" + kRule + "\n";

    Milliunits total = 0;
    for (size_t i = 0; i < transactions.size(); ++i) {
        const auto& t = transactions[i];
        total += t.amount;
        out += fmt::format("{:2d}. {} | {:>10} | {}\n", i + 1, t.date.str(), formatSignedCurrency(t.amount), t.payee);
        out += fmt::format("     Memo: {}\n\n", previewMemo(t.memo));
    }

    out += kRule + "\n";
    out += "Total: " + formatSignedCurrency(total) + "\n";
    return out;
}

std::string renderSummary(const sync::RunReport& report) {
    const auto& s = report.summary;

    Table counts({{"Result"}, {"Count", Align::Right}});
    counts.add_row({"Expenses fetched", std::to_string(s.fetched)});
    counts.add_row({"Skipped (deleted)", std::to_string(s.skipped_deleted)});
    counts.add_row({"Skipped (not a participant)", std::to_string(s.skipped_not_participant)});
    counts.add_row({"Skipped (zero net share)", std::to_string(s.skipped_zero_net)});
    counts.add_row({"Candidates", std::to_string(s.candidates)});
    counts.add_row({"Duplicates skipped", std::to_string(s.duplicates)});
    if (s.ambiguous) counts.add_row({"Ambiguous (not imported)", std::to_string(s.ambiguous)});
    if (s.deselected) counts.add_row({"Not selected", std::to_string(s.deselected)});
    if (s.dry_run) counts.add_row({"Would import", std::to_string(report.planned.size())});
    else counts.add_row({"Imported", std::to_string(s.imported)});
    if (s.sink_duplicates) counts.add_row({"Already in YNAB", std::to_string(s.sink_duplicates)});
    counts.add_row({"Failed", std::to_string(s.failed)});

    std::string out = "\n" + headline(s) + "\n\n" + counts.render();

    Table issues({{"Kind"}, {"Expense"}, {"Reason", Align::Left, 1, 100}});
    for (const auto& i : s.issues) issues.add_row({sb::to_string(i.kind), i.source_id, i.reason});
    if (!issues.empty()) out += "\nIssues:\n" + issues.render();

    if (s.imported && !s.dry_run) out += "\nImported transactions are uncleared in YNAB for review.\n";
    return out;
}

std::string renderSummaryJson(const sync::RunReport& report) {
    nlohmann::json j = report.summary;
    j["transactions"] = report.planned;

    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto& o : report.outcomes) {
        nlohmann::json e = {{"import_id", o.import_id}, {"status", ledger::to_string(o.status)}};
        if (!o.reason.empty()) e["reason"] = o.reason;
        outcomes.push_back(std::move(e));
    }
    j["outcomes"] = std::move(outcomes);
    return j.dump(2);
}

}
