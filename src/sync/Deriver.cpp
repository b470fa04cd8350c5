#include "sync/Deriver.hpp"
#include "sync/ImportId.hpp"
#include "sync/MemoFormatter.hpp"
#include "sync/ShareCalculator.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"

#include <stdexcept>

using namespace sb::types;

namespace sb::sync {

std::string to_string(const Derivation d) {
    switch (d) {
        case Derivation::Candidate: return "candidate";
        case Derivation::NotParticipant: return "not_participant";
        case Derivation::ZeroNet: return "zero_net";
        default: throw std::invalid_argument("Unknown Derivation enum value");
    }
}

std::string payeeFor(const RawExpense& expense, const size_t maxLength) {
    auto payee = util::trim(util::foldLineBreaks(expense.description));
    if (payee.empty()) payee = "Unknown Expense";
    return util::trim(util::utf8Prefix(payee, maxLength));
}

DerivedItem derive(const RawExpense& expense, const DeriveOptions& opts) {
    if (expense.id.empty()) throw ValidationError("Expense has no id");

    DerivedItem item;
    item.share = computeShare(expense, opts.user);

    if (!item.share.is_participant) {
        item.kind = Derivation::NotParticipant;
        return item;
    }

    if (item.share.isZeroNet()) {
        item.kind = Derivation::ZeroNet;
        return item;
    }

    CandidateTransaction t;
    t.import_id = makeImportId(expense.id);
    t.payee = payeeFor(expense, opts.payee_max_length);
    t.amount = item.share.net;
    t.memo = formatMemo(expense, item.share, opts.user, opts.memo_max_length);
    t.date = expense.date;
    t.cleared = ClearedState::Uncleared;
    t.source_id = expense.id;

    item.kind = Derivation::Candidate;
    item.transaction = std::move(t);
    return item;
}

}
