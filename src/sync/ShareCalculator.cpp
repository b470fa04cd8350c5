#include "sync/ShareCalculator.hpp"
#include "util/errors.hpp"

#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>

using namespace sb::types;
using namespace sb::util;

namespace sb::sync {

bool isBalanced(const RawExpense& expense) {
    Micros paid = 0, owed = 0;
    for (const auto& p : expense.participants) {
        paid += p.paid;
        owed += p.owed;
    }
    return std::llabs(paid - expense.cost) <= kBalanceTolerance &&
           std::llabs(owed - expense.cost) <= kBalanceTolerance;
}

ShareResult computeShare(const RawExpense& expense, const UserId user) {
    const auto* p = expense.findParticipant(user);
    if (!p) return {};

    const auto occurrences = std::ranges::count_if(expense.participants,
                                                   [user](const Participant& q) { return q.user_id == user; });
    if (occurrences > 1)
        throw ValidationError("Participant listed more than once",
                              fmt::format("user {} appears {} times in expense {}", user, occurrences, expense.id));

    if (!isBalanced(expense))
        throw ValidationError("Participant shares do not balance",
                              fmt::format("expense {} has cost {} that does not match the paid/owed sums",
                                          expense.id, formatDecimal(toMilliunits(expense.cost))));

    ShareResult r;
    r.is_participant = true;
    r.paid = toMilliunits(p->paid);
    r.owed = toMilliunits(p->owed);
    // from the rounded parts, so net == paid - owed holds exactly in milliunits
    r.net = r.paid - r.owed;
    return r;
}

}
