#pragma once

#include "types/Expense.hpp"
#include "types/Share.hpp"

namespace sb::sync {

// How far the paid and owed sums may drift from the cost before an expense is refused.
constexpr util::Micros kBalanceTolerance = 10'000;   // one cent

/**
 * The target user's share of one expense.
 *
 * Not a participant yields is_participant = false. Throws ValidationError when
 * the user is listed twice or the participant sums do not match the cost.
 */
types::ShareResult computeShare(const types::RawExpense& expense, types::UserId user);

[[nodiscard]] bool isBalanced(const types::RawExpense& expense);

}
