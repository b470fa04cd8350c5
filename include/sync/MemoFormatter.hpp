#pragma once

#include "types/Expense.hpp"
#include "types/Share.hpp"

#include <cstddef>
#include <string>

namespace sb::sync {

constexpr size_t kDefaultMemoLength = 200;
constexpr const char* kMemoDelimiter = " | ";

/**
 * Single-line memo for the target user's share of an expense:
 *
 *   Paid: $25.00, Owed: $12.50 | Users: Jane Smith | Notes: ... | Splitwise ID: 67890
 *
 * Each segment appears only when it has content. When the memo exceeds
 * maxLength bytes the leading segments are shortened first so the ID
 * segment survives. Never throws.
 */
std::string formatMemo(const types::RawExpense& expense, const types::ShareResult& share,
                       types::UserId target, size_t maxLength = kDefaultMemoLength);

// Fits a composed memo to maxLength, keeping the trailing idSegment intact.
std::string truncateMemo(const std::string& leading, const std::string& idSegment, size_t maxLength);

}
