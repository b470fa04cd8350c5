#pragma once

#include "types/Date.hpp"
#include "types/Expense.hpp"

#include <string>
#include <vector>

namespace sb::ledger {

// An expense the client could not turn into a RawExpense.
struct RejectedExpense {
    std::string source_id;   // "unknown" when the id itself is unreadable
    std::string reason;
};

struct ExpenseFeed {
    std::vector<types::RawExpense> expenses;
    std::vector<RejectedExpense> rejected;

    [[nodiscard]] std::size_t size() const { return expenses.size() + rejected.size(); }
};

// Read side of the shared-expense service.
class SourceLedger {
public:
    virtual ~SourceLedger() = default;

    virtual types::SourceUser currentUser() = 0;

    // Every expense dated on or after `since`, across all pages.
    virtual ExpenseFeed fetchExpenses(const types::Date& since) = 0;
};

}
