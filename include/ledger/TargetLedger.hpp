#pragma once

#include "types/Date.hpp"
#include "types/Transaction.hpp"
#include "util/errors.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sb::ledger {

struct AccountHandle {
    std::string id;
    std::string name;
};

enum class ItemStatus { Accepted, Rejected, DuplicatePerSink };

std::string to_string(ItemStatus status);

struct ItemOutcome {
    std::string import_id;
    ItemStatus status{ItemStatus::Accepted};
    std::string reason;      // set for Rejected
};

// Transport failure part-way through a batch. completed() holds the outcomes
// of the leading items the sink answered before the failure, in submission order.
class PartialBatchError : public TransportError {
public:
    PartialBatchError(const TransportError& cause, std::vector<ItemOutcome> completed)
        : TransportError(cause.what(), cause.details(), cause.httpStatus()), completed_(std::move(completed)) {}

    [[nodiscard]] const std::vector<ItemOutcome>& completed() const { return completed_; }

private:
    std::vector<ItemOutcome> completed_;
};

// Read/write side of the budgeting service.
class TargetLedger {
public:
    virtual ~TargetLedger() = default;

    // Throws AccountNotFoundError when no open account has this name.
    virtual AccountHandle findAccount(const std::string& name) = 0;

    virtual std::vector<types::ImportedRecord> fetchAccountTransactions(
        const AccountHandle& account, const std::optional<types::Date>& since) = 0;

    // One outcome per submitted transaction, in submission order.
    // Throws TransportError when the batch could not be delivered, or
    // PartialBatchError when only some of it was.
    virtual std::vector<ItemOutcome> createTransactions(
        const AccountHandle& account, const std::vector<types::CandidateTransaction>& transactions) = 0;
};

}
