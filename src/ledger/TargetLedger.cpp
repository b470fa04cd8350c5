#include "ledger/TargetLedger.hpp"

#include <stdexcept>

std::string sb::ledger::to_string(const ItemStatus status) {
    switch (status) {
        case ItemStatus::Accepted: return "accepted";
        case ItemStatus::Rejected: return "rejected";
        case ItemStatus::DuplicatePerSink: return "duplicate";
        default: throw std::invalid_argument("Unknown ItemStatus enum value");
    }
}
