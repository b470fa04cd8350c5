#include "types/Transaction.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace sb::types;

std::string sb::types::to_string(const ClearedState state) {
    switch (state) {
        case ClearedState::Uncleared: return "uncleared";
        case ClearedState::Cleared: return "cleared";
        case ClearedState::Reconciled: return "reconciled";
        default: throw std::invalid_argument("Unknown ClearedState enum value");
    }
}

void sb::types::to_json(nlohmann::json& j, const CandidateTransaction& t) {
    j = {
        {"amount", t.amount},
        {"payee_name", t.payee},
        {"memo", t.memo},
        {"date", t.date.str()},
        {"import_id", t.import_id},
        {"cleared", to_string(t.cleared)}
    };
}
