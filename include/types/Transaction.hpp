#pragma once

#include "types/Date.hpp"
#include "util/money.hpp"

#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sb::types {

enum class ClearedState { Uncleared, Cleared, Reconciled };

std::string to_string(ClearedState state);

// A transaction derived for the sink. Built once per run and never mutated.
struct CandidateTransaction {
    std::string import_id;
    std::string payee;
    util::Milliunits amount{0};
    std::string memo;
    Date date;
    ClearedState cleared{ClearedState::Uncleared};
    std::string source_id;   // not sent; kept for diagnostics
};

// Snapshot of a transaction already present in the sink account.
struct ImportedRecord {
    std::string import_id;   // empty for manually entered transactions
    util::Milliunits amount{0};
    std::string payee;
    Date date;
};

// sink wire form (account_id is added by the client)
void to_json(nlohmann::json& j, const CandidateTransaction& t);

}
