#pragma once

#include "types/Expense.hpp"
#include "types/Share.hpp"
#include "types/Transaction.hpp"

#include <cstddef>
#include <optional>

namespace sb::sync {

enum class Derivation { Candidate, NotParticipant, ZeroNet };

std::string to_string(Derivation d);

struct DerivedItem {
    Derivation kind{Derivation::NotParticipant};
    types::ShareResult share;
    std::optional<types::CandidateTransaction> transaction;   // set for Candidate only
};

struct DeriveOptions {
    types::UserId user{0};
    size_t memo_max_length{200};
    size_t payee_max_length{200};
};

// Maps one live expense to at most one candidate. Throws ValidationError for
// an empty id or a structurally broken expense.
DerivedItem derive(const types::RawExpense& expense, const DeriveOptions& opts);

std::string payeeFor(const types::RawExpense& expense, size_t maxLength);

}
