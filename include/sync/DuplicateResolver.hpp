#pragma once

#include "types/Transaction.hpp"

#include <string>
#include <vector>

namespace sb::sync {

struct Collision {
    std::string import_id;
    std::string source_id;
    size_t first_position{};   // 0-based positions in the candidate sequence
    size_t position{};
};

struct Resolution {
    std::vector<types::CandidateTransaction> importable;
    std::vector<types::CandidateTransaction> duplicates;
    std::vector<types::CandidateTransaction> ambiguous;
    std::vector<Collision> collisions;
    size_t content_matches{};   // duplicates found by the (amount, date, payee) fallback
};

/**
 * Partitions the run's candidates against the sink snapshot.
 *
 *  1. import id already in the snapshot        -> duplicate
 *  2. import id produced earlier in this run    -> ambiguous, collision recorded
 *  3. exact (amount, date, payee) match against a
 *     snapshot record without one of our ids    -> duplicate
 *  4. otherwise                                 -> importable
 *
 * Relative order is preserved within each group. Tier 3 can match two
 * genuinely distinct expenses with identical amount, date and payee.
 */
struct DuplicateResolver {
    static Resolution resolve(const std::vector<types::CandidateTransaction>& candidates,
                              const std::vector<types::ImportedRecord>& snapshot);
};

}
