#pragma once

#include "util/errors.hpp"

#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace sb::types {

enum class Stage { Fetching, Deriving, Resolving, Filtering, Importing, Done, Failed };

std::string to_string(Stage stage);

// A per-item problem kept for the final report.
struct Issue {
    ErrorKind kind{ErrorKind::Validation};
    std::string source_id;
    std::string reason;
};

struct RunSummary {
    uint64_t fetched{};
    uint64_t skipped_deleted{};
    uint64_t skipped_not_participant{};
    uint64_t skipped_zero_net{};
    uint64_t candidates{};
    uint64_t duplicates{};
    uint64_t ambiguous{};
    uint64_t deselected{};
    uint64_t imported{};
    uint64_t sink_duplicates{};
    uint64_t failed{};

    std::vector<Issue> issues;

    Stage stage{Stage::Fetching};
    bool dry_run{false};
    bool cancelled{false};
    std::string fatal_error;

    void recordIssue(ErrorKind kind, std::string sourceId, std::string reason);

    [[nodiscard]] bool succeeded() const { return stage == Stage::Done; }
};

void to_json(nlohmann::json& j, const Issue& i);
void to_json(nlohmann::json& j, const RunSummary& s);

}
