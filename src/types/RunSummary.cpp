#include "types/RunSummary.hpp"

#include <stdexcept>
#include <nlohmann/json.hpp>

using namespace sb::types;

std::string sb::types::to_string(const Stage stage) {
    switch (stage) {
        case Stage::Fetching: return "FETCHING";
        case Stage::Deriving: return "DERIVING";
        case Stage::Resolving: return "RESOLVING";
        case Stage::Filtering: return "FILTERING";
        case Stage::Importing: return "IMPORTING";
        case Stage::Done: return "DONE";
        case Stage::Failed: return "FAILED";
        default: throw std::invalid_argument("Unknown Stage enum value");
    }
}

void RunSummary::recordIssue(const ErrorKind kind, std::string sourceId, std::string reason) {
    issues.push_back({kind, std::move(sourceId), std::move(reason)});
}

void sb::types::to_json(nlohmann::json& j, const Issue& i) {
    j = {
        {"kind", sb::to_string(i.kind)},
        {"source_id", i.source_id},
        {"reason", i.reason}
    };
}

void sb::types::to_json(nlohmann::json& j, const RunSummary& s) {
    j = {
        {"stage", to_string(s.stage)},
        {"dry_run", s.dry_run},
        {"cancelled", s.cancelled},
        {"counts", {
            {"fetched", s.fetched},
            {"skipped_deleted", s.skipped_deleted},
            {"skipped_not_participant", s.skipped_not_participant},
            {"skipped_zero_net", s.skipped_zero_net},
            {"candidates", s.candidates},
            {"duplicates", s.duplicates},
            {"ambiguous", s.ambiguous},
            {"deselected", s.deselected},
            {"imported", s.imported},
            {"sink_duplicates", s.sink_duplicates},
            {"failed", s.failed}
        }},
        {"issues", s.issues}
    };
    if (!s.fatal_error.empty()) j["error"] = s.fatal_error;
}
