#include "sync/DuplicateResolver.hpp"
#include "sync/ImportId.hpp"
#include "logging/LogRegistry.hpp"

#include <set>
#include <tuple>
#include <unordered_map>
#include <unordered_set>

using namespace sb::sync;
using namespace sb::types;
using namespace sb::logging;

namespace {

using ContentKey = std::tuple<sb::util::Milliunits, Date, std::string>;

ContentKey keyOf(const CandidateTransaction& t) { return {t.amount, t.date, t.payee}; }
ContentKey keyOf(const ImportedRecord& r) { return {r.amount, r.date, r.payee}; }

}

Resolution DuplicateResolver::resolve(const std::vector<CandidateTransaction>& candidates,
                                      const std::vector<ImportedRecord>& snapshot) {
    std::unordered_set<std::string> knownIds;
    std::set<ContentKey> untaggedContent;

    for (const auto& r : snapshot) {
        if (!r.import_id.empty()) knownIds.insert(r.import_id);
        if (!isOwnImportId(r.import_id)) untaggedContent.insert(keyOf(r));
    }

    Resolution res;
    std::unordered_map<std::string, size_t> seen;   // import id -> first position

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& c = candidates[i];

        if (knownIds.contains(c.import_id)) {
            LogRegistry::sync()->debug("[DuplicateResolver] {} already imported", c.import_id);
            res.duplicates.push_back(c);
            continue;
        }

        if (const auto [it, inserted] = seen.try_emplace(c.import_id, i); !inserted) {
            LogRegistry::sync()->warn("[DuplicateResolver] import id {} produced twice (positions {} and {})",
                                      c.import_id, it->second + 1, i + 1);
            res.collisions.push_back({c.import_id, c.source_id, it->second, i});
            res.ambiguous.push_back(c);
            continue;
        }

        if (untaggedContent.contains(keyOf(c))) {
            LogRegistry::sync()->info("[DuplicateResolver] {} matches a manually entered transaction ({} on {})",
                                      c.import_id, c.payee, c.date.str());
            ++res.content_matches;
            res.duplicates.push_back(c);
            continue;
        }

        res.importable.push_back(c);
    }

    LogRegistry::sync()->info("[DuplicateResolver] {} importable, {} duplicates ({} by content), {} ambiguous",
                              res.importable.size(), res.duplicates.size(), res.content_matches, res.ambiguous.size());
    return res;
}
