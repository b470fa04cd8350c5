#pragma once

#include <optional>
#include <string>

namespace sb::sync {

// Namespaces our import ids among those of other tools writing to the same account.
constexpr const char* kImportIdPrefix = "splitwise_";

inline std::string makeImportId(const std::string& sourceId) { return kImportIdPrefix + sourceId; }

// The source id behind one of our import ids; nullopt for anything else, including empty ids.
std::optional<std::string> sourceIdFromImportId(const std::string& importId);

inline bool isOwnImportId(const std::string& importId) { return sourceIdFromImportId(importId).has_value(); }

}
