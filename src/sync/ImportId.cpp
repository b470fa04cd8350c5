#include "sync/ImportId.hpp"

#include <string_view>

namespace sb::sync {

std::optional<std::string> sourceIdFromImportId(const std::string& importId) {
    const std::string_view prefix = kImportIdPrefix;
    if (importId.size() <= prefix.size() || !importId.starts_with(prefix)) return std::nullopt;
    return importId.substr(prefix.size());
}

}
