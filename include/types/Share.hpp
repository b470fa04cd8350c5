#pragma once

#include "util/money.hpp"

namespace sb::types {

// A participant's position in one expense, in sink milliunits.
// net = paid - owed; positive means money comes back to the user.
struct ShareResult {
    util::Milliunits net{0};
    util::Milliunits paid{0};
    util::Milliunits owed{0};
    bool is_participant{false};

    [[nodiscard]] bool isZeroNet() const { return is_participant && net == 0; }
};

}
