#pragma once

#include "types/Date.hpp"
#include "util/money.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sb::types {

using UserId = std::int64_t;

struct Participant {
    UserId user_id{0};
    std::string first_name;
    std::string last_name;
    util::Micros paid{0};
    util::Micros owed{0};

    [[nodiscard]] std::string displayName() const;
};

// One shared expense as recorded by the source ledger, already typed.
struct RawExpense {
    std::string id;
    std::string description;
    util::Micros cost{0};
    std::string currency_code{"USD"};
    Date date;
    bool deleted{false};
    std::string notes;
    std::vector<Participant> participants;

    [[nodiscard]] const Participant* findParticipant(UserId user) const;
};

// A source user, as returned by the current-user lookup.
struct SourceUser {
    UserId id{0};
    std::string first_name;
    std::string last_name;
    std::string email;

    [[nodiscard]] std::string displayName() const;
};

}
