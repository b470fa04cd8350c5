#include "types/Expense.hpp"

#include <algorithm>
#include <cctype>

using namespace sb::types;

namespace {
std::string joinName(const std::string& first, const std::string& last) {
    std::string name = first;
    if (!first.empty() && !last.empty()) name += ' ';
    name += last;

    const auto notSpace = [](const unsigned char c) { return !std::isspace(c); };
    name.erase(name.begin(), std::ranges::find_if(name, notSpace));
    name.erase(std::find_if(name.rbegin(), name.rend(), notSpace).base(), name.end());
    return name;
}
}

std::string Participant::displayName() const { return joinName(first_name, last_name); }

std::string SourceUser::displayName() const { return joinName(first_name, last_name); }

const Participant* RawExpense::findParticipant(const UserId user) const {
    const auto it = std::ranges::find_if(participants, [user](const Participant& p) { return p.user_id == user; });
    return it == participants.end() ? nullptr : &*it;
}
