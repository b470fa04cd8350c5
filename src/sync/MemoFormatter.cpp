#include "sync/MemoFormatter.hpp"
#include "util/parse.hpp"

#include <fmt/format.h>

using namespace sb::types;
using namespace sb::util;

namespace {
constexpr std::string_view kEllipsis = "...";

std::string join(const std::vector<std::string>& parts, const std::string_view delim) {
    std::string out;
    for (const auto& p : parts) {
        if (!out.empty()) out += delim;
        out += p;
    }
    return out;
}
}

namespace sb::sync {

std::string truncateMemo(const std::string& leading, const std::string& idSegment, const size_t maxLength) {
    const std::string_view delim = kMemoDelimiter;

    if (idSegment.empty()) {
        if (leading.size() <= maxLength) return leading;
        if (maxLength <= kEllipsis.size()) return std::string(utf8Prefix(leading, maxLength));
        return std::string(utf8Prefix(leading, maxLength - kEllipsis.size())) + std::string(kEllipsis);
    }

    if (leading.empty()) return std::string(utf8Prefix(idSegment, maxLength));

    const auto full = leading.size() + delim.size() + idSegment.size();
    if (full <= maxLength) return leading + std::string(delim) + idSegment;

    const auto reserved = delim.size() + idSegment.size() + kEllipsis.size();
    if (reserved >= maxLength) return std::string(utf8Prefix(idSegment, maxLength));

    auto head = trim(utf8Prefix(leading, maxLength - reserved));
    while (!head.empty() && (head.back() == '|' || head.back() == ',')) head = trim(head.substr(0, head.size() - 1));
    if (head.empty()) return idSegment;

    return head + std::string(kEllipsis) + std::string(delim) + idSegment;
}

std::string formatMemo(const RawExpense& expense, const ShareResult& share, const UserId target, const size_t maxLength) {
    std::vector<std::string> leading;

    if (share.is_participant)
        leading.push_back(fmt::format("Paid: {}, Owed: {}",
                                      formatCurrency(share.paid, expense.currency_code),
                                      formatCurrency(share.owed, expense.currency_code)));

    std::vector<std::string> names;
    for (const auto& p : expense.participants) {
        if (p.user_id == target) continue;
        if (auto name = p.displayName(); !name.empty()) names.push_back(std::move(name));
    }
    if (!names.empty()) leading.push_back("Users: " + join(names, ", "));

    if (const auto notes = trim(foldLineBreaks(expense.notes)); !notes.empty())
        leading.push_back("Notes: " + notes);

    const auto idSegment = expense.id.empty() ? std::string{} : "Splitwise ID: " + expense.id;

    return truncateMemo(join(leading, kMemoDelimiter), idSegment, maxLength);
}

}
