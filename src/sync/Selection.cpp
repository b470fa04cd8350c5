#include "sync/Selection.hpp"
#include "util/errors.hpp"
#include "util/parse.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

using namespace sb::sync;

namespace {

size_t parsePosition(const std::string& token, const std::string& text) {
    const auto v = sb::util::parseUInt(sb::util::trim(token));
    if (!v || *v == 0) throw sb::ValidationError("Invalid selection: " + text, "'" + token + "' is not a position (1, 2, ...)");
    return *v;
}

std::pair<size_t, size_t> parseSpan(const std::string& token, const std::string& text) {
    const auto dash = token.find('-');
    if (dash == std::string::npos) {
        const auto p = parsePosition(token, text);
        return {p, p};
    }
    const auto first = parsePosition(token.substr(0, dash), text);
    const auto last = parsePosition(token.substr(dash + 1), text);
    if (first > last) throw sb::ValidationError("Invalid selection: " + text, "range " + token + " runs backwards");
    return {first, last};
}

}

IndexPredicate IndexPredicate::all() { return {}; }

IndexPredicate IndexPredicate::before(const size_t position) {
    if (position == 0) throw ValidationError("Selection position must be 1 or greater");
    IndexPredicate p;
    p.mode_ = Mode::Before;
    p.spans_ = {{1, position - 1}};
    return p;
}

IndexPredicate IndexPredicate::after(const size_t position) {
    if (position == 0) throw ValidationError("Selection position must be 1 or greater");
    IndexPredicate p;
    p.mode_ = Mode::After;
    p.spans_ = {{position + 1, std::numeric_limits<size_t>::max()}};
    return p;
}

IndexPredicate IndexPredicate::range(const size_t first, const size_t last) {
    if (first == 0 || first > last)
        throw ValidationError("Invalid selection range", std::to_string(first) + "-" + std::to_string(last));
    IndexPredicate p;
    p.mode_ = Mode::Range;
    p.spans_ = {{first, last}};
    return p;
}

IndexPredicate IndexPredicate::list(std::vector<std::pair<size_t, size_t>> spans) {
    if (spans.empty()) throw ValidationError("Selection list is empty");
    for (const auto& [first, last] : spans)
        if (first == 0 || first > last) throw ValidationError("Invalid selection span in list");
    IndexPredicate p;
    p.mode_ = Mode::List;
    p.spans_ = std::move(spans);
    return p;
}

IndexPredicate IndexPredicate::parse(const std::string& text) {
    auto t = util::trim(text);
    std::ranges::transform(t, t.begin(), [](const unsigned char c) { return std::tolower(c); });

    if (t.empty()) throw ValidationError("Invalid selection: empty");
    if (t == "all" || t == "*") return all();
    if (t.front() == '<') return before(parsePosition(t.substr(1), text));
    if (t.front() == '>') return after(parsePosition(t.substr(1), text));

    if (t.find(',') == std::string::npos && t.find('-') != std::string::npos) {
        const auto [first, last] = parseSpan(t, text);
        return range(first, last);
    }

    std::vector<std::pair<size_t, size_t>> spans;
    for (const auto& token : util::splitTrimmed(t, ','))
        spans.push_back(parseSpan(token, text));
    return list(std::move(spans));
}

bool IndexPredicate::operator()(const size_t position) const {
    if (mode_ == Mode::All) return position >= 1;
    return std::ranges::any_of(spans_, [position](const auto& s) { return position >= s.first && position <= s.second; });
}

std::string IndexPredicate::str() const {
    switch (mode_) {
        case Mode::All: return "all";
        case Mode::Before: return "<" + std::to_string(spans_.front().second + 1);
        case Mode::After: return ">" + std::to_string(spans_.front().first - 1);
        case Mode::Range: return std::to_string(spans_.front().first) + "-" + std::to_string(spans_.front().second);
        case Mode::List: {
            std::string out;
            for (const auto& [first, last] : spans_) {
                if (!out.empty()) out += ',';
                out += std::to_string(first);
                if (last != first) out += "-" + std::to_string(last);
            }
            return out;
        }
        default: return "?";
    }
}
