#include "util/parse.hpp"

#include <charconv>
#include <limits>

namespace sb::util {

static bool isSpace(const char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

std::string trim(std::string_view s) {
    while (!s.empty() && isSpace(s.front())) s.remove_prefix(1);
    while (!s.empty() && isSpace(s.back())) s.remove_suffix(1);
    return std::string(s);
}

std::string foldLineBreaks(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r') {
            if (i + 1 < s.size() && s[i + 1] == '\n') ++i;
            out += ' ';
        } else if (s[i] == '\n') out += ' ';
        else out += s[i];
    }
    return out;
}

std::string_view utf8Prefix(std::string_view s, size_t maxBytes) {
    if (s.size() <= maxBytes) return s;
    size_t cut = maxBytes;
    // step back over continuation bytes (10xxxxxx) to the lead byte
    while (cut > 0 && (static_cast<unsigned char>(s[cut]) & 0xC0) == 0x80) --cut;
    return s.substr(0, cut);
}

std::vector<std::string> splitTrimmed(std::string_view s, const char delim) {
    std::vector<std::string> parts;
    while (true) {
        const auto pos = s.find(delim);
        parts.push_back(trim(s.substr(0, pos)));
        if (pos == std::string_view::npos) break;
        s.remove_prefix(pos + 1);
    }
    return parts;
}

std::optional<unsigned int> parseUInt(std::string_view s) {
    if (s.empty()) return std::nullopt;
    unsigned long long v = 0;
    const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    if (v > std::numeric_limits<unsigned int>::max()) return std::nullopt;
    return static_cast<unsigned int>(v);
}

}
