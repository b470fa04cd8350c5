#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sb::util {

std::string trim(std::string_view s);

// CR, LF and CRLF each become one space.
std::string foldLineBreaks(std::string_view s);

// Longest prefix of at most maxBytes that does not end inside a UTF-8 sequence.
std::string_view utf8Prefix(std::string_view s, size_t maxBytes);

std::vector<std::string> splitTrimmed(std::string_view s, char delim);

// Plain unsigned decimal, no sign or whitespace; nullopt otherwise.
std::optional<unsigned int> parseUInt(std::string_view s);

}
