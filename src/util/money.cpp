#include "util/money.hpp"
#include "util/errors.hpp"

#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

namespace sb::util {

namespace {

std::string_view trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

[[noreturn]] void rejectDecimal(const std::string_view text, const std::string& why) {
    throw ValidationError("Invalid decimal amount: '" + std::string(text) + "'", why);
}

}

std::int64_t roundHalfEven(const std::int64_t value, const std::int64_t divisor) {
    if (divisor <= 0) throw std::invalid_argument("roundHalfEven requires a positive divisor");

    const std::int64_t q = value / divisor;
    const std::int64_t r = value % divisor;
    if (r == 0) return q;

    const std::int64_t twice = 2 * (r < 0 ? -r : r);
    const std::int64_t away = value < 0 ? q - 1 : q + 1;

    if (twice > divisor) return away;
    if (twice < divisor) return q;
    return q % 2 == 0 ? q : away;
}

Micros parseDecimal(const std::string_view text) {
    std::string_view s = trimmed(text);
    if (s.empty()) rejectDecimal(text, "empty value");

    bool negative = false;
    if (s.front() == '-' || s.front() == '+') {
        negative = s.front() == '-';
        s.remove_prefix(1);
    }

    std::int64_t integerPart = 0;
    int integerDigits = 0;
    std::size_t i = 0;
    for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
        if (++integerDigits > kMaxIntegerDigits) rejectDecimal(text, "too many integer digits");
        integerPart = integerPart * 10 + (s[i] - '0');
    }

    // Fractional digits are accumulated one place past the precision we keep
    // so the rounding step sees the first dropped digit and a sticky bit.
    std::int64_t fraction = 0;
    int fractionDigits = 0;
    bool sticky = false;
    if (i < s.size() && s[i] == '.') {
        ++i;
        for (; i < s.size() && std::isdigit(static_cast<unsigned char>(s[i])); ++i) {
            if (fractionDigits <= kMaxFractionDigits) {
                fraction = fraction * 10 + (s[i] - '0');
                ++fractionDigits;
            } else if (s[i] != '0') sticky = true;
        }
    }

    if (i != s.size()) rejectDecimal(text, "unexpected character");
    if (integerDigits == 0 && fractionDigits == 0) rejectDecimal(text, "no digits");

    while (fractionDigits < kMaxFractionDigits + 1) {
        fraction *= 10;
        ++fractionDigits;
    }

    // fraction now holds seven places; drop the last one half to even
    std::int64_t scaled = integerPart * kMicrosPerUnit * 10 + fraction;
    if (sticky) scaled = scaled * 10 + 1;
    else scaled *= 10;
    Micros value = roundHalfEven(scaled, 100);

    return negative ? -value : value;
}

std::string formatDecimal(const Milliunits amount) {
    const std::int64_t cents = roundHalfEven(amount, 10);
    const std::int64_t magnitude = cents < 0 ? -cents : cents;
    return fmt::format("{}{}.{:02}", cents < 0 ? "-" : "", magnitude / 100, magnitude % 100);
}

std::string formatCurrency(const Milliunits amount, const std::string& currencyCode) {
    if (currencyCode.empty() || currencyCode == "USD") {
        const std::string digits = formatDecimal(amount < 0 ? -amount : amount);
        return fmt::format("{}${}", amount < 0 && digits != "0.00" ? "-" : "", digits);
    }
    return fmt::format("{} {}", formatDecimal(amount), currencyCode);
}

std::string formatSignedCurrency(const Milliunits amount, const std::string& currencyCode) {
    const std::string body = formatCurrency(amount < 0 ? -amount : amount, currencyCode);
    return fmt::format("{}{}", amount < 0 ? "-" : "+", body);
}

}
