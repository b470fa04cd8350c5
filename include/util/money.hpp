#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace sb::util {

// Exact amounts as received from the source (10^-6 of a currency unit).
using Micros = std::int64_t;

// The sink's smallest currency increment (10^-3 of a currency unit).
using Milliunits = std::int64_t;

constexpr Micros kMicrosPerUnit = 1'000'000;
constexpr Micros kMicrosPerMilliunit = 1'000;
constexpr int kMaxFractionDigits = 6;
constexpr int kMaxIntegerDigits = 10;

/**
 * Parse a decimal string such as "25.00", "-3.5" or "12" into micros.
 * Digits beyond the sixth fractional place are rounded half to even.
 * Throws ValidationError on anything that is not a plain decimal.
 */
Micros parseDecimal(std::string_view text);

// Integer division rounding half to even. divisor must be positive.
std::int64_t roundHalfEven(std::int64_t value, std::int64_t divisor);

inline Milliunits toMilliunits(const Micros amount) { return roundHalfEven(amount, kMicrosPerMilliunit); }

// "12.50", "-20.00"; milliunits are rounded half to even to two places
std::string formatDecimal(Milliunits amount);

// "$12.50" for USD, "12.50 EUR" otherwise; negative amounts carry a leading '-'
std::string formatCurrency(Milliunits amount, const std::string& currencyCode = "USD");

// Preview form, always signed: "+$12.50", "-$20.00"
std::string formatSignedCurrency(Milliunits amount, const std::string& currencyCode = "USD");

}
