#include "types/Date.hpp"
#include "util/timestamp.hpp"
#include "util/errors.hpp"

#include <fmt/format.h>

using namespace sb::types;

Date::Date(const int year, const unsigned month, const unsigned day)
    : year_(year), month_(month), day_(day) {
    // round-trip through the calendar so 2024-02-30 is refused up front
    if (fromTime(toTime()) != *this)
        throw ValidationError(fmt::format("Invalid calendar date {:04}-{:02}-{:02}", year, month, day));
}

Date Date::parse(const std::string& text) {
    try {
        return fromTime(util::parseIsoDate(text));
    } catch (const std::runtime_error& e) {
        throw ValidationError("Invalid date format: '" + text + "'", e.what());
    }
}

Date Date::addDays(const int days) const {
    return fromTime(toTime() + static_cast<std::time_t>(days) * 24 * 60 * 60);
}

std::string Date::str() const { return fmt::format("{:04}-{:02}-{:02}", year_, month_, day_); }

Date Date::fromTime(const std::time_t ts) {
    std::tm tm = {};
    gmtime_r(&ts, &tm);
    Date d;
    d.year_ = tm.tm_year + 1900;
    d.month_ = static_cast<unsigned>(tm.tm_mon + 1);
    d.day_ = static_cast<unsigned>(tm.tm_mday);
    return d;
}

std::time_t Date::toTime() const {
    std::tm tm = {};
    tm.tm_year = year_ - 1900;
    tm.tm_mon = static_cast<int>(month_) - 1;
    tm.tm_mday = static_cast<int>(day_);
    return timegm(&tm);
}
