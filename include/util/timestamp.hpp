#pragma once

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace sb::util {

// Midnight UTC of a "YYYY-MM-DD" calendar date. Anything after the first ten
// characters (a time part such as "T10:30:00Z") is ignored.
inline std::time_t parseIsoDate(const std::string& text) {
    if (text.size() < 10) throw std::runtime_error("Failed to parse date: '" + text + "'");

    std::tm tm = {};
    std::istringstream ss(text.substr(0, 10));
    ss >> std::get_time(&tm, "%Y-%m-%d");
    if (ss.fail()) throw std::runtime_error("Failed to parse date: '" + text + "'");

    const int year = tm.tm_year, month = tm.tm_mon, day = tm.tm_mday;
    const std::time_t ts = timegm(&tm);

    // timegm normalises out-of-range days (2024-02-30 -> 2024-03-01); reject those
    if (tm.tm_year != year || tm.tm_mon != month || tm.tm_mday != day)
        throw std::runtime_error("Failed to parse date: '" + text + "' is not a calendar date");

    return ts;
}

}
