#pragma once

#include <compare>
#include <ctime>
#include <string>

namespace sb::types {

// A calendar date with no time of day or zone, as both ledgers use it.
class Date {
public:
    Date() = default;
    Date(int year, unsigned month, unsigned day);

    // Accepts "YYYY-MM-DD" and ISO timestamps ("2024-01-15T10:30:00Z").
    static Date parse(const std::string& text);

    [[nodiscard]] int year() const { return year_; }
    [[nodiscard]] unsigned month() const { return month_; }
    [[nodiscard]] unsigned day() const { return day_; }

    [[nodiscard]] Date addDays(int days) const;
    [[nodiscard]] std::string str() const;

    auto operator<=>(const Date&) const = default;

private:
    int year_{1970};
    unsigned month_{1};
    unsigned day_{1};

    static Date fromTime(std::time_t ts);
    [[nodiscard]] std::time_t toTime() const;
};

}
