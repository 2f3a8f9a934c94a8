#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace temporal {

enum class Weekday { SU = 0, MO, TU, WE, TH, FR, SA };

class InvalidDateError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Floor division, correct for timestamps before the epoch.
int64_t floor_div(int64_t a, int64_t b);

bool is_leap_year(int year);
int days_in_month(int year, int month);

// Days since 1970-01-01 and back. Throws InvalidDateError outside 1400..9999.
int64_t days_from_civil(int year, int month, int day);
void civil_from_days(int64_t days, int& year, int& month, int& day);
Weekday weekday_of_days(int64_t days);

std::string to_string(Weekday weekday);
std::optional<Weekday> weekday_from_string(std::string_view s);

// Days to walk forward from `from` to reach `to` (0..6).
int weekday_distance(Weekday from, Weekday to);
std::array<Weekday, 7> ordered_weekdays(Weekday week_start);

}
