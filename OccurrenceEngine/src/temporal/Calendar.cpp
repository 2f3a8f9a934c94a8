#include "Calendar.h"

#include <boost/date_time/gregorian/gregorian.hpp>

namespace temporal {

namespace greg = boost::gregorian;

static const greg::date& epoch_date() {
    static const greg::date d(1970, 1, 1);
    return d;
}

static void check_year(int year) {
    if (year < 1400 || year > 9999) {
        throw InvalidDateError("year " + std::to_string(year) + " is outside the supported range 1400..9999");
    }
}

int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

bool is_leap_year(int year) {
    check_year(year);
    return greg::gregorian_calendar::is_leap_year(static_cast<greg::greg_year::value_type>(year));
}

int days_in_month(int year, int month) {
    check_year(year);
    if (month < 1 || month > 12) throw InvalidDateError("invalid month " + std::to_string(month));
    return greg::gregorian_calendar::end_of_month_day(
        static_cast<greg::greg_year::value_type>(year),
        static_cast<greg::greg_month::value_type>(month));
}

int64_t days_from_civil(int year, int month, int day) {
    check_year(year);
    try {
        greg::date d(static_cast<unsigned short>(year), static_cast<unsigned short>(month), static_cast<unsigned short>(day));
        return (d - epoch_date()).days();
    } catch (const std::out_of_range& e) {
        throw InvalidDateError(std::string("invalid date: ") + e.what());
    }
}

void civil_from_days(int64_t days, int& year, int& month, int& day) {
    greg::date d;
    try {
        d = epoch_date() + greg::days(static_cast<long>(days));
        if (d.is_special()) throw InvalidDateError("day number " + std::to_string(days) + " is outside the calendar");
        auto ymd = d.year_month_day();
        year = ymd.year;
        month = ymd.month;
        day = ymd.day;
    } catch (const std::out_of_range& e) {
        throw InvalidDateError(std::string("invalid date: ") + e.what());
    }
}

Weekday weekday_of_days(int64_t days) {
    // 1970-01-01 was a Thursday
    int64_t r = (days + 4) % 7;
    if (r < 0) r += 7;
    return static_cast<Weekday>(r);
}

std::string to_string(Weekday weekday) {
    static const char* names[] = {"SU", "MO", "TU", "WE", "TH", "FR", "SA"};
    return names[static_cast<int>(weekday)];
}

std::optional<Weekday> weekday_from_string(std::string_view s) {
    static const char* names[] = {"SU", "MO", "TU", "WE", "TH", "FR", "SA"};
    for (int i = 0; i < 7; ++i) {
        if (s == names[i]) return static_cast<Weekday>(i);
    }
    return std::nullopt;
}

int weekday_distance(Weekday from, Weekday to) {
    return (static_cast<int>(to) - static_cast<int>(from) + 7) % 7;
}

std::array<Weekday, 7> ordered_weekdays(Weekday week_start) {
    std::array<Weekday, 7> out{};
    for (int i = 0; i < 7; ++i) {
        out[i] = static_cast<Weekday>((static_cast<int>(week_start) + i) % 7);
    }
    return out;
}

}
