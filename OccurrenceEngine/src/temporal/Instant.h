#pragma once

#include "Calendar.h"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace temporal {

// "UTC", a named zone, or nullopt for floating time. Only a tag: the
// calendar fields are wall-clock values and arithmetic is zone-free.
using TimezoneLabel = std::optional<std::string>;

enum class Unit { Year, Month, Week, Day, Hour, Minute, Second, Millisecond };

constexpr int64_t MILLISECONDS_IN_SECOND = 1000;
constexpr int64_t MILLISECONDS_IN_MINUTE = 60 * MILLISECONDS_IN_SECOND;
constexpr int64_t MILLISECONDS_IN_HOUR = 60 * MILLISECONDS_IN_MINUTE;
constexpr int64_t MILLISECONDS_IN_DAY = 24 * MILLISECONDS_IN_HOUR;
constexpr int64_t MILLISECONDS_IN_WEEK = 7 * MILLISECONDS_IN_DAY;

class ComparisonError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Calendar-field form exchanged with date backends and used by the JSON codec.
struct InstantFields {
    TimezoneLabel timezone;
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int millisecond = 0;
    int64_t duration = 0;
};

class Instant {
public:
    static Instant from_fields(const InstantFields& fields);
    static Instant from_timestamp(int64_t timestamp, const TimezoneLabel& timezone, int64_t duration = 0);
    static Instant from_json(const std::string& js);
    // YYYY-MM-DDTHH:MM:SS[.mmm][Z]; a trailing Z (or +00:00) yields the UTC label.
    static std::optional<Instant> parse_iso(const std::string& s);

    int64_t value_of() const { return timestamp_; }
    const TimezoneLabel& timezone() const { return timezone_; }
    int64_t duration() const { return duration_; }
    std::optional<Instant> end() const;

    int year() const { return year_; }
    int month() const { return month_; }
    int day() const { return day_; }
    int hour() const { return hour_; }
    int minute() const { return minute_; }
    int second() const { return second_; }
    int millisecond() const { return millisecond_; }
    Weekday weekday() const { return weekday_; }
    int yearday() const;
    int64_t day_number() const { return floor_div(timestamp_, MILLISECONDS_IN_DAY); }

    Instant add(int64_t amount, Unit unit) const;
    Instant subtract(int64_t amount, Unit unit) const { return add(-amount, unit); }
    Instant set(Unit unit, int value) const;
    Instant granularity(Unit unit, Weekday week_start = Weekday::MO) const;
    Instant end_granularity(Unit unit, Weekday week_start = Weekday::MO) const;
    Instant with_duration(int64_t duration) const;
    Instant with_timezone(const TimezoneLabel& timezone) const;

    bool is_equal(const Instant& other) const;
    bool is_before(const Instant& other) const;
    bool is_before_or_equal(const Instant& other) const;
    bool is_after(const Instant& other) const;
    bool is_after_or_equal(const Instant& other) const;
    bool is_occurring(const Instant& date) const;

    InstantFields to_fields() const;
    std::string to_json() const;
    std::string to_iso_string() const;

private:
    Instant(int64_t timestamp, TimezoneLabel timezone, int64_t duration);
    static Instant from_civil(int year, int month, int day, int hour, int minute, int second, int millisecond,
                              const TimezoneLabel& timezone, int64_t duration);
    Instant add_months(int64_t months) const;
    void assert_comparable(const Instant& other) const;

    int64_t timestamp_;
    TimezoneLabel timezone_;
    int64_t duration_;
    int year_ = 1970;
    int month_ = 1;
    int day_ = 1;
    int hour_ = 0;
    int minute_ = 0;
    int second_ = 0;
    int millisecond_ = 0;
    Weekday weekday_ = Weekday::TH;
};

// Sort comparer: by timestamp, then by duration when both instants carry one.
// Returns <0, 0 or >0. Throws ComparisonError for mismatched timezone labels.
int compare(const Instant& a, const Instant& b);

// Total order refining compare(): a zero duration sorts before any other at the
// same timestamp. Returns 0 only for equal timestamps and equal durations.
int compare_exact(const Instant& a, const Instant& b);

std::string to_string(const TimezoneLabel& timezone);

}
