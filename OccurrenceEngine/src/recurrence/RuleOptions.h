#pragma once

#include "../temporal/Instant.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace recurrence {

enum class Frequency { Yearly, Monthly, Weekly, Daily, Hourly, Minutely, Secondly };

temporal::Unit frequency_unit(Frequency frequency);
std::string to_string(Frequency frequency);
std::optional<Frequency> frequency_from_string(std::string_view s);

// A weekday constraint; ordinal 0 matches every such weekday, n > 0 the nth
// in the month or year, n < 0 the nth from the end.
struct DayOfWeek {
    temporal::Weekday weekday = temporal::Weekday::MO;
    int ordinal = 0;
    bool operator==(const DayOfWeek& o) const { return weekday == o.weekday && ordinal == o.ordinal; }
    bool operator<(const DayOfWeek& o) const {
        return weekday != o.weekday ? weekday < o.weekday : ordinal < o.ordinal;
    }
};

class RuleOptionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Raw options as supplied by a caller or a rule-text parser.
struct RuleOptions {
    std::optional<temporal::Instant> start;
    std::optional<Frequency> frequency;
    std::optional<int> interval;
    std::optional<temporal::Instant> end;
    std::optional<int> count;
    std::optional<temporal::Weekday> week_start;
    std::optional<int64_t> duration;
    std::optional<std::vector<int>> by_month_of_year;
    std::optional<std::vector<int>> by_day_of_month;
    std::optional<std::vector<DayOfWeek>> by_day_of_week;
    std::optional<std::vector<int>> by_hour_of_day;
    std::optional<std::vector<int>> by_minute_of_hour;
    std::optional<std::vector<int>> by_second_of_minute;
    std::optional<std::vector<int>> by_millisecond_of_second;
    // Accepted only so they can be rejected.
    std::optional<std::vector<int>> by_week_of_year;
    std::optional<std::vector<int>> by_day_of_year;
    std::optional<std::vector<int>> by_set_position;
};

// Validated options. Every by-unit list is sorted and deduplicated; an empty
// list means the constraint is inactive.
struct NormalizedRuleOptions {
    temporal::Instant start;
    Frequency frequency = Frequency::Daily;
    int interval = 1;
    std::optional<temporal::Instant> end;
    std::optional<int> count;
    temporal::Weekday week_start = temporal::Weekday::MO;
    int64_t duration = 0;
    std::vector<int> by_month_of_year;
    std::vector<int> by_day_of_month;
    std::vector<DayOfWeek> by_day_of_week;
    std::vector<int> by_hour_of_day;
    std::vector<int> by_minute_of_hour;
    std::vector<int> by_second_of_minute;
    std::vector<int> by_millisecond_of_second;
};

NormalizedRuleOptions normalize_rule_options(const RuleOptions& options);

}
