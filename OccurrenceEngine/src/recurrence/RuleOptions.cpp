#include "RuleOptions.h"
#include "../config/Config.h"
#include "../observability/Logging.h"

#include <algorithm>

namespace recurrence {

using temporal::Unit;

temporal::Unit frequency_unit(Frequency frequency) {
    switch (frequency) {
        case Frequency::Yearly: return Unit::Year;
        case Frequency::Monthly: return Unit::Month;
        case Frequency::Weekly: return Unit::Week;
        case Frequency::Daily: return Unit::Day;
        case Frequency::Hourly: return Unit::Hour;
        case Frequency::Minutely: return Unit::Minute;
        case Frequency::Secondly: return Unit::Second;
    }
    return Unit::Day;
}

static const char* const kFrequencyNames[] = {"YEARLY", "MONTHLY", "WEEKLY", "DAILY", "HOURLY", "MINUTELY", "SECONDLY"};

std::string to_string(Frequency frequency) {
    return kFrequencyNames[static_cast<int>(frequency)];
}

std::optional<Frequency> frequency_from_string(std::string_view s) {
    for (int i = 0; i < 7; ++i) {
        if (s == kFrequencyNames[i]) return static_cast<Frequency>(i);
    }
    return std::nullopt;
}

template <typename T>
static std::vector<T> sorted_unique(std::vector<T> v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    return v;
}

static void check_list(const char* name, const std::optional<std::vector<int>>& list, int lo, int hi, bool allow_zero = true) {
    if (!list) return;
    if (list->empty()) throw RuleOptionError(std::string(name) + " must not be empty");
    for (int v : *list) {
        if (v < lo || v > hi || (!allow_zero && v == 0)) {
            throw RuleOptionError(std::string(name) + " value " + std::to_string(v) + " is out of range");
        }
    }
}

static bool coarser_than(Frequency frequency, Frequency other) {
    return static_cast<int>(frequency) < static_cast<int>(other);
}

static NormalizedRuleOptions normalize(const RuleOptions& o) {
    if (!o.start) throw RuleOptionError("start is required");
    if (!o.frequency) throw RuleOptionError("frequency is required");
    if (o.by_week_of_year) throw RuleOptionError("byWeekOfYear is not supported");
    if (o.by_day_of_year) throw RuleOptionError("byDayOfYear is not supported");
    if (o.by_set_position) throw RuleOptionError("bySetPosition is not supported");

    const Frequency freq = *o.frequency;
    const temporal::Instant start = o.start->with_duration(0);

    if (o.interval && *o.interval < 1) throw RuleOptionError("interval must be a positive integer");
    if (o.count && o.end) throw RuleOptionError("end and count cannot both be present");
    if (o.count && *o.count < 1) throw RuleOptionError("count must be a positive integer");
    if (o.duration && *o.duration < 0) throw RuleOptionError("duration must be a non-negative integer");
    if (o.end && o.end->timezone() != start.timezone()) {
        throw RuleOptionError("end timezone " + temporal::to_string(o.end->timezone())
            + " does not match start timezone " + temporal::to_string(start.timezone()));
    }

    check_list("byMonthOfYear", o.by_month_of_year, 1, 12);
    if (o.by_day_of_month && freq == Frequency::Weekly) {
        throw RuleOptionError("byDayOfMonth cannot be combined with WEEKLY frequency");
    }
    check_list("byDayOfMonth", o.by_day_of_month, -31, 31, false);
    check_list("byHourOfDay", o.by_hour_of_day, 0, 23);
    check_list("byMinuteOfHour", o.by_minute_of_hour, 0, 59);
    check_list("bySecondOfMinute", o.by_second_of_minute, 0, 59);
    check_list("byMillisecondOfSecond", o.by_millisecond_of_second, 0, 999);

    if (o.by_day_of_week) {
        if (o.by_day_of_week->empty()) throw RuleOptionError("byDayOfWeek must not be empty");
        const bool month_window = freq == Frequency::Monthly || (freq == Frequency::Yearly && o.by_month_of_year);
        const int max_ordinal = month_window ? 5 : 53;
        for (const auto& d : *o.by_day_of_week) {
            if (d.ordinal == 0) continue;
            if (freq != Frequency::Monthly && freq != Frequency::Yearly) {
                throw RuleOptionError("byDayOfWeek ordinals require MONTHLY or YEARLY frequency");
            }
            if (d.ordinal < -max_ordinal || d.ordinal > max_ordinal) {
                throw RuleOptionError("byDayOfWeek ordinal " + std::to_string(d.ordinal) + " is out of range");
            }
        }
    }

    NormalizedRuleOptions n{start};
    n.frequency = freq;
    n.interval = o.interval.value_or(1);
    n.end = o.end ? std::optional<temporal::Instant>(o.end->with_duration(0)) : std::nullopt;
    n.count = o.count;
    n.week_start = o.week_start.value_or(config::current().default_week_start);
    n.duration = o.duration.value_or(0);

    if (o.by_month_of_year) n.by_month_of_year = sorted_unique(*o.by_month_of_year);
    if (o.by_day_of_month) n.by_day_of_month = sorted_unique(*o.by_day_of_month);
    if (o.by_day_of_week) n.by_day_of_week = sorted_unique(*o.by_day_of_week);
    if (o.by_hour_of_day) n.by_hour_of_day = sorted_unique(*o.by_hour_of_day);
    if (o.by_minute_of_hour) n.by_minute_of_hour = sorted_unique(*o.by_minute_of_hour);
    if (o.by_second_of_minute) n.by_second_of_minute = sorted_unique(*o.by_second_of_minute);
    n.by_millisecond_of_second = o.by_millisecond_of_second
        ? sorted_unique(*o.by_millisecond_of_second) : std::vector<int>{start.millisecond()};

    if (!o.by_second_of_minute && coarser_than(freq, Frequency::Secondly)) n.by_second_of_minute = {start.second()};
    if (!o.by_minute_of_hour && coarser_than(freq, Frequency::Minutely)) n.by_minute_of_hour = {start.minute()};
    if (!o.by_hour_of_day && coarser_than(freq, Frequency::Hourly)) n.by_hour_of_day = {start.hour()};

    const bool has_day_constraint = o.by_day_of_month || o.by_day_of_week;
    switch (freq) {
        case Frequency::Yearly:
            if (!has_day_constraint) {
                if (!o.by_month_of_year) n.by_month_of_year = {start.month()};
                n.by_day_of_month = {start.day()};
            }
            break;
        case Frequency::Monthly:
            if (!has_day_constraint) n.by_day_of_month = {start.day()};
            break;
        case Frequency::Weekly:
            if (!o.by_day_of_week) n.by_day_of_week = {DayOfWeek{start.weekday(), 0}};
            break;
        default:
            break;
    }
    return n;
}

NormalizedRuleOptions normalize_rule_options(const RuleOptions& options) {
    try {
        return normalize(options);
    } catch (const RuleOptionError& e) {
        observability::log_warn("rule.rejected", {{"reason", std::string(e.what())}});
        throw;
    }
}

}
