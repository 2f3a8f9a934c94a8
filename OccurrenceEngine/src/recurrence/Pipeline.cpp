#include "Pipeline.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

#include <algorithm>

namespace recurrence {

using temporal::Instant;
using temporal::Unit;
using temporal::MILLISECONDS_IN_DAY;

static int unit_rank(Unit u) {
    switch (u) {
        case Unit::Year: return 0;
        case Unit::Month: return 1;
        case Unit::Week: return 2;
        case Unit::Day: return 3;
        case Unit::Hour: return 4;
        case Unit::Minute: return 5;
        case Unit::Second: return 6;
        case Unit::Millisecond: return 7;
    }
    return 7;
}

static bool finer_than(Unit a, Unit b) { return unit_rank(a) > unit_rank(b); }

static int64_t unit_length(Unit u) {
    switch (u) {
        case Unit::Hour: return temporal::MILLISECONDS_IN_HOUR;
        case Unit::Minute: return temporal::MILLISECONDS_IN_MINUTE;
        case Unit::Second: return temporal::MILLISECONDS_IN_SECOND;
        default: return 1;
    }
}

Pipeline::Pipeline(std::shared_ptr<const NormalizedRuleOptions> options, Direction direction, int max_iterations)
    : options_(std::move(options)), direction_(direction), max_iterations_(max_iterations) {
    const auto& o = *options_;
    stages_.push_back(StageKind::Frequency);
    if (!o.by_month_of_year.empty()) stages_.push_back(StageKind::MonthOfYear);
    if (!o.by_day_of_month.empty()) stages_.push_back(StageKind::DayOfMonth);
    if (!o.by_day_of_week.empty()) stages_.push_back(StageKind::DayOfWeek);
    if (!o.by_hour_of_day.empty()) stages_.push_back(StageKind::HourOfDay);
    if (!o.by_minute_of_hour.empty()) stages_.push_back(StageKind::MinuteOfHour);
    if (!o.by_second_of_minute.empty()) stages_.push_back(StageKind::SecondOfMinute);
    if (!o.by_millisecond_of_second.empty()) stages_.push_back(StageKind::MillisecondOfSecond);
}

static Unit stage_unit(StageKind stage, Frequency frequency) {
    switch (stage) {
        case StageKind::Frequency: return frequency_unit(frequency);
        case StageKind::MonthOfYear: return Unit::Month;
        case StageKind::DayOfMonth:
        case StageKind::DayOfWeek: return Unit::Day;
        case StageKind::HourOfDay: return Unit::Hour;
        case StageKind::MinuteOfHour: return Unit::Minute;
        case StageKind::SecondOfMinute: return Unit::Second;
        case StageKind::MillisecondOfSecond: return Unit::Millisecond;
    }
    return Unit::Millisecond;
}

StageResult Pipeline::evaluate(StageKind stage, const Instant& c) const {
    const auto& o = *options_;
    switch (stage) {
        case StageKind::Frequency: return evaluate_frequency(c);
        case StageKind::MonthOfYear: return evaluate_month(c);
        case StageKind::DayOfMonth: return evaluate_day_of_month(c);
        case StageKind::DayOfWeek: return evaluate_day_of_week(c);
        case StageKind::HourOfDay: return evaluate_time_field(c, o.by_hour_of_day, Unit::Hour, Unit::Day, c.hour());
        case StageKind::MinuteOfHour: return evaluate_time_field(c, o.by_minute_of_hour, Unit::Minute, Unit::Hour, c.minute());
        case StageKind::SecondOfMinute: return evaluate_time_field(c, o.by_second_of_minute, Unit::Second, Unit::Minute, c.second());
        case StageKind::MillisecondOfSecond:
            return evaluate_time_field(c, o.by_millisecond_of_second, Unit::Millisecond, Unit::Second, c.millisecond());
    }
    return StageResult::valid();
}

int64_t Pipeline::period_index(const Instant& date) const {
    const auto& s = options_->start;
    const auto ws = options_->week_start;
    const Unit unit = frequency_unit(options_->frequency);
    switch (unit) {
        case Unit::Year: return date.year() - s.year();
        case Unit::Month: return (int64_t(date.year()) * 12 + date.month()) - (int64_t(s.year()) * 12 + s.month());
        case Unit::Week: return (date.granularity(Unit::Week, ws).day_number() - s.granularity(Unit::Week, ws).day_number()) / 7;
        case Unit::Day: return date.day_number() - s.day_number();
        default: {
            const int64_t len = unit_length(unit);
            return temporal::floor_div(date.value_of(), len) - temporal::floor_div(s.value_of(), len);
        }
    }
}

Instant Pipeline::period_start(int64_t index) const {
    const auto& s = options_->start;
    const auto& tz = s.timezone();
    const Unit unit = frequency_unit(options_->frequency);
    switch (unit) {
        case Unit::Year:
            return Instant::from_timestamp(temporal::days_from_civil(static_cast<int>(s.year() + index), 1, 1) * MILLISECONDS_IN_DAY, tz);
        case Unit::Month: {
            int64_t abs = int64_t(s.year()) * 12 + (s.month() - 1) + index;
            int y = static_cast<int>(temporal::floor_div(abs, 12));
            int m = static_cast<int>(abs - int64_t(y) * 12) + 1;
            return Instant::from_timestamp(temporal::days_from_civil(y, m, 1) * MILLISECONDS_IN_DAY, tz);
        }
        case Unit::Week:
            return day_at(s, s.granularity(Unit::Week, options_->week_start).day_number() + 7 * index);
        case Unit::Day:
            return day_at(s, s.day_number() + index);
        default: {
            const int64_t len = unit_length(unit);
            return Instant::from_timestamp((temporal::floor_div(s.value_of(), len) + index) * len, tz);
        }
    }
}

StageResult Pipeline::evaluate_frequency(const Instant& c) const {
    const int64_t interval = options_->interval;
    const int64_t p = period_index(c);
    if (p < 0) {
        if (forward()) return StageResult::repair_to(period_start(0));
        return StageResult::repair_to(period_start(0).subtract(1, Unit::Millisecond));
    }
    const int64_t r = p % interval;
    if (r == 0) return StageResult::valid();
    if (forward()) return StageResult::repair_to(period_start(p - r + interval));
    return StageResult::repair_to(period_start(p - r + 1).subtract(1, Unit::Millisecond));
}

StageResult Pipeline::evaluate_month(const Instant& c) const {
    const auto& months = options_->by_month_of_year;
    if (months.empty()) return StageResult::valid();
    const int m = c.month();
    if (forward()) {
        auto it = std::lower_bound(months.begin(), months.end(), m);
        if (it == months.end()) return StageResult::ascend_by(Unit::Year);
        if (*it == m) return StageResult::valid();
        return StageResult::repair_to(c.granularity(Unit::Year).set(Unit::Month, *it));
    }
    auto it = std::upper_bound(months.begin(), months.end(), m);
    if (it == months.begin()) return StageResult::ascend_by(Unit::Year);
    --it;
    if (*it == m) return StageResult::valid();
    return StageResult::repair_to(c.granularity(Unit::Year).set(Unit::Month, *it).end_granularity(Unit::Month));
}

bool Pipeline::weekday_ordinals() const {
    for (const auto& d : options_->by_day_of_week) {
        if (d.ordinal != 0) return true;
    }
    return false;
}

Unit Pipeline::weekday_window() const {
    const auto& o = *options_;
    if (o.frequency == Frequency::Monthly || !o.by_month_of_year.empty()) return Unit::Month;
    return Unit::Year;
}

std::vector<int64_t> Pipeline::weekday_window_days(const Instant& date) const {
    const Unit window = weekday_window();
    const int64_t first_day = date.granularity(window).day_number();
    const int64_t last_day = date.end_granularity(window).day_number();
    std::vector<int64_t> out;
    for (const auto& e : options_->by_day_of_week) {
        const int64_t first = first_day + temporal::weekday_distance(temporal::weekday_of_days(first_day), e.weekday);
        const int64_t last = last_day - temporal::weekday_distance(e.weekday, temporal::weekday_of_days(last_day));
        if (e.ordinal == 0) {
            for (int64_t d = first; d <= last_day; d += 7) out.push_back(d);
        } else if (e.ordinal > 0) {
            int64_t d = first + 7 * int64_t(e.ordinal - 1);
            if (d <= last_day) out.push_back(d);
        } else {
            int64_t d = last + 7 * int64_t(e.ordinal + 1);
            if (d >= first_day) out.push_back(d);
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

Instant Pipeline::day_at(const Instant& ref, int64_t day_number) const {
    return Instant::from_timestamp(day_number * MILLISECONDS_IN_DAY, ref.timezone());
}

StageResult Pipeline::pick_day(const Instant& c, const std::vector<int64_t>& days, Unit window) const {
    const int64_t today = c.day_number();
    if (forward()) {
        auto it = std::lower_bound(days.begin(), days.end(), today);
        if (it == days.end()) return StageResult::ascend_by(window);
        if (*it == today) return StageResult::valid();
        return StageResult::repair_to(day_at(c, *it));
    }
    auto it = std::upper_bound(days.begin(), days.end(), today);
    if (it == days.begin()) return StageResult::ascend_by(window);
    --it;
    if (*it == today) return StageResult::valid();
    return StageResult::repair_to(day_at(c, *it).end_granularity(Unit::Day));
}

StageResult Pipeline::evaluate_day_of_month(const Instant& c) const {
    const auto& o = *options_;
    if (o.by_day_of_month.empty()) return StageResult::valid();
    const int dim = temporal::days_in_month(c.year(), c.month());
    const int64_t first_day = c.granularity(Unit::Month).day_number();
    std::vector<int64_t> days;
    for (int d : o.by_day_of_month) {
        int resolved = d > 0 ? d : dim + 1 + d;
        if (resolved >= 1 && resolved <= dim) days.push_back(first_day + resolved - 1);
    }
    // day-level constraints are a conjunction: only keep days the weekday stage would accept
    if (!o.by_day_of_week.empty()) {
        if (weekday_ordinals()) {
            const auto allowed = weekday_window_days(c);
            days.erase(std::remove_if(days.begin(), days.end(), [&](int64_t d) {
                return !std::binary_search(allowed.begin(), allowed.end(), d);
            }), days.end());
        } else {
            days.erase(std::remove_if(days.begin(), days.end(), [&](int64_t d) {
                const auto w = temporal::weekday_of_days(d);
                return std::none_of(o.by_day_of_week.begin(), o.by_day_of_week.end(),
                    [&](const DayOfWeek& e) { return e.weekday == w; });
            }), days.end());
        }
    }
    std::sort(days.begin(), days.end());
    days.erase(std::unique(days.begin(), days.end()), days.end());
    return pick_day(c, days, Unit::Month);
}

StageResult Pipeline::evaluate_day_of_week(const Instant& c) const {
    const auto& o = *options_;
    if (o.by_day_of_week.empty()) return StageResult::valid();
    if (weekday_ordinals()) return pick_day(c, weekday_window_days(c), weekday_window());

    const int64_t today = c.day_number();
    for (int k = 0; k < 7; ++k) {
        const int64_t d = forward() ? today + k : today - k;
        const auto w = temporal::weekday_of_days(d);
        bool match = std::any_of(o.by_day_of_week.begin(), o.by_day_of_week.end(),
            [&](const DayOfWeek& e) { return e.weekday == w; });
        if (!match) continue;
        if (k == 0) return StageResult::valid();
        return StageResult::repair_to(forward() ? day_at(c, d) : day_at(c, d).end_granularity(Unit::Day));
    }
    return StageResult::valid();
}

StageResult Pipeline::evaluate_time_field(const Instant& c, const std::vector<int>& allowed,
                                          Unit field, Unit parent, int value) const {
    if (allowed.empty()) return StageResult::valid();
    if (forward()) {
        auto it = std::lower_bound(allowed.begin(), allowed.end(), value);
        if (it == allowed.end()) return StageResult::ascend_by(parent);
        if (*it == value) return StageResult::valid();
        return StageResult::repair_to(c.granularity(parent).set(field, *it));
    }
    auto it = std::upper_bound(allowed.begin(), allowed.end(), value);
    if (it == allowed.begin()) return StageResult::ascend_by(parent);
    --it;
    if (*it == value) return StageResult::valid();
    return StageResult::repair_to(c.granularity(parent).set(field, *it).end_granularity(field));
}

// Sets every time-of-day field finer than `unit` to its first allowed value
// (last, in reverse). `date` sits on a boundary of `unit`.
Instant Pipeline::fill_below(const Instant& date, Unit unit) const {
    const auto& o = *options_;
    auto pick = [&](const std::vector<int>& allowed, int lo, int hi) {
        if (allowed.empty()) return forward() ? lo : hi;
        return forward() ? allowed.front() : allowed.back();
    };
    Instant out = date;
    if (finer_than(Unit::Hour, unit)) out = out.set(Unit::Hour, pick(o.by_hour_of_day, 0, 23));
    if (finer_than(Unit::Minute, unit)) out = out.set(Unit::Minute, pick(o.by_minute_of_hour, 0, 59));
    if (finer_than(Unit::Second, unit)) out = out.set(Unit::Second, pick(o.by_second_of_minute, 0, 59));
    if (finer_than(Unit::Millisecond, unit)) out = out.set(Unit::Millisecond, pick(o.by_millisecond_of_second, 0, 999));
    return out;
}

Instant Pipeline::ascend(const Instant& candidate, Unit unit) const {
    const auto ws = options_->week_start;
    if (forward()) return candidate.end_granularity(unit, ws).add(1, Unit::Millisecond);
    return candidate.granularity(unit, ws).subtract(1, Unit::Millisecond);
}

Instant Pipeline::advance(const Instant& emitted) const {
    const auto& o = *options_;
    struct Level { Unit unit; const std::vector<int>* allowed; int value; int lo; int hi; };
    const Level levels[] = {
        {Unit::Millisecond, &o.by_millisecond_of_second, emitted.millisecond(), 0, 999},
        {Unit::Second, &o.by_second_of_minute, emitted.second(), 0, 59},
        {Unit::Minute, &o.by_minute_of_hour, emitted.minute(), 0, 59},
        {Unit::Hour, &o.by_hour_of_day, emitted.hour(), 0, 23},
    };
    for (const auto& level : levels) {
        const auto& allowed = *level.allowed;
        std::optional<int> next;
        if (forward()) {
            if (allowed.empty()) {
                if (level.value < level.hi) next = level.value + 1;
            } else {
                auto it = std::upper_bound(allowed.begin(), allowed.end(), level.value);
                if (it != allowed.end()) next = *it;
            }
        } else {
            if (allowed.empty()) {
                if (level.value > level.lo) next = level.value - 1;
            } else {
                auto it = std::lower_bound(allowed.begin(), allowed.end(), level.value);
                if (it != allowed.begin()) next = *(it - 1);
            }
        }
        if (next) return fill_below(emitted.set(level.unit, *next), level.unit);
    }
    return fill_below(ascend(emitted, Unit::Day), Unit::Day);
}

std::optional<Instant> Pipeline::resolve(Instant candidate, const std::optional<Instant>& limit) const {
    int repairs = 0;
    for (;;) {
        if (limit && (forward() ? candidate.is_after(*limit) : candidate.is_before(*limit))) return std::nullopt;

        bool accepted = true;
        for (StageKind stage : stages_) {
            StageResult r = evaluate(stage, candidate);
            if (r.status == StageResult::Status::Valid) continue;
            accepted = false;
            if (r.status == StageResult::Status::Repair) {
                candidate = fill_below(*r.repair, stage_unit(stage, options_->frequency));
            } else {
                candidate = fill_below(ascend(candidate, r.ascend), r.ascend);
            }
            break;
        }
        if (accepted) {
            observability::Metrics::instance().observe("pipeline_repairs_per_occurrence", repairs);
            return candidate;
        }

        if (++repairs > max_iterations_) {
            observability::log_error("pipeline.non_convergence", {
                {"candidate", candidate.to_iso_string()},
                {"iterations", static_cast<int64_t>(max_iterations_)},
                {"frequency", to_string(options_->frequency)}});
            observability::Metrics::instance().inc("non_convergence_total", "source", "pipeline");
            throw PipelineError("Failed to find a single matching occurrence in "
                + std::to_string(max_iterations_) + " iterations. Last iterated date: " + candidate.to_iso_string());
        }
    }
}

}
