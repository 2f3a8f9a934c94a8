#include "Instant.h"
#include "../json/MiniJson.h"

#include <algorithm>
#include <cstdio>
#include <limits>

namespace temporal {

static void check_range(const char* field, int value, int lo, int hi) {
    if (value < lo || value > hi) {
        throw InvalidDateError(std::string("invalid ") + field + " " + std::to_string(value));
    }
}

static void check_duration(int64_t duration) {
    if (duration < 0) throw std::invalid_argument("duration must be a non-negative integer");
}

Instant::Instant(int64_t timestamp, TimezoneLabel timezone, int64_t duration)
    : timestamp_(timestamp), timezone_(std::move(timezone)), duration_(duration) {
    int64_t days = floor_div(timestamp_, MILLISECONDS_IN_DAY);
    int64_t rem = timestamp_ - days * MILLISECONDS_IN_DAY;
    civil_from_days(days, year_, month_, day_);
    hour_ = static_cast<int>(rem / MILLISECONDS_IN_HOUR);
    minute_ = static_cast<int>((rem % MILLISECONDS_IN_HOUR) / MILLISECONDS_IN_MINUTE);
    second_ = static_cast<int>((rem % MILLISECONDS_IN_MINUTE) / MILLISECONDS_IN_SECOND);
    millisecond_ = static_cast<int>(rem % MILLISECONDS_IN_SECOND);
    weekday_ = weekday_of_days(days);
}

Instant Instant::from_civil(int year, int month, int day, int hour, int minute, int second, int millisecond,
                            const TimezoneLabel& timezone, int64_t duration) {
    check_range("month", month, 1, 12);
    check_range("day", day, 1, days_in_month(year, month));
    check_range("hour", hour, 0, 23);
    check_range("minute", minute, 0, 59);
    check_range("second", second, 0, 59);
    check_range("millisecond", millisecond, 0, 999);
    int64_t ts = days_from_civil(year, month, day) * MILLISECONDS_IN_DAY
        + hour * MILLISECONDS_IN_HOUR + minute * MILLISECONDS_IN_MINUTE
        + second * MILLISECONDS_IN_SECOND + millisecond;
    return Instant(ts, timezone, duration);
}

Instant Instant::from_fields(const InstantFields& f) {
    check_duration(f.duration);
    return from_civil(f.year, f.month, f.day, f.hour, f.minute, f.second, f.millisecond, f.timezone, f.duration);
}

Instant Instant::from_timestamp(int64_t timestamp, const TimezoneLabel& timezone, int64_t duration) {
    check_duration(duration);
    return Instant(timestamp, timezone, duration);
}

std::optional<Instant> Instant::end() const {
    if (duration_ == 0) return std::nullopt;
    return Instant(timestamp_ + duration_, timezone_, 0);
}

int Instant::yearday() const {
    return static_cast<int>(days_from_civil(year_, month_, day_) - days_from_civil(year_, 1, 1)) + 1;
}

Instant Instant::add_months(int64_t months) const {
    int64_t index = int64_t(year_) * 12 + (month_ - 1) + months;
    int y = static_cast<int>(floor_div(index, 12));
    int m = static_cast<int>(index - int64_t(y) * 12) + 1;
    int d = std::min(day_, days_in_month(y, m));
    return from_civil(y, m, d, hour_, minute_, second_, millisecond_, timezone_, duration_);
}

Instant Instant::add(int64_t amount, Unit unit) const {
    switch (unit) {
        case Unit::Year: return add_months(amount * 12);
        case Unit::Month: return add_months(amount);
        case Unit::Week: return Instant(timestamp_ + amount * MILLISECONDS_IN_WEEK, timezone_, duration_);
        case Unit::Day: return Instant(timestamp_ + amount * MILLISECONDS_IN_DAY, timezone_, duration_);
        case Unit::Hour: return Instant(timestamp_ + amount * MILLISECONDS_IN_HOUR, timezone_, duration_);
        case Unit::Minute: return Instant(timestamp_ + amount * MILLISECONDS_IN_MINUTE, timezone_, duration_);
        case Unit::Second: return Instant(timestamp_ + amount * MILLISECONDS_IN_SECOND, timezone_, duration_);
        case Unit::Millisecond: return Instant(timestamp_ + amount, timezone_, duration_);
    }
    throw std::invalid_argument("unknown unit");
}

Instant Instant::set(Unit unit, int value) const {
    switch (unit) {
        case Unit::Year: {
            int d = std::min(day_, days_in_month(value, month_));
            return from_civil(value, month_, d, hour_, minute_, second_, millisecond_, timezone_, duration_);
        }
        case Unit::Month: {
            check_range("month", value, 1, 12);
            int d = std::min(day_, days_in_month(year_, value));
            return from_civil(year_, value, d, hour_, minute_, second_, millisecond_, timezone_, duration_);
        }
        case Unit::Day: return from_civil(year_, month_, value, hour_, minute_, second_, millisecond_, timezone_, duration_);
        case Unit::Hour: return from_civil(year_, month_, day_, value, minute_, second_, millisecond_, timezone_, duration_);
        case Unit::Minute: return from_civil(year_, month_, day_, hour_, value, second_, millisecond_, timezone_, duration_);
        case Unit::Second: return from_civil(year_, month_, day_, hour_, minute_, value, millisecond_, timezone_, duration_);
        case Unit::Millisecond: return from_civil(year_, month_, day_, hour_, minute_, second_, value, timezone_, duration_);
        case Unit::Week: break;
    }
    throw std::invalid_argument("week is not a settable field");
}

Instant Instant::granularity(Unit unit, Weekday week_start) const {
    switch (unit) {
        case Unit::Year: return from_civil(year_, 1, 1, 0, 0, 0, 0, timezone_, duration_);
        case Unit::Month: return from_civil(year_, month_, 1, 0, 0, 0, 0, timezone_, duration_);
        case Unit::Week: {
            int back = weekday_distance(week_start, weekday_);
            return Instant((day_number() - back) * MILLISECONDS_IN_DAY, timezone_, duration_);
        }
        case Unit::Day: return Instant(day_number() * MILLISECONDS_IN_DAY, timezone_, duration_);
        case Unit::Hour: return Instant(floor_div(timestamp_, MILLISECONDS_IN_HOUR) * MILLISECONDS_IN_HOUR, timezone_, duration_);
        case Unit::Minute: return Instant(floor_div(timestamp_, MILLISECONDS_IN_MINUTE) * MILLISECONDS_IN_MINUTE, timezone_, duration_);
        case Unit::Second: return Instant(floor_div(timestamp_, MILLISECONDS_IN_SECOND) * MILLISECONDS_IN_SECOND, timezone_, duration_);
        case Unit::Millisecond: return *this;
    }
    throw std::invalid_argument("unknown unit");
}

Instant Instant::end_granularity(Unit unit, Weekday week_start) const {
    switch (unit) {
        case Unit::Year: return from_civil(year_, 12, 31, 23, 59, 59, 999, timezone_, duration_);
        case Unit::Month: return from_civil(year_, month_, days_in_month(year_, month_), 23, 59, 59, 999, timezone_, duration_);
        case Unit::Week: return granularity(Unit::Week, week_start).add(MILLISECONDS_IN_WEEK - 1, Unit::Millisecond);
        case Unit::Day: return granularity(Unit::Day).add(MILLISECONDS_IN_DAY - 1, Unit::Millisecond);
        case Unit::Hour: return granularity(Unit::Hour).add(MILLISECONDS_IN_HOUR - 1, Unit::Millisecond);
        case Unit::Minute: return granularity(Unit::Minute).add(MILLISECONDS_IN_MINUTE - 1, Unit::Millisecond);
        case Unit::Second: return granularity(Unit::Second).add(MILLISECONDS_IN_SECOND - 1, Unit::Millisecond);
        case Unit::Millisecond: return *this;
    }
    throw std::invalid_argument("unknown unit");
}

Instant Instant::with_duration(int64_t duration) const {
    check_duration(duration);
    return Instant(timestamp_, timezone_, duration);
}

Instant Instant::with_timezone(const TimezoneLabel& timezone) const {
    return Instant(timestamp_, timezone, duration_);
}

void Instant::assert_comparable(const Instant& other) const {
    if (timezone_ != other.timezone_) {
        throw ComparisonError("cannot compare instants with different timezones: "
            + to_string(timezone_) + " and " + to_string(other.timezone_));
    }
}

bool Instant::is_equal(const Instant& other) const {
    assert_comparable(other);
    return timestamp_ == other.timestamp_;
}

bool Instant::is_before(const Instant& other) const {
    assert_comparable(other);
    return timestamp_ < other.timestamp_;
}

bool Instant::is_before_or_equal(const Instant& other) const {
    assert_comparable(other);
    return timestamp_ <= other.timestamp_;
}

bool Instant::is_after(const Instant& other) const {
    assert_comparable(other);
    return timestamp_ > other.timestamp_;
}

bool Instant::is_after_or_equal(const Instant& other) const {
    assert_comparable(other);
    return timestamp_ >= other.timestamp_;
}

bool Instant::is_occurring(const Instant& date) const {
    if (duration_ == 0) throw std::logic_error("is_occurring requires an instant with a duration");
    return date.is_after_or_equal(*this) && date.value_of() <= timestamp_ + duration_;
}

InstantFields Instant::to_fields() const {
    InstantFields f;
    f.timezone = timezone_;
    f.year = year_;
    f.month = month_;
    f.day = day_;
    f.hour = hour_;
    f.minute = minute_;
    f.second = second_;
    f.millisecond = millisecond_;
    f.duration = duration_;
    return f;
}

std::string Instant::to_json() const {
    std::string out = "{\"timezone\":";
    out += timezone_ ? "\"" + json_escape(*timezone_) + "\"" : std::string("null");
    out += ",\"year\":" + std::to_string(year_);
    out += ",\"month\":" + std::to_string(month_);
    out += ",\"day\":" + std::to_string(day_);
    out += ",\"hour\":" + std::to_string(hour_);
    out += ",\"minute\":" + std::to_string(minute_);
    out += ",\"second\":" + std::to_string(second_);
    out += ",\"millisecond\":" + std::to_string(millisecond_);
    if (duration_ != 0) out += ",\"duration\":" + std::to_string(duration_);
    out += "}";
    return out;
}

static int json_field_int(const std::string& js, const std::string& key, bool required, int fallback) {
    auto p = json_extract_int_present(js, key);
    if (!p.first) {
        if (required) throw InvalidDateError("missing field '" + key + "'");
        return fallback;
    }
    if (p.second < std::numeric_limits<int>::min() || p.second > std::numeric_limits<int>::max()) {
        throw InvalidDateError("field '" + key + "' out of range");
    }
    return static_cast<int>(p.second);
}

Instant Instant::from_json(const std::string& js) {
    InstantFields f;
    auto tz = json_extract_string_opt_present(js, "timezone");
    if (tz.first) f.timezone = tz.second;
    f.year = json_field_int(js, "year", true, 0);
    f.month = json_field_int(js, "month", true, 0);
    f.day = json_field_int(js, "day", true, 0);
    f.hour = json_field_int(js, "hour", false, 0);
    f.minute = json_field_int(js, "minute", false, 0);
    f.second = json_field_int(js, "second", false, 0);
    f.millisecond = json_field_int(js, "millisecond", false, 0);
    f.duration = json_extract_int_opt(js, "duration").value_or(0);
    return from_fields(f);
}

std::string Instant::to_iso_string() const {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d%s",
        year_, month_, day_, hour_, minute_, second_, millisecond_,
        (timezone_ && *timezone_ == "UTC") ? "Z" : "");
    return std::string(buf);
}

static std::optional<int> digits_at(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return std::nullopt;
    return parse_int_strict_sv(std::string_view(s).substr(pos, len));
}

std::optional<Instant> Instant::parse_iso(const std::string& s_in) {
    std::string s = s_in;
    if (s.size() < 19) return std::nullopt;
    if (s[10] == ' ') s[10] = 'T';
    if (s[4] != '-' || s[7] != '-' || s[10] != 'T' || s[13] != ':' || s[16] != ':') return std::nullopt;

    TimezoneLabel tz;
    if (s.back() == 'Z') {
        tz = std::string("UTC");
        s.pop_back();
    } else {
        for (const char* off : {"+00:00", "+0000", "+00"}) {
            std::string o(off);
            if (s.size() >= 19 + o.size() && s.compare(s.size() - o.size(), o.size(), o) == 0) {
                tz = std::string("UTC");
                s.erase(s.size() - o.size());
                break;
            }
        }
    }

    int ms = 0;
    if (s.size() > 19) {
        if (s[19] != '.' || s.size() == 20 || s.size() > 23) return std::nullopt;
        auto frac = digits_at(s, 20, s.size() - 20);
        if (!frac || *frac < 0) return std::nullopt;
        ms = *frac;
        for (size_t i = s.size() - 20; i < 3; ++i) ms *= 10;
    }

    auto y = digits_at(s, 0, 4);
    auto mo = digits_at(s, 5, 2);
    auto d = digits_at(s, 8, 2);
    auto h = digits_at(s, 11, 2);
    auto mi = digits_at(s, 14, 2);
    auto sec = digits_at(s, 17, 2);
    if (!y || !mo || !d || !h || !mi || !sec) return std::nullopt;

    try {
        return from_civil(*y, *mo, *d, *h, *mi, *sec, ms, tz, 0);
    } catch (const InvalidDateError&) {
        return std::nullopt;
    }
}

int compare(const Instant& a, const Instant& b) {
    if (a.is_before(b)) return -1;
    if (a.value_of() != b.value_of()) return 1;
    if (a.duration() != 0 && b.duration() != 0 && a.duration() != b.duration()) {
        return a.duration() < b.duration() ? -1 : 1;
    }
    return 0;
}

int compare_exact(const Instant& a, const Instant& b) {
    if (a.is_before(b)) return -1;
    if (a.value_of() != b.value_of()) return 1;
    if (a.duration() == b.duration()) return 0;
    return a.duration() < b.duration() ? -1 : 1;
}

std::string to_string(const TimezoneLabel& timezone) {
    return timezone ? *timezone : std::string("null");
}

}
