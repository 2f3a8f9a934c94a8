#pragma once

#include "RuleOptions.h"

#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

namespace recurrence {

enum class Direction { Forward, Reverse };

enum class StageKind {
    Frequency,
    MonthOfYear,
    DayOfMonth,
    DayOfWeek,
    HourOfDay,
    MinuteOfHour,
    SecondOfMinute,
    MillisecondOfSecond
};

struct StageResult {
    enum class Status { Valid, Repair, Ascend };
    Status status = Status::Valid;
    std::optional<temporal::Instant> repair;
    temporal::Unit ascend = temporal::Unit::Day;

    static StageResult valid() { return StageResult{}; }
    static StageResult repair_to(const temporal::Instant& date) {
        StageResult r;
        r.status = Status::Repair;
        r.repair = date;
        return r;
    }
    static StageResult ascend_by(temporal::Unit unit) {
        StageResult r;
        r.status = Status::Ascend;
        r.ascend = unit;
        return r;
    }
};

class NonConvergenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class PipelineError : public NonConvergenceError {
public:
    using NonConvergenceError::NonConvergenceError;
};

// Ordered constraint stages for one rule, coarsest first. Each stage either
// accepts a candidate, repairs it to the nearest instant that could satisfy
// it (never skipping a valid occurrence), or asks for the candidate to be
// moved into the next window of a coarser unit.
class Pipeline {
public:
    Pipeline(std::shared_ptr<const NormalizedRuleOptions> options, Direction direction, int max_iterations);

    const std::vector<StageKind>& stages() const { return stages_; }
    Direction direction() const { return direction_; }

    StageResult evaluate(StageKind stage, const temporal::Instant& candidate) const;

    // First instant at or after `candidate` (at or before, in reverse) that
    // passes every stage; nullopt once the candidate crosses `limit`.
    // Throws PipelineError after max_iterations consecutive repairs.
    std::optional<temporal::Instant> resolve(temporal::Instant candidate, const std::optional<temporal::Instant>& limit) const;

    // Smallest candidate strictly after `emitted` (before, in reverse) whose
    // time-of-day fields are all allowed.
    temporal::Instant advance(const temporal::Instant& emitted) const;

    temporal::Instant ascend(const temporal::Instant& candidate, temporal::Unit unit) const;

private:
    bool forward() const { return direction_ == Direction::Forward; }

    StageResult evaluate_frequency(const temporal::Instant& c) const;
    StageResult evaluate_month(const temporal::Instant& c) const;
    StageResult evaluate_day_of_month(const temporal::Instant& c) const;
    StageResult evaluate_day_of_week(const temporal::Instant& c) const;
    StageResult evaluate_time_field(const temporal::Instant& c, const std::vector<int>& allowed,
                                    temporal::Unit field, temporal::Unit parent, int value) const;

    int64_t period_index(const temporal::Instant& date) const;
    temporal::Instant period_start(int64_t index) const;
    StageResult pick_day(const temporal::Instant& c, const std::vector<int64_t>& days, temporal::Unit window) const;
    std::vector<int64_t> weekday_window_days(const temporal::Instant& date) const;
    temporal::Unit weekday_window() const;
    bool weekday_ordinals() const;
    temporal::Instant day_at(const temporal::Instant& ref, int64_t day_number) const;
    temporal::Instant fill_below(const temporal::Instant& date, temporal::Unit unit) const;

    std::shared_ptr<const NormalizedRuleOptions> options_;
    Direction direction_;
    int max_iterations_;
    std::vector<StageKind> stages_;
};

}
