#pragma once

#include "Generator.h"
#include "../recurrence/Pipeline.h"

#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace occurrence {

// Union of the base and every stream; duplicates are kept.
struct AddOperator {
    std::vector<Generator> streams;
};

// Base values not present in any of the streams.
struct SubtractOperator {
    std::vector<Generator> streams;
};

// Values present in the base and every stream. Gives up after
// `max_failed_iterations` realignments without a match.
struct IntersectionOperator {
    std::vector<Generator> streams;
    int max_failed_iterations = 50;
};

struct UniqueOperator {};

// Merges overlapping or touching intervals of the base.
struct MergeDurationOperator {
    int64_t max_duration = 0;
};

using SplitFn = std::function<std::vector<temporal::Instant>(const temporal::Instant&)>;

// Splits every base interval longer than max_duration with `split`,
// recursively, until each piece fits.
struct SplitDurationOperator {
    int64_t max_duration = 0;
    SplitFn split;
};

using Operator = std::variant<AddOperator, SubtractOperator, IntersectionOperator,
                              UniqueOperator, MergeDurationOperator, SplitDurationOperator>;

class IntersectionError : public recurrence::NonConvergenceError {
public:
    using recurrence::NonConvergenceError::NonConvergenceError;
};

class MergeDurationError : public recurrence::NonConvergenceError {
public:
    using recurrence::NonConvergenceError::NonConvergenceError;
};

class SplitDurationError : public recurrence::NonConvergenceError {
public:
    using recurrence::NonConvergenceError::NonConvergenceError;
};

Operator add(std::vector<Generator> streams);
Operator subtract(std::vector<Generator> streams);
// The failure bound is read from the installed config.
Operator intersection(std::vector<Generator> streams);
Operator intersection(std::vector<Generator> streams, int max_failed_iterations);
Operator unique();
Operator merge_duration(int64_t max_duration);
Operator split_duration(int64_t max_duration, SplitFn split);

// An operator applied on top of an optional base generator.
class OccurrenceStream {
public:
    OccurrenceStream(Operator op, std::optional<Generator> base);

    const Operator& op() const { return op_; }
    const std::optional<Generator>& base() const { return base_; }

    bool is_infinite() const;
    bool has_duration() const;
    int64_t max_duration() const;

    std::unique_ptr<Cursor> open(const RunArgs& args) const;

private:
    // base first, then the operator's own streams
    std::vector<Generator> inputs() const;

    Operator op_;
    std::optional<Generator> base_;
};

// Applies `operators` left to right, each taking the previous as its base.
Generator pipe(std::vector<Operator> operators);
Generator pipe(Generator base, std::vector<Operator> operators);

// ((rrules - exrules) + rdates) - exdates, deduplicated. Exclusion rules never
// suppress explicit dates.
Generator precedence_stream(std::vector<Generator> rrules, std::vector<Generator> exrules,
                            std::vector<Generator> rdates, std::vector<Generator> exdates);

}
