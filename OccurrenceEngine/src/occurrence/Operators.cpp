#include "Operators.h"
#include "OperatorCursors.h"
#include "../config/Config.h"

#include <algorithm>
#include <type_traits>

namespace occurrence {

Operator add(std::vector<Generator> streams) { return AddOperator{std::move(streams)}; }

Operator subtract(std::vector<Generator> streams) { return SubtractOperator{std::move(streams)}; }

Operator intersection(std::vector<Generator> streams) {
    return IntersectionOperator{std::move(streams), config::current().max_failed_intersection_iterations};
}

Operator intersection(std::vector<Generator> streams, int max_failed_iterations) {
    return IntersectionOperator{std::move(streams), max_failed_iterations};
}

Operator unique() { return UniqueOperator{}; }

Operator merge_duration(int64_t max_duration) { return MergeDurationOperator{max_duration}; }

Operator split_duration(int64_t max_duration, SplitFn split) {
    return SplitDurationOperator{max_duration, std::move(split)};
}

template <class T>
constexpr bool needs_duration_v = std::is_same_v<T, MergeDurationOperator> || std::is_same_v<T, SplitDurationOperator>;

OccurrenceStream::OccurrenceStream(Operator op, std::optional<Generator> base)
    : op_(std::move(op)), base_(std::move(base)) {
    std::visit([&](const auto& o) {
        using T = std::decay_t<decltype(o)>;
        if constexpr (needs_duration_v<T>) {
            if (o.max_duration <= 0) throw ArgumentError("maxDuration must be positive");
            if (!base_) throw ArgumentError("duration operators require a base stream");
            if (!occurrence::has_duration(*base_)) throw ArgumentError("duration operators require a base stream with durations");
        }
        if constexpr (std::is_same_v<T, SplitDurationOperator>) {
            if (!o.split) throw ArgumentError("SplitDurationOperator requires a split function");
        }
        if constexpr (std::is_same_v<T, IntersectionOperator>) {
            if (o.max_failed_iterations < 1) throw ArgumentError("maxFailedIterations must be at least 1");
        }
    }, op_);
}

std::vector<Generator> OccurrenceStream::inputs() const {
    std::vector<Generator> out;
    if (base_) out.push_back(*base_);
    if (const auto* a = std::get_if<AddOperator>(&op_)) out.insert(out.end(), a->streams.begin(), a->streams.end());
    if (const auto* i = std::get_if<IntersectionOperator>(&op_)) out.insert(out.end(), i->streams.begin(), i->streams.end());
    return out;
}

bool OccurrenceStream::is_infinite() const {
    if (std::holds_alternative<AddOperator>(op_)) {
        const auto in = inputs();
        return std::any_of(in.begin(), in.end(), [](const Generator& g) { return occurrence::is_infinite(g); });
    }
    if (std::holds_alternative<IntersectionOperator>(op_)) {
        const auto in = inputs();
        return !in.empty() && std::all_of(in.begin(), in.end(), [](const Generator& g) { return occurrence::is_infinite(g); });
    }
    return base_ && occurrence::is_infinite(*base_);
}

bool OccurrenceStream::has_duration() const {
    if (std::holds_alternative<AddOperator>(op_) || std::holds_alternative<IntersectionOperator>(op_)) {
        const auto in = inputs();
        return !in.empty() && std::all_of(in.begin(), in.end(), [](const Generator& g) { return occurrence::has_duration(g); });
    }
    return base_ && occurrence::has_duration(*base_);
}

int64_t OccurrenceStream::max_duration() const {
    if (const auto* m = std::get_if<MergeDurationOperator>(&op_)) return m->max_duration;
    if (const auto* s = std::get_if<SplitDurationOperator>(&op_)) return s->max_duration;
    int64_t out = 0;
    for (const auto& g : inputs()) out = std::max(out, occurrence::max_duration(g));
    return out;
}

std::unique_ptr<Cursor> OccurrenceStream::open(const RunArgs& args) const {
    return std::visit([&](const auto& o) -> std::unique_ptr<Cursor> {
        using T = std::decay_t<decltype(o)>;
        if constexpr (std::is_same_v<T, AddOperator>) {
            return std::make_unique<AddCursor>(inputs(), args);
        } else if constexpr (std::is_same_v<T, IntersectionOperator>) {
            return std::make_unique<IntersectionCursor>(inputs(), o.max_failed_iterations, args);
        } else {
            if (!base_) return std::make_unique<EmptyCursor>();
            if constexpr (std::is_same_v<T, SubtractOperator>) {
                return std::make_unique<SubtractCursor>(*base_, o.streams, args);
            } else if constexpr (std::is_same_v<T, UniqueOperator>) {
                return std::make_unique<UniqueCursor>(*base_, args);
            } else if constexpr (std::is_same_v<T, MergeDurationOperator>) {
                return std::make_unique<MergeDurationCursor>(*base_, o.max_duration, args);
            } else {
                return std::make_unique<SplitDurationCursor>(*base_, o.max_duration, o.split, args);
            }
        }
    }, op_);
}

Generator pipe(std::vector<Operator> operators) {
    if (operators.empty()) throw ArgumentError("pipe requires at least one operator");
    std::optional<Generator> current;
    for (auto& op : operators) current = Generator(std::make_shared<const OccurrenceStream>(std::move(op), current));
    return *current;
}

Generator pipe(Generator base, std::vector<Operator> operators) {
    Generator current = std::move(base);
    for (auto& op : operators) current = Generator(std::make_shared<const OccurrenceStream>(std::move(op), current));
    return current;
}

Generator precedence_stream(std::vector<Generator> rrules, std::vector<Generator> exrules,
                            std::vector<Generator> rdates, std::vector<Generator> exdates) {
    std::vector<Operator> ops;
    ops.push_back(add(std::move(rrules)));
    ops.push_back(subtract(std::move(exrules)));
    ops.push_back(add(std::move(rdates)));
    ops.push_back(subtract(std::move(exdates)));
    ops.push_back(unique());
    return pipe(std::move(ops));
}

}
