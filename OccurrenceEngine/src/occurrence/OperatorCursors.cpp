#include "OperatorCursors.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

#include <algorithm>

namespace occurrence {

using temporal::Instant;
using temporal::Unit;

StreamNode::StreamNode(std::unique_ptr<Cursor> cursor) : cursor_(std::move(cursor)) {
    value_ = cursor_->next();
}

void StreamNode::pick() {
    value_ = cursor_->next();
}

void StreamNode::skip_to(const Instant& date, bool reverse) {
    if (!value_ || !precedes(*value_, date, reverse)) return;
    cursor_->skip_to(date);
    value_ = cursor_->next();
    while (value_ && precedes(*value_, date, reverse)) value_ = cursor_->next();
}

std::optional<Instant> OperatorCursor::next() {
    if (args_.take && emitted_ >= *args_.take) return std::nullopt;
    auto v = produce();
    if (v) ++emitted_;
    return v;
}

RunArgs OperatorCursor::upstream_args() const {
    RunArgs a = args_;
    a.take.reset();
    return a;
}

static RunArgs widen_start(RunArgs args, int64_t by) {
    if (args.start && by > 0) args.start = args.start->subtract(by, Unit::Millisecond);
    return args;
}

// ---- add ----

AddCursor::AddCursor(const std::vector<Generator>& inputs, const RunArgs& args) : OperatorCursor(args) {
    for (const auto& g : inputs) nodes_.emplace_back(open_cursor(g, upstream_args()));
}

std::optional<Instant> AddCursor::produce() {
    StreamNode* best = nullptr;
    for (auto& n : nodes_) {
        if (n.done()) continue;
        if (!best) {
            best = &n;
            continue;
        }
        int c = temporal::compare_exact(*n.value(), *best->value());
        if (reverse() ? c > 0 : c < 0) best = &n;
    }
    if (!best) return std::nullopt;
    Instant v = *best->value();
    best->pick();
    return v;
}

void AddCursor::skip_to(const Instant& date) {
    for (auto& n : nodes_) n.skip_to(date, reverse());
}

// ---- subtract ----

SubtractCursor::SubtractCursor(const Generator& base, const std::vector<Generator>& streams, const RunArgs& args)
    : OperatorCursor(args) {
    base_ = std::make_unique<StreamNode>(open_cursor(base, upstream_args()));
    if (streams.empty()) return;
    RunArgs excluded = upstream_args();
    if (reverse() && !excluded.end) {
        // nothing after the base's last value can matter
        if (base_->done()) return;
        excluded.end = *base_->value();
    }
    excluded_ = std::make_unique<StreamNode>(std::make_unique<AddCursor>(streams, excluded));
}

std::optional<Instant> SubtractCursor::produce() {
    while (!base_->done()) {
        Instant v = *base_->value();
        base_->pick();
        if (excluded_ && excluded(v)) continue;
        return v;
    }
    return std::nullopt;
}

// Several excluded values may share a timestamp with different durations, so
// the whole group at v's timestamp is held until the base moves past it.
bool SubtractCursor::excluded(const Instant& v) {
    if (group_.empty() || !group_.front().is_equal(v)) {
        group_.clear();
        excluded_->skip_to(v, reverse());
        while (excluded_->value() && excluded_->value()->is_equal(v)) {
            group_.push_back(*excluded_->value());
            excluded_->pick();
        }
    }
    return std::any_of(group_.begin(), group_.end(),
        [&](const Instant& e) { return temporal::compare(e, v) == 0; });
}

void SubtractCursor::skip_to(const Instant& date) {
    base_->skip_to(date, reverse());
    if (!group_.empty() && precedes(group_.front(), date, reverse())) group_.clear();
    if (excluded_) excluded_->skip_to(date, reverse());
}

// ---- intersection ----

IntersectionCursor::IntersectionCursor(const std::vector<Generator>& inputs, int max_failed_iterations, const RunArgs& args)
    : OperatorCursor(args), max_failed_iterations_(max_failed_iterations) {
    if (inputs.empty()) return;
    RunArgs up = upstream_args();
    std::vector<std::unique_ptr<StreamNode>> slots(inputs.size());
    if (reverse() && !up.end) {
        // the intersection cannot extend past the earliest last value of a finite input
        std::optional<Instant> end;
        for (size_t i = 0; i < inputs.size(); ++i) {
            if (is_infinite(inputs[i])) continue;
            slots[i] = std::make_unique<StreamNode>(open_cursor(inputs[i], up));
            if (slots[i]->done()) return;
            if (!end || slots[i]->value()->is_before(*end)) end = *slots[i]->value();
        }
        if (!end) throw ArgumentError("reverse traversal of an infinite intersection requires an end date");
        up.end = end;
    }
    for (size_t i = 0; i < inputs.size(); ++i) {
        if (!slots[i]) slots[i] = std::make_unique<StreamNode>(open_cursor(inputs[i], up));
        nodes_.push_back(std::move(*slots[i]));
    }
}

bool IntersectionCursor::align() {
    int failed = 0;
    for (;;) {
        for (const auto& n : nodes_) {
            if (n.done()) return false;
        }
        Instant target = *nodes_.front().value();
        for (const auto& n : nodes_) {
            if (precedes(target, *n.value(), reverse())) target = *n.value();
        }
        bool matched = std::all_of(nodes_.begin(), nodes_.end(),
            [&](const StreamNode& n) { return n.value()->is_equal(target); });
        if (matched) {
            aligned_ = target;
            return true;
        }
        if (++failed > max_failed_iterations_) {
            observability::log_error("intersection.non_convergence", {
                {"target", target.to_iso_string()},
                {"iterations", static_cast<int64_t>(max_failed_iterations_)}});
            observability::Metrics::instance().inc("non_convergence_total", "source", "intersection");
            throw IntersectionError("IntersectionOperator: failed to find a single matching value in "
                + std::to_string(max_failed_iterations_) + " iterations. Last target: " + target.to_iso_string());
        }
        for (auto& n : nodes_) n.skip_to(target, reverse());
    }
}

std::optional<Instant> IntersectionCursor::produce() {
    if (nodes_.empty()) return std::nullopt;
    for (;;) {
        if (aligned_) {
            for (auto& n : nodes_) {
                if (n.value() && n.value()->is_equal(*aligned_)) {
                    Instant v = *n.value();
                    n.pick();
                    return v;
                }
            }
            aligned_.reset();
        }
        if (!align()) return std::nullopt;
    }
}

void IntersectionCursor::skip_to(const Instant& date) {
    if (aligned_ && precedes(*aligned_, date, reverse())) aligned_.reset();
    for (auto& n : nodes_) n.skip_to(date, reverse());
}

// ---- unique ----

UniqueCursor::UniqueCursor(const Generator& base, const RunArgs& args)
    : OperatorCursor(args), base_(open_cursor(base, upstream_args())) {}

std::optional<Instant> UniqueCursor::produce() {
    if (base_.done()) return std::nullopt;
    Instant v = *base_.value();
    base_.pick();
    while (base_.value() && temporal::compare_exact(*base_.value(), v) == 0) base_.pick();
    return v;
}

void UniqueCursor::skip_to(const Instant& date) {
    base_.skip_to(date, reverse());
}

// ---- merge duration ----

MergeDurationCursor::MergeDurationCursor(const Generator& base, int64_t max_duration, const RunArgs& args)
    : OperatorCursor(args),
      base_(open_cursor(base, widen_start(upstream_args(), max_duration))),
      max_duration_(max_duration) {}

std::optional<Instant> MergeDurationCursor::peek() const {
    if (!pending_.empty()) return pending_.front();
    return base_.value();
}

Instant MergeDurationCursor::take_next() {
    if (!pending_.empty()) {
        Instant v = pending_.front();
        pending_.pop_front();
        return v;
    }
    Instant v = *base_.value();
    base_.pick();
    return v;
}

void MergeDurationCursor::fail(const Instant& first, int64_t length) const {
    observability::log_error("merge_duration.exceeded", {
        {"start", first.to_iso_string()},
        {"length_ms", length},
        {"max_duration_ms", max_duration_}});
    observability::Metrics::instance().inc("non_convergence_total", "source", "merge_duration");
    throw MergeDurationError("MergeDurationOperator: merged interval starting at " + first.to_iso_string()
        + " lasts " + std::to_string(length) + "ms, longer than maxDuration " + std::to_string(max_duration_) + "ms");
}

std::optional<Instant> MergeDurationCursor::produce() {
    return reverse() ? produce_reverse() : produce_forward();
}

std::optional<Instant> MergeDurationCursor::produce_forward() {
    while (peek()) {
        Instant first = take_next();
        int64_t s = first.value_of();
        int64_t e = s + first.duration();
        if (e - s > max_duration_) fail(first, e - s);
        while (auto n = peek()) {
            if (n->value_of() > e) break;
            e = std::max(e, n->value_of() + n->duration());
            take_next();
            if (e - s > max_duration_) fail(first, e - s);
        }
        if (args_.start && e < args_.start->value_of()) continue;
        return Instant::from_timestamp(s, first.timezone(), e - s);
    }
    return std::nullopt;
}

std::optional<Instant> MergeDurationCursor::produce_reverse() {
    if (!peek()) return std::nullopt;
    Instant first = take_next();
    int64_t s = first.value_of();
    int64_t e = s + first.duration();
    if (e - s > max_duration_) fail(first, e - s);

    // values starting more than max_duration before the group cannot join it
    std::vector<Instant> window;
    bool merged = true;
    while (merged) {
        while (auto n = peek()) {
            if (n->value_of() < s - max_duration_) break;
            window.push_back(take_next());
        }
        merged = false;
        for (auto it = window.begin(); it != window.end();) {
            const int64_t ve = it->value_of() + it->duration();
            if (ve < s) {
                ++it;
                continue;
            }
            s = std::min(s, it->value_of());
            e = std::max(e, ve);
            it = window.erase(it);
            merged = true;
            if (e - s > max_duration_) fail(first, e - s);
        }
    }
    pending_.insert(pending_.begin(), window.begin(), window.end());

    if (args_.start && e < args_.start->value_of()) return std::nullopt;
    return Instant::from_timestamp(s, first.timezone(), e - s);
}

void MergeDurationCursor::skip_to(const Instant& date) {
    const Instant bound = reverse() ? date : date.subtract(max_duration_, Unit::Millisecond);
    while (!pending_.empty() && precedes(pending_.front(), bound, reverse())) pending_.pop_front();
    if (pending_.empty()) base_.skip_to(bound, reverse());
}

// ---- split duration ----

SplitDurationCursor::SplitDurationCursor(const Generator& base, int64_t max_duration, SplitFn split, const RunArgs& args)
    : OperatorCursor(args),
      base_(open_cursor(base, widen_start(upstream_args(), std::max(max_duration, occurrence::max_duration(base))))),
      max_duration_(max_duration),
      base_max_duration_(occurrence::max_duration(base)),
      split_(std::move(split)) {}

void SplitDurationCursor::split_into(const Instant& interval, std::vector<Instant>& out) const {
    if (interval.duration() <= max_duration_) {
        out.push_back(interval);
        return;
    }
    for (const auto& piece : split_(interval)) {
        if (piece.duration() >= interval.duration()) {
            observability::log_error("split_duration.no_progress", {
                {"start", interval.to_iso_string()},
                {"duration_ms", interval.duration()},
                {"max_duration_ms", max_duration_}});
            observability::Metrics::instance().inc("non_convergence_total", "source", "split_duration");
            throw SplitDurationError("SplitDurationOperator: splitting the interval at " + interval.to_iso_string()
                + " did not shorten it below " + std::to_string(interval.duration()) + "ms");
        }
        split_into(piece, out);
    }
}

// Pieces lie within their parent interval, so no parent still to come can
// yield a piece ahead of `piece` once this holds.
bool SplitDurationCursor::releasable(const Instant& piece) const {
    if (base_.done()) return true;
    const int64_t head = base_.value()->value_of();
    if (!reverse()) return piece.value_of() < head;
    return piece.value_of() > head + base_max_duration_;
}

bool SplitDurationCursor::in_bounds(const Instant& piece) const {
    if (args_.start && piece.value_of() + piece.duration() < args_.start->value_of()) return false;
    if (args_.end && piece.value_of() > args_.end->value_of()) return false;
    return true;
}

std::optional<Instant> SplitDurationCursor::produce() {
    const bool rev = reverse();
    auto before = [rev](const Instant& a, const Instant& b) {
        const int c = temporal::compare_exact(a, b);
        return rev ? c > 0 : c < 0;
    };
    for (;;) {
        if (!buffer_.empty() && releasable(buffer_.front())) {
            Instant piece = buffer_.front();
            buffer_.erase(buffer_.begin());
            if (in_bounds(piece)) return piece;
            continue;
        }
        if (base_.done()) return std::nullopt;
        Instant parent = *base_.value();
        base_.pick();
        std::vector<Instant> pieces;
        split_into(parent, pieces);
        for (const auto& p : pieces) buffer_.insert(std::upper_bound(buffer_.begin(), buffer_.end(), p, before), p);
    }
}

void SplitDurationCursor::skip_to(const Instant& date) {
    while (!buffer_.empty() && precedes(buffer_.front(), date, reverse())) buffer_.erase(buffer_.begin());
    base_.skip_to(reverse() ? date : date.subtract(base_max_duration_, Unit::Millisecond), reverse());
}

}
