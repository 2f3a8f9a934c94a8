#include "Iterators.h"
#include "../config/Config.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

namespace occurrence {

using temporal::Instant;
using temporal::Unit;

OccurrenceIterator::OccurrenceIterator(const Generator& generator, const RunArgs& args)
    : kind_(generator_kind(generator)) {
    const bool infinite = is_infinite(generator);
    if (args.reverse && infinite && !args.end) {
        throw ArgumentError("reverse traversal of an infinite generator requires an end date");
    }
    bounded_ = !infinite || args.end.has_value() || args.take.has_value();
    observability::log_debug("traversal.open", {
        {"generator", kind_},
        {"reverse", static_cast<int64_t>(args.reverse)},
        {"start", args.start ? args.start->to_iso_string() : std::string("-")},
        {"end", args.end ? args.end->to_iso_string() : std::string("-")}});
    cursor_ = open_cursor(generator, args);
}

std::optional<Instant> OccurrenceIterator::next() {
    auto v = cursor_->next();
    if (v) observability::Metrics::instance().inc("occurrence_emitted_total", "generator", kind_);
    return v;
}

void OccurrenceIterator::skip_to(const Instant& date) {
    cursor_->skip_to(date);
}

std::vector<Instant> OccurrenceIterator::to_vector() {
    if (!bounded_) throw ArgumentError("cannot collect an infinite occurrence stream without an end date or take");
    std::vector<Instant> out;
    while (auto v = next()) out.push_back(*v);
    return out;
}

OccurrenceIterator occurrences(const Generator& generator, const RunArgs& args) {
    return OccurrenceIterator(generator, args);
}

static Unit collection_unit(CollectionGranularity g) {
    switch (g) {
        case CollectionGranularity::Year: return Unit::Year;
        case CollectionGranularity::Month: return Unit::Month;
        case CollectionGranularity::Week: return Unit::Week;
        case CollectionGranularity::Day: return Unit::Day;
        case CollectionGranularity::Hour: return Unit::Hour;
        case CollectionGranularity::Minute: return Unit::Minute;
        case CollectionGranularity::Second: return Unit::Second;
        default: return Unit::Millisecond;
    }
}

CollectionIterator::CollectionIterator(Generator generator, CollectionsArgs args)
    : generator_(std::move(generator)), args_(std::move(args)) {
    unit_ = collection_unit(args_.granularity);
    week_start_ = args_.week_start.value_or(config::current().default_week_start);
}

std::optional<Collection> CollectionIterator::next() {
    if (args_.take && emitted_ >= *args_.take) return std::nullopt;
    auto c = args_.granularity == CollectionGranularity::Instantaneous ? next_instantaneous() : next_period();
    if (c) ++emitted_;
    return c;
}

std::vector<Collection> CollectionIterator::to_vector() {
    if (is_infinite(generator_) && !args_.end && !args_.take) {
        throw ArgumentError("cannot collect an infinite occurrence stream without an end date or take");
    }
    std::vector<Collection> out;
    while (auto c = next()) out.push_back(std::move(*c));
    return out;
}

std::optional<Collection> CollectionIterator::next_instantaneous() {
    if (!instants_) {
        RunArgs a;
        a.start = args_.start;
        a.end = args_.end;
        instants_ = std::make_unique<OccurrenceIterator>(generator_, a);
        lookahead_ = instants_->next();
    }
    if (!lookahead_) return std::nullopt;
    std::vector<Instant> dates{*lookahead_};
    for (;;) {
        lookahead_ = instants_->next();
        if (!lookahead_ || !lookahead_->is_equal(dates.front())) break;
        dates.push_back(*lookahead_);
    }
    const Instant at = dates.front();
    return Collection{std::move(dates), CollectionGranularity::Instantaneous, at, at};
}

std::optional<Instant> CollectionIterator::first_from(const std::optional<Instant>& from) const {
    RunArgs a;
    a.start = from;
    a.end = args_.end;
    a.take = 1;
    return occurrences(generator_, a).next();
}

std::optional<Collection> CollectionIterator::next_period() {
    if (!started_) {
        started_ = true;
        if (args_.start) {
            period_ = args_.start->granularity(unit_, week_start_);
        } else if (auto first = first_from(std::nullopt)) {
            period_ = first->granularity(unit_, week_start_);
        }
    }
    while (period_) {
        const Instant base_start = *period_;
        if (args_.end && base_start.is_after(*args_.end)) {
            period_.reset();
            return std::nullopt;
        }
        const Instant base_end = base_start.end_granularity(unit_, week_start_);
        Instant range_start = base_start;
        Instant range_end = base_end;
        if (unit_ == Unit::Month && args_.week_start) {
            range_start = base_start.granularity(Unit::Week, week_start_);
            range_end = base_end.end_granularity(Unit::Week, week_start_);
        }

        RunArgs q;
        q.start = args_.start && args_.start->is_after(range_start) ? *args_.start : range_start;
        q.end = args_.end && args_.end->is_before(range_end) ? *args_.end : range_end;
        auto dates = occurrences(generator_, q).to_vector();

        const Instant next_start = base_end.add(1, Unit::Millisecond);
        if (dates.empty()) {
            auto upcoming = first_from(next_start);
            if (args_.skip_empty_periods) {
                if (upcoming) period_ = upcoming->granularity(unit_, week_start_);
                else period_.reset();
                continue;
            }
            if (!upcoming && !args_.end) {
                period_.reset();
                return std::nullopt;
            }
        }
        period_ = next_start;
        return Collection{std::move(dates), args_.granularity, range_start, range_end};
    }
    return std::nullopt;
}

CollectionIterator collections(const Generator& generator, const CollectionsArgs& args) {
    return CollectionIterator(generator, args);
}

std::optional<Instant> first_date(const Generator& generator) {
    RunArgs a;
    a.take = 1;
    return occurrences(generator, a).next();
}

std::optional<Instant> last_date(const Generator& generator) {
    if (is_infinite(generator)) return std::nullopt;
    RunArgs a;
    a.reverse = true;
    a.take = 1;
    return occurrences(generator, a).next();
}

bool occurs_on(const Generator& generator, const Instant& date) {
    RunArgs a;
    a.end = date;
    if (has_duration(generator)) {
        a.start = date.subtract(max_duration(generator), Unit::Millisecond);
        auto it = occurrences(generator, a);
        while (auto v = it.next()) {
            if (v->duration() > 0 && v->is_occurring(date)) return true;
        }
        return false;
    }
    a.start = date;
    a.take = 1;
    return occurrences(generator, a).next().has_value();
}

bool occurs_between(const Generator& generator, const Instant& start, const Instant& end, bool exclude_ends) {
    RunArgs a;
    a.end = end;
    if (has_duration(generator)) {
        a.start = start.subtract(max_duration(generator), Unit::Millisecond);
        auto it = occurrences(generator, a);
        while (auto v = it.next()) {
            const int64_t vs = v->value_of();
            const int64_t ve = vs + v->duration();
            if (exclude_ends ? (ve > start.value_of() && vs < end.value_of())
                             : (ve >= start.value_of() && vs <= end.value_of())) return true;
        }
        return false;
    }
    a.start = start;
    auto it = occurrences(generator, a);
    while (auto v = it.next()) {
        if (exclude_ends && (v->is_equal(start) || v->is_equal(end))) continue;
        return true;
    }
    return false;
}

bool occurs_after(const Generator& generator, const Instant& date, bool exclude_start) {
    RunArgs a;
    a.start = date;
    auto it = occurrences(generator, a);
    while (auto v = it.next()) {
        if (exclude_start && v->is_equal(date)) continue;
        return true;
    }
    return false;
}

bool occurs_before(const Generator& generator, const Instant& date, bool exclude_start) {
    RunArgs a;
    a.end = date;
    a.reverse = true;
    auto it = occurrences(generator, a);
    while (auto v = it.next()) {
        if (exclude_start && v->is_equal(date)) continue;
        return true;
    }
    return false;
}

}
