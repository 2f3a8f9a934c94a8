#pragma once

#include "Generator.h"

#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace occurrence {

// One traversal of a generator.
class OccurrenceIterator {
public:
    OccurrenceIterator(const Generator& generator, const RunArgs& args);

    std::optional<temporal::Instant> next();
    void skip_to(const temporal::Instant& date);
    // Throws ArgumentError for an infinite generator with neither end nor take.
    std::vector<temporal::Instant> to_vector();

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = temporal::Instant;
        using difference_type = std::ptrdiff_t;
        using pointer = const temporal::Instant*;
        using reference = const temporal::Instant&;

        iterator() = default;
        explicit iterator(OccurrenceIterator* owner) : owner_(owner) { advance(); }

        reference operator*() const { return *current_; }
        pointer operator->() const { return &*current_; }
        iterator& operator++() { advance(); return *this; }
        bool operator==(const iterator& o) const { return owner_ == o.owner_; }
        bool operator!=(const iterator& o) const { return owner_ != o.owner_; }

    private:
        void advance() {
            current_ = owner_->next();
            if (!current_) owner_ = nullptr;
        }
        OccurrenceIterator* owner_ = nullptr;
        std::optional<temporal::Instant> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    std::unique_ptr<Cursor> cursor_;
    std::string kind_;
    bool bounded_;
};

OccurrenceIterator occurrences(const Generator& generator, const RunArgs& args = {});

enum class CollectionGranularity {
    Instantaneous,
    Year,
    Month,
    Week,
    Day,
    Hour,
    Minute,
    Second,
    Millisecond
};

struct CollectionsArgs {
    std::optional<temporal::Instant> start;
    std::optional<temporal::Instant> end;
    std::optional<size_t> take;
    CollectionGranularity granularity = CollectionGranularity::Instantaneous;
    // MONTH periods are widened to whole weeks when set.
    std::optional<temporal::Weekday> week_start;
    bool skip_empty_periods = false;
};

struct Collection {
    std::vector<temporal::Instant> dates;
    CollectionGranularity granularity = CollectionGranularity::Instantaneous;
    temporal::Instant period_start;
    temporal::Instant period_end;
};

// Groups a generator's occurrences into consecutive periods.
class CollectionIterator {
public:
    CollectionIterator(Generator generator, CollectionsArgs args);

    std::optional<Collection> next();
    std::vector<Collection> to_vector();

private:
    std::optional<Collection> next_instantaneous();
    std::optional<Collection> next_period();
    std::optional<temporal::Instant> first_from(const std::optional<temporal::Instant>& from) const;

    Generator generator_;
    CollectionsArgs args_;
    temporal::Unit unit_ = temporal::Unit::Day;
    temporal::Weekday week_start_ = temporal::Weekday::MO;
    std::unique_ptr<OccurrenceIterator> instants_;
    std::optional<temporal::Instant> lookahead_;
    std::optional<temporal::Instant> period_;
    bool started_ = false;
    size_t emitted_ = 0;
};

CollectionIterator collections(const Generator& generator, const CollectionsArgs& args = {});

std::optional<temporal::Instant> first_date(const Generator& generator);
// nullopt for an infinite generator.
std::optional<temporal::Instant> last_date(const Generator& generator);

// Duration-aware: true when some occurrence's interval contains `date`.
bool occurs_on(const Generator& generator, const temporal::Instant& date);
bool occurs_between(const Generator& generator, const temporal::Instant& start, const temporal::Instant& end,
                    bool exclude_ends = false);
bool occurs_after(const Generator& generator, const temporal::Instant& date, bool exclude_start = false);
bool occurs_before(const Generator& generator, const temporal::Instant& date, bool exclude_start = false);

}
