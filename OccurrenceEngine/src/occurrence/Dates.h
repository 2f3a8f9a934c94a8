#pragma once

#include "Cursor.h"

#include <functional>
#include <memory>
#include <vector>

namespace occurrence {

// A finite, sorted set of instants. Immutable: every edit returns a new set.
class Dates {
public:
    Dates();
    // `duration`, when given, is applied to every date that carries none.
    explicit Dates(std::vector<temporal::Instant> dates, std::optional<int64_t> duration = std::nullopt);

    const std::vector<temporal::Instant>& dates() const { return *dates_; }
    size_t size() const { return dates_->size(); }
    std::optional<int64_t> duration() const { return duration_; }

    Dates add(const temporal::Instant& date) const;
    // Removes the first date equal to `date`.
    Dates remove(const temporal::Instant& date) const;
    Dates with_dates(std::vector<temporal::Instant> dates) const;
    Dates with_duration(std::optional<int64_t> duration) const;
    Dates filter(const std::function<bool(const temporal::Instant&)>& keep) const;

    std::optional<temporal::Instant> first_date() const;
    std::optional<temporal::Instant> last_date() const;

    bool is_infinite() const { return false; }
    bool has_duration() const;
    int64_t max_duration() const;

    std::unique_ptr<Cursor> open(const RunArgs& args) const;

private:
    std::shared_ptr<const std::vector<temporal::Instant>> dates_;
    std::optional<int64_t> duration_;
};

}
