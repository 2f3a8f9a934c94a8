#include "Dates.h"

#include <algorithm>
#include <iterator>

namespace occurrence {

using temporal::Instant;

namespace {

class DatesCursor : public Cursor {
public:
    DatesCursor(std::shared_ptr<const std::vector<Instant>> dates, const RunArgs& args)
        : dates_(std::move(dates)), args_(args), lo_(0), hi_(dates_->size()) {
        const auto& v = *dates_;
        if (args.start) {
            while (lo_ < hi_ && v[lo_].is_before(*args.start)) ++lo_;
        }
        if (args.end) {
            while (hi_ > lo_ && v[hi_ - 1].is_after(*args.end)) --hi_;
        }
        pos_ = args.reverse ? hi_ : lo_;
    }

    std::optional<Instant> next() override {
        if (args_.take && emitted_ >= *args_.take) return std::nullopt;
        if (!args_.reverse) {
            if (pos_ >= hi_) return std::nullopt;
            ++emitted_;
            return (*dates_)[pos_++];
        }
        if (pos_ <= lo_) return std::nullopt;
        ++emitted_;
        return (*dates_)[--pos_];
    }

    void skip_to(const Instant& date) override {
        const auto& v = *dates_;
        if (!args_.reverse) {
            while (pos_ < hi_ && v[pos_].is_before(date)) ++pos_;
        } else {
            while (pos_ > lo_ && v[pos_ - 1].is_after(date)) --pos_;
        }
    }

private:
    std::shared_ptr<const std::vector<Instant>> dates_;
    RunArgs args_;
    size_t lo_;
    size_t hi_;
    size_t pos_ = 0;
    size_t emitted_ = 0;
};

}

static std::shared_ptr<const std::vector<Instant>> sorted(std::vector<Instant> dates, std::optional<int64_t> duration) {
    if (duration && *duration < 0) throw ArgumentError("duration must be non-negative");
    if (duration) {
        for (auto& d : dates) {
            if (d.duration() == 0) d = d.with_duration(*duration);
        }
    }
    std::stable_sort(dates.begin(), dates.end(), [](const Instant& a, const Instant& b) { return temporal::compare_exact(a, b) < 0; });
    return std::make_shared<const std::vector<Instant>>(std::move(dates));
}

Dates::Dates() : dates_(std::make_shared<const std::vector<Instant>>()) {}

Dates::Dates(std::vector<Instant> dates, std::optional<int64_t> duration)
    : dates_(sorted(std::move(dates), duration)), duration_(duration) {}

Dates Dates::add(const Instant& date) const {
    auto v = *dates_;
    v.push_back(date);
    return Dates(std::move(v), duration_);
}

Dates Dates::remove(const Instant& date) const {
    auto v = *dates_;
    auto it = std::find_if(v.begin(), v.end(), [&](const Instant& d) { return d.is_equal(date); });
    if (it != v.end()) v.erase(it);
    return Dates(std::move(v), duration_);
}

Dates Dates::with_dates(std::vector<Instant> dates) const { return Dates(std::move(dates), duration_); }

Dates Dates::with_duration(std::optional<int64_t> duration) const {
    auto v = *dates_;
    if (duration) {
        for (auto& d : v) d = d.with_duration(*duration);
    }
    return Dates(std::move(v), duration);
}

Dates Dates::filter(const std::function<bool(const Instant&)>& keep) const {
    std::vector<Instant> v;
    std::copy_if(dates_->begin(), dates_->end(), std::back_inserter(v), keep);
    return Dates(std::move(v), duration_);
}

std::optional<Instant> Dates::first_date() const {
    if (dates_->empty()) return std::nullopt;
    return dates_->front();
}

std::optional<Instant> Dates::last_date() const {
    if (dates_->empty()) return std::nullopt;
    return dates_->back();
}

bool Dates::has_duration() const {
    if (dates_->empty()) return duration_.has_value() && *duration_ > 0;
    return std::all_of(dates_->begin(), dates_->end(), [](const Instant& d) { return d.duration() > 0; });
}

int64_t Dates::max_duration() const {
    int64_t m = 0;
    for (const auto& d : *dates_) m = std::max(m, d.duration());
    return m;
}

std::unique_ptr<Cursor> Dates::open(const RunArgs& args) const {
    return std::make_unique<DatesCursor>(dates_, args);
}

}
