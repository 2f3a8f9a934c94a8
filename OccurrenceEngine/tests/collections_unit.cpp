#include <iostream>
#include <string>
#include <vector>
#include "test_util.h"
#include "../src/occurrence/Dates.h"
#include "../src/occurrence/Iterators.h"
#include "../src/recurrence/Rule.h"

using namespace occurrence;
using temporal::Instant;
using temporal::Weekday;

static Generator daily(const Instant& start, std::optional<int> count) {
    recurrence::RuleOptions o;
    o.frequency = recurrence::Frequency::Daily;
    o.start = start;
    o.count = count;
    return make_generator(recurrence::Rule(o));
}

static bool same_instant(const Instant& a, const Instant& b) {
    return a.value_of() == b.value_of();
}

int main() {
    const Generator datesA = make_generator(Dates({utc(2017, 9, 9, 9, 9, 9, 9), utc(2018, 11, 11, 11, 11, 11, 11),
                                                   utc(2019, 1, 1, 1, 1, 1, 1), utc(2019, 1, 1, 1, 1, 1, 1),
                                                   utc(2020, 3, 3, 3, 3, 3, 3)}));

    {
        auto groups = collections(datesA).to_vector();
        if (groups.size() != 4) { std::cerr << "instantaneous groups: " << groups.size() << "\n"; return 1; }
        if (groups[2].dates.size() != 2 || !same_instant(groups[2].period_start, utc(2019, 1, 1, 1, 1, 1, 1))) {
            std::cerr << "duplicate instants were not grouped\n";
            return 1;
        }
        if (groups[0].granularity != CollectionGranularity::Instantaneous) { std::cerr << "granularity\n"; return 1; }
    }

    {
        CollectionsArgs a;
        a.granularity = CollectionGranularity::Month;
        auto months = collections(daily(utc(2019, 1, 30), 5), a).to_vector();
        if (months.size() != 2) { std::cerr << "month collections: " << months.size() << "\n"; return 1; }
        if (!check_dates("january", months[0].dates, {utc(2019, 1, 30), utc(2019, 1, 31)})) return 1;
        if (!check_dates("february", months[1].dates, {utc(2019, 2, 1), utc(2019, 2, 2), utc(2019, 2, 3)})) return 1;
        if (!same_instant(months[1].period_start, utc(2019, 2, 1)) ||
            !same_instant(months[1].period_end, utc(2019, 2, 28, 23, 59, 59, 999))) {
            std::cerr << "february bounds " << months[1].period_start.to_iso_string() << " "
                      << months[1].period_end.to_iso_string() << "\n";
            return 1;
        }
    }

    {
        CollectionsArgs a;
        a.granularity = CollectionGranularity::Month;
        a.skip_empty_periods = true;
        auto sparse = collections(datesA, a).to_vector();
        if (sparse.size() != 4) { std::cerr << "skip empty: " << sparse.size() << "\n"; return 1; }
        if (sparse[2].dates.size() != 2) { std::cerr << "skip empty january 2019\n"; return 1; }

        a.skip_empty_periods = false;
        auto linear = collections(datesA, a).to_vector();
        if (linear.size() != 31) { std::cerr << "linear: " << linear.size() << "\n"; return 1; }
        if (!linear[1].dates.empty() || !same_instant(linear[1].period_start, utc(2017, 10, 1))) {
            std::cerr << "linear october 2017\n";
            return 1;
        }

        a.start = utc(2019, 1, 1);
        a.end = utc(2019, 4, 15);
        auto bounded = collections(datesA, a).to_vector();
        if (bounded.size() != 4 || bounded[0].dates.size() != 2 || !bounded[3].dates.empty()) {
            std::cerr << "bounded linear: " << bounded.size() << "\n";
            return 1;
        }
    }

    {
        CollectionsArgs a;
        a.granularity = CollectionGranularity::Month;
        a.week_start = Weekday::SU;
        auto widened = collections(daily(utc(2019, 1, 27), 7), a).to_vector();
        if (widened.size() != 2 || widened[0].dates.size() != 7 || widened[1].dates.size() != 7) {
            std::cerr << "week-widened months: " << widened.size() << "\n";
            return 1;
        }
        if (!same_instant(widened[0].period_start, utc(2018, 12, 30)) ||
            !same_instant(widened[1].period_start, utc(2019, 1, 27))) {
            std::cerr << "week-widened start " << widened[0].period_start.to_iso_string() << "\n";
            return 1;
        }
    }

    {
        CollectionsArgs a;
        a.granularity = CollectionGranularity::Week;
        a.take = 2;
        auto weeks = collections(daily(utc(2019, 1, 1), std::nullopt), a).to_vector();
        if (weeks.size() != 2) { std::cerr << "weeks: " << weeks.size() << "\n"; return 1; }
        // 2019-01-01 is a Tuesday, so the first Monday-based week holds six days.
        if (weeks[0].dates.size() != 6 || weeks[1].dates.size() != 7) { std::cerr << "week sizes\n"; return 1; }

        CollectionsArgs unbounded;
        unbounded.granularity = CollectionGranularity::Day;
        try {
            (void)collections(daily(utc(2019, 1, 1), std::nullopt), unbounded).to_vector();
            std::cerr << "unbounded collection accepted\n";
            return 1;
        } catch (const ArgumentError&) {}
    }

    std::cout << "collections_unit ok\n";
    return 0;
}
