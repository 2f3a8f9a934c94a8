#include <iostream>
#include <string>
#include <vector>
#include "test_util.h"
#include "../src/occurrence/Dates.h"
#include "../src/occurrence/Iterators.h"
#include "../src/occurrence/Operators.h"
#include "../src/recurrence/Rule.h"

using namespace occurrence;
using recurrence::DayOfWeek;
using recurrence::Frequency;
using recurrence::RuleOptions;
using temporal::Instant;
using temporal::Weekday;

static Generator rule(RuleOptions o) {
    return make_generator(recurrence::Rule(std::move(o)));
}

static RuleOptions base(Frequency f, const Instant& start) {
    RuleOptions o;
    o.frequency = f;
    o.start = start;
    return o;
}

static std::vector<Instant> run(const Generator& g, std::optional<Instant> start, std::optional<Instant> end,
                                bool reverse = false) {
    RunArgs a;
    a.start = start;
    a.end = end;
    a.reverse = reverse;
    return occurrences(g, a).to_vector();
}

static bool strictly_ordered(const char* what, const std::vector<Instant>& v, bool reverse) {
    for (size_t i = 1; i < v.size(); ++i) {
        const bool ok = reverse ? v[i].is_before(v[i - 1]) : v[i].is_after(v[i - 1]);
        if (!ok) {
            std::cerr << what << (reverse ? " (reverse)" : "") << ": out of order at " << i << " in " << iso_list(v) << "\n";
            return false;
        }
    }
    return true;
}

int main() {
    const Instant until = utc(2021, 1, 1);

    std::vector<std::pair<const char*, Generator>> rules;
    rules.emplace_back("daily", rule(base(Frequency::Daily, utc(2020, 11, 1, 9, 30))));
    {
        auto o = base(Frequency::Weekly, utc(2019, 1, 1, 8));
        o.by_day_of_week = std::vector<DayOfWeek>{{Weekday::FR, 0}, {Weekday::MO, 0}, {Weekday::WE, 0}};
        o.by_hour_of_day = std::vector<int>{18, 8};
        rules.emplace_back("weekly", rule(o));
    }
    {
        auto o = base(Frequency::Monthly, utc(2018, 1, 1));
        o.by_day_of_month = std::vector<int>{-1, 1, 15};
        rules.emplace_back("monthly", rule(o));
    }
    {
        auto o = base(Frequency::Yearly, utc(2000, 2, 29, 12));
        rules.emplace_back("leap day", rule(o));
    }
    {
        auto o = base(Frequency::Hourly, utc(2020, 12, 30));
        o.by_minute_of_hour = std::vector<int>{45, 0, 15};
        o.interval = 7;
        rules.emplace_back("hourly", rule(o));
    }

    // 1. strictly monotonic in both directions
    for (const auto& r : rules) {
        auto forward = run(r.second, std::nullopt, until);
        auto backward = run(r.second, std::nullopt, until, true);
        if (forward.empty()) { std::cerr << r.first << ": nothing emitted\n"; return 1; }
        if (!strictly_ordered(r.first, forward, false)) return 1;
        if (!strictly_ordered(r.first, backward, true)) return 1;
        if (!check_dates(r.first, backward, std::vector<Instant>(forward.rbegin(), forward.rend()))) return 1;
    }
    if (run(rules[3].second, std::nullopt, until).size() != 6) { std::cerr << "leap day count\n"; return 1; }

    const Generator a = make_generator(Dates({utc(2017, 9, 9), utc(2018, 11, 11), utc(2019, 1, 1), utc(2019, 1, 1),
                                              utc(2020, 3, 3)}));
    const Generator b = make_generator(Dates({utc(2017, 10, 10), utc(2019, 1, 1), utc(2019, 2, 2), utc(2020, 3, 3)}));
    auto monday_count = base(Frequency::Weekly, utc(2018, 12, 31));
    monday_count.count = 5;
    auto daily_count = base(Frequency::Daily, utc(2019, 1, 1));
    daily_count.count = 20;
    const Generator c = rule(daily_count);
    const Generator d = rule(monday_count);

    // 2. union keeps every value
    {
        auto all = run(pipe(a, {add({b})}), std::nullopt, std::nullopt);
        if (all.size() != 9) { std::cerr << "union of dates: " << iso_list(all) << "\n"; return 1; }
        for (size_t i = 1; i < all.size(); ++i) {
            if (all[i].is_before(all[i - 1])) { std::cerr << "union not sorted: " << iso_list(all) << "\n"; return 1; }
        }
        if (run(pipe(c, {add({d})}), std::nullopt, std::nullopt).size() != 25) { std::cerr << "union of rules\n"; return 1; }
    }

    // 3. unique is idempotent
    {
        auto once = run(pipe(a, {add({b}), unique()}), std::nullopt, std::nullopt);
        auto twice = run(pipe(a, {add({b}), unique(), unique()}), std::nullopt, std::nullopt);
        if (!check_dates("unique twice", twice, once)) return 1;
        if (!strictly_ordered("unique", once, false)) return 1;
    }

    // 4. (A - B) + (A & B) covers A
    {
        const std::vector<std::pair<Generator, Generator>> pairs = {{a, b}, {b, a}, {c, d}, {d, c}};
        for (const auto& p : pairs) {
            auto rebuilt = pipe(pipe(p.first, {subtract({p.second})}),
                                {add({pipe(p.first, {intersection({p.second})})}), unique()});
            auto original = pipe(p.first, {unique()});
            if (!check_dates("difference plus intersection",
                             run(rebuilt, std::nullopt, std::nullopt), run(original, std::nullopt, std::nullopt))) return 1;
        }
    }

    // 5. a bounded traversal is the filtered unbounded one
    {
        const Instant from = utc(2019, 3, 10);
        const Instant to = utc(2019, 7, 15);
        std::vector<Generator> gens;
        for (const auto& r : rules) gens.push_back(r.second);
        gens.push_back(pipe(a, {add({b, c})}));
        gens.push_back(pipe(c, {subtract({d})}));
        for (const auto& g : gens) {
            std::vector<Instant> filtered;
            for (const auto& v : run(g, std::nullopt, until)) {
                if (!v.is_before(from) && !v.is_after(to)) filtered.push_back(v);
            }
            if (!check_dates("window", run(g, from, to), filtered)) return 1;
            if (!check_dates("window reversed", run(g, from, to, true),
                             std::vector<Instant>(filtered.rbegin(), filtered.rend()))) return 1;
        }
    }

    std::cout << "properties_unit ok\n";
    return 0;
}
