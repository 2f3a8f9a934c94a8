#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include "test_util.h"
#include "../src/observability/Metrics.h"
#include "../src/recurrence/Pipeline.h"

using namespace recurrence;
using temporal::Instant;
using temporal::Unit;
using temporal::Weekday;

static std::shared_ptr<const NormalizedRuleOptions> normalized(const RuleOptions& o) {
    return std::make_shared<const NormalizedRuleOptions>(normalize_rule_options(o));
}

static bool expect_repair(const char* what, const StageResult& r, const Instant& want) {
    if (r.status != StageResult::Status::Repair || !r.repair) {
        std::cerr << what << ": expected a repair\n";
        return false;
    }
    if (r.repair->value_of() != want.value_of()) {
        std::cerr << what << ": expected repair to " << want.to_iso_string() << " got " << r.repair->to_iso_string() << "\n";
        return false;
    }
    return true;
}

static bool expect_instant(const char* what, const std::optional<Instant>& got, const Instant& want) {
    if (!got || got->value_of() != want.value_of()) {
        std::cerr << what << ": expected " << want.to_iso_string() << " got " << (got ? got->to_iso_string() : std::string("none")) << "\n";
        return false;
    }
    return true;
}

int main() {
    // weekday constraint on a yearly rule
    {
        RuleOptions o;
        o.start = utc(2019, 1, 1, 2, 3, 4, 5);
        o.frequency = Frequency::Yearly;
        o.by_day_of_week = std::vector<DayOfWeek>{{Weekday::TU, 0}};
        Pipeline p(normalized(o), Direction::Forward, 50);

        if (p.evaluate(StageKind::DayOfWeek, utc(2019, 1, 1)).status != StageResult::Status::Valid) {
            std::cerr << "Tuesday 2019-01-01 should be valid\n";
            return 1;
        }
        if (!expect_repair("wednesday", p.evaluate(StageKind::DayOfWeek, utc(2019, 1, 16, 2, 3, 4, 5)), utc(2019, 1, 22))) return 1;
        if (!expect_instant("resolve wednesday", p.resolve(utc(2019, 1, 16, 2, 3, 4, 5), std::nullopt), utc(2019, 1, 22, 2, 3, 4, 5))) return 1;

        Pipeline r(normalized(o), Direction::Reverse, 50);
        if (!expect_repair("reverse wednesday", r.evaluate(StageKind::DayOfWeek, utc(2019, 1, 16, 2, 3, 4, 5)), utc(2019, 1, 15, 23, 59, 59, 999))) return 1;
        if (!expect_instant("reverse resolve", r.resolve(utc(2019, 1, 16, 2, 3, 4, 5), std::nullopt), utc(2019, 1, 15, 2, 3, 4, 5))) return 1;
    }

    // third Monday inside the candidate's month when a month list is present
    {
        RuleOptions o;
        o.start = utc(2019, 3, 16, 2, 3, 4, 5);
        o.frequency = Frequency::Yearly;
        o.by_day_of_week = std::vector<DayOfWeek>{{Weekday::MO, 3}};
        o.by_month_of_year = std::vector<int>{2};
        Pipeline p(normalized(o), Direction::Forward, 50);
        if (!expect_repair("third monday", p.evaluate(StageKind::DayOfWeek, utc(2019, 3, 16, 2, 3, 4, 5)), utc(2019, 3, 18))) return 1;
        // the month stage then moves the search into next February
        if (!expect_instant("third monday of february", p.resolve(utc(2019, 3, 16, 2, 3, 4, 5), std::nullopt), utc(2020, 2, 17, 2, 3, 4, 5))) return 1;
    }

    // February 31st never exists
    {
        RuleOptions o;
        o.start = utc(2019, 1, 1);
        o.frequency = Frequency::Yearly;
        o.by_month_of_year = std::vector<int>{2};
        o.by_day_of_month = std::vector<int>{31};
        Pipeline p(normalized(o), Direction::Forward, 50);
        const uint64_t before = observability::Metrics::instance().counter("non_convergence_total", "source", "pipeline");
        try {
            (void)p.resolve(utc(2019, 1, 1), std::nullopt);
            std::cerr << "unsatisfiable rule resolved\n";
            return 1;
        } catch (const PipelineError& e) {
            if (std::string(e.what()).find("50 iterations") == std::string::npos) { std::cerr << "unexpected message: " << e.what() << "\n"; return 1; }
        }
        const uint64_t after = observability::Metrics::instance().counter("non_convergence_total", "source", "pipeline");
        if (after != before + 1) { std::cerr << "non_convergence_total not incremented\n"; return 1; }
        // a limit reached before the iteration bound ends the search quietly
        if (p.resolve(utc(2019, 1, 1), utc(2025, 1, 1))) { std::cerr << "bounded unsatisfiable rule resolved\n"; return 1; }
    }

    // frequency stage: every third day
    {
        RuleOptions o;
        o.start = utc(2019, 1, 1);
        o.frequency = Frequency::Daily;
        o.interval = 3;
        Pipeline f(normalized(o), Direction::Forward, 50);
        if (f.stages().size() != 5) { std::cerr << "daily rule expected 5 stages got " << f.stages().size() << "\n"; return 1; }
        if (!expect_repair("interval forward", f.evaluate(StageKind::Frequency, utc(2019, 1, 2, 12)), utc(2019, 1, 4))) return 1;
        if (!expect_repair("before start", f.evaluate(StageKind::Frequency, utc(2018, 12, 1)), utc(2019, 1, 1))) return 1;
        Pipeline r(normalized(o), Direction::Reverse, 50);
        if (!expect_repair("interval reverse", r.evaluate(StageKind::Frequency, utc(2019, 1, 5, 12)), utc(2019, 1, 4, 23, 59, 59, 999))) return 1;
    }

    // hour list with carry into the next day
    {
        RuleOptions o;
        o.start = utc(2019, 1, 1);
        o.frequency = Frequency::Daily;
        o.by_hour_of_day = std::vector<int>{9, 17};
        auto n = normalized(o);
        Pipeline f(n, Direction::Forward, 50);
        if (!expect_repair("hour repair", f.evaluate(StageKind::HourOfDay, utc(2019, 1, 1, 10, 30)), utc(2019, 1, 1, 17))) return 1;
        if (f.evaluate(StageKind::HourOfDay, utc(2019, 1, 1, 18)).status != StageResult::Status::Ascend) { std::cerr << "late hour should ascend\n"; return 1; }
        if (!expect_instant("resolve late", f.resolve(utc(2019, 1, 1, 18), std::nullopt), utc(2019, 1, 2, 9))) return 1;
        if (!expect_instant("advance within day", std::optional<Instant>(f.advance(utc(2019, 1, 1, 9))), utc(2019, 1, 1, 17))) return 1;
        if (!expect_instant("advance across day", std::optional<Instant>(f.advance(utc(2019, 1, 1, 17))), utc(2019, 1, 2, 9))) return 1;
        if (f.resolve(utc(2019, 1, 1, 18), utc(2019, 1, 2, 8, 59, 59, 999))) { std::cerr << "result past limit returned\n"; return 1; }

        Pipeline r(n, Direction::Reverse, 50);
        if (!expect_instant("reverse resolve", r.resolve(utc(2019, 1, 2, 8), utc(2019, 1, 1)), utc(2019, 1, 1, 17))) return 1;
        if (!expect_instant("reverse advance", std::optional<Instant>(r.advance(utc(2019, 1, 2, 9))), utc(2019, 1, 1, 17))) return 1;
        if (r.resolve(utc(2019, 1, 1, 8), utc(2019, 1, 1))) { std::cerr << "reverse resolve crossed the limit\n"; return 1; }
    }

    // last day of the month via a negative day
    {
        RuleOptions o;
        o.start = utc(2019, 1, 1, 8);
        o.frequency = Frequency::Monthly;
        o.by_day_of_month = std::vector<int>{-1};
        Pipeline f(normalized(o), Direction::Forward, 50);
        if (!expect_instant("last of february", f.resolve(utc(2019, 2, 2), std::nullopt), utc(2019, 2, 28, 8))) return 1;
        if (!expect_instant("last of leap february", f.resolve(utc(2020, 2, 2), std::nullopt), utc(2020, 2, 29, 8))) return 1;
    }

    std::cout << "pipeline_unit ok\n";
    return 0;
}
