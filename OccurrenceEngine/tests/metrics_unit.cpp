#include <cmath>
#include <iostream>
#include <regex>
#include <string>
#include <thread>
#include <vector>
#include "test_util.h"
#include "../src/observability/Metrics.h"
#include "../src/occurrence/Dates.h"
#include "../src/occurrence/Iterators.h"
#include "../src/recurrence/Rule.h"

using namespace observability;

static uint64_t parse_bucket(const std::string& scrape, const std::string& name, const std::string& le) {
    std::regex re(name + "_bucket\\{le=\"" + std::regex_replace(le, std::regex("\\+"), "\\+") + "\"\\} ([0-9]+)");
    std::smatch m;
    if (std::regex_search(scrape, m, re)) return std::stoull(m[1].str());
    return 0;
}

static double parse_sum(const std::string& scrape, const std::string& name) {
    std::regex re(name + "_sum ([0-9.eE+-]+)");
    std::smatch m;
    if (std::regex_search(scrape, m, re)) return std::stod(m[1].str());
    return -1.0;
}

int main() {
    auto& m = Metrics::instance();

    m.inc("non_convergence_total", "source", "pipeline");
    m.inc("non_convergence_total", "source", "pipeline");
    m.inc("non_convergence_total", "source", "intersection");
    if (m.counter("non_convergence_total", "source", "pipeline") != 2) { std::cerr << "labelled counter mismatch\n"; return 1; }
    if (m.counter("non_convergence_total", "source", "split_duration") != 0) { std::cerr << "unknown label not zero\n"; return 1; }

    std::string s = m.scrape();
    if (s.find("# TYPE non_convergence_total counter\n") == std::string::npos) { std::cerr << "counter TYPE line missing\n"; return 1; }
    if (s.find("non_convergence_total{source=\"pipeline\"} 2\n") == std::string::npos) { std::cerr << "counter sample missing:\n" << s; return 1; }
    if (s.find("non_convergence_total{source=\"intersection\"} 1\n") == std::string::npos) { std::cerr << "second label missing\n"; return 1; }

    for (double v : {1.0, 3.0, 7.0, 60.0}) m.observe("repairs", v);
    s = m.scrape();
    if (s.find("# TYPE repairs histogram\n") == std::string::npos) { std::cerr << "histogram TYPE line missing\n"; return 1; }
    const std::vector<std::pair<std::string, uint64_t>> expected = {
        {"1", 1}, {"2", 1}, {"5", 2}, {"10", 3}, {"20", 3}, {"50", 3}, {"+Inf", 4}};
    for (const auto& e : expected) {
        uint64_t have = parse_bucket(s, "repairs", e.first);
        if (have != e.second) { std::cerr << "bucket " << e.first << " expected " << e.second << " got " << have << "\n"; return 1; }
    }
    if (std::abs(parse_sum(s, "repairs") - 71.0) > 1e-6) { std::cerr << "sum expected 71 got " << parse_sum(s, "repairs") << "\n"; return 1; }
    if (s.find("repairs_count 4\n") == std::string::npos) { std::cerr << "histogram count missing\n"; return 1; }

    m.set_enabled(false);
    m.inc("non_convergence_total", "source", "pipeline");
    m.observe("repairs", 1.0);
    m.set_enabled(true);
    if (m.counter("non_convergence_total", "source", "pipeline") != 2) { std::cerr << "disabled metrics still counted\n"; return 1; }
    if (m.scrape().find("repairs_count 4\n") == std::string::npos) { std::cerr << "disabled metrics still observed\n"; return 1; }

    // traversals report what they emit
    {
        recurrence::RuleOptions o;
        o.frequency = recurrence::Frequency::Daily;
        o.start = utc(2019, 1, 1);
        o.count = 3;
        auto rule = occurrence::make_generator(recurrence::Rule(o));
        auto dates = occurrence::make_generator(occurrence::Dates({utc(2019, 1, 1), utc(2019, 2, 1)}));
        const uint64_t before = m.counter("occurrence_emitted_total", "generator", "rule");
        if (occurrence::occurrences(rule).to_vector().size() != 3) { std::cerr << "daily count\n"; return 1; }
        if (m.counter("occurrence_emitted_total", "generator", "rule") != before + 3) { std::cerr << "rule emissions not counted\n"; return 1; }
        (void)occurrence::occurrences(dates).to_vector();
        if (m.counter("occurrence_emitted_total", "generator", "dates") != 2) { std::cerr << "date emissions not counted\n"; return 1; }
    }

    const int threads = 4;
    const int iters = 10000;
    std::vector<std::thread> th;
    for (int t = 0; t < threads; ++t) {
        th.emplace_back([&]() {
            for (int i = 0; i < iters; ++i) m.inc("parallel_total");
        });
    }
    for (auto& t : th) t.join();
    uint64_t par = m.counter("parallel_total");
    if (par != uint64_t(threads) * uint64_t(iters)) { std::cerr << "parallel counter expected " << threads * iters << " got " << par << "\n"; return 1; }
    if (m.scrape().find("parallel_total " + std::to_string(par) + "\n") == std::string::npos) { std::cerr << "unlabelled sample missing\n"; return 1; }

    std::cout << "metrics_unit ok\n";
    return 0;
}
