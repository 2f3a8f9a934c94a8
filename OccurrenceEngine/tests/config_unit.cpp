#include <cstdlib>
#include <iostream>
#include <string>
#include "../src/config/Config.h"
#include "../src/observability/Logging.h"
#include "../src/observability/Metrics.h"

static const char* const kVars[] = {"LOG_LEVEL", "METRICS_ENABLED", "PIPELINE_MAX_ITERATIONS",
                                    "INTERSECTION_MAX_FAILED_ITERATIONS", "DEFAULT_WEEK_START"};

static void clear_env() {
    for (const char* v : kVars) unsetenv(v);
}

int main() {
    clear_env();
    // keep config.invalid_value warnings out of the test output
    observability::set_log_level(4);

    {
        auto c = config::Config::from_env(0, nullptr);
        if (c.log_level != config::Config::LogLevel::INFO) { std::cerr << "default log level mismatch\n"; return 1; }
        if (!c.metrics_enabled) { std::cerr << "metrics disabled by default\n"; return 1; }
        if (c.max_pipeline_iterations != 50 || c.max_failed_intersection_iterations != 50) { std::cerr << "default bounds mismatch\n"; return 1; }
        if (c.default_week_start != temporal::Weekday::MO) { std::cerr << "default week start mismatch\n"; return 1; }
    }

    setenv("LOG_LEVEL", "debug", 1);
    setenv("METRICS_ENABLED", "0", 1);
    setenv("PIPELINE_MAX_ITERATIONS", "120", 1);
    setenv("INTERSECTION_MAX_FAILED_ITERATIONS", "7", 1);
    setenv("DEFAULT_WEEK_START", "su", 1);
    {
        auto c = config::Config::from_env(0, nullptr);
        if (c.log_level != config::Config::LogLevel::DEBUG) { std::cerr << "env LOG_LEVEL not applied\n"; return 1; }
        if (c.metrics_enabled) { std::cerr << "env METRICS_ENABLED not applied\n"; return 1; }
        if (c.max_pipeline_iterations != 120) { std::cerr << "env PIPELINE_MAX_ITERATIONS not applied: " << c.max_pipeline_iterations << "\n"; return 1; }
        if (c.max_failed_intersection_iterations != 7) { std::cerr << "env INTERSECTION_MAX_FAILED_ITERATIONS not applied\n"; return 1; }
        if (c.default_week_start != temporal::Weekday::SU) { std::cerr << "env DEFAULT_WEEK_START not applied\n"; return 1; }
    }

    setenv("PIPELINE_MAX_ITERATIONS", "notanumber", 1);
    setenv("INTERSECTION_MAX_FAILED_ITERATIONS", "99999999999", 1);
    setenv("DEFAULT_WEEK_START", "someday", 1);
    setenv("LOG_LEVEL", "loud", 1);
    {
        auto c = config::Config::from_env(0, nullptr);
        if (c.max_pipeline_iterations != 50) { std::cerr << "invalid bound not defaulted: " << c.max_pipeline_iterations << "\n"; return 1; }
        if (c.max_failed_intersection_iterations != 50) { std::cerr << "overflowing bound not defaulted\n"; return 1; }
        if (c.default_week_start != temporal::Weekday::MO) { std::cerr << "invalid week start not defaulted\n"; return 1; }
        if (c.log_level != config::Config::LogLevel::INFO) { std::cerr << "unknown level not defaulted\n"; return 1; }
    }

    setenv("PIPELINE_MAX_ITERATIONS", "12abc", 1);
    setenv("INTERSECTION_MAX_FAILED_ITERATIONS", " 7", 1);
    {
        auto c = config::Config::from_env(0, nullptr);
        if (c.max_pipeline_iterations != 50) { std::cerr << "trailing garbage accepted: " << c.max_pipeline_iterations << "\n"; return 1; }
        if (c.max_failed_intersection_iterations != 50) { std::cerr << "leading space accepted\n"; return 1; }
    }

    setenv("PIPELINE_MAX_ITERATIONS", "0", 1);
    setenv("INTERSECTION_MAX_FAILED_ITERATIONS", "500000", 1);
    {
        auto c = config::Config::from_env(0, nullptr);
        if (c.max_pipeline_iterations != 1) { std::cerr << "bound not clamped up: " << c.max_pipeline_iterations << "\n"; return 1; }
        if (c.max_failed_intersection_iterations != 100000) { std::cerr << "bound not clamped down\n"; return 1; }
    }
    clear_env();

    {
        char prog[] = "occurrence_engine";
        char level_flag[] = "--log-level";
        char level[] = "WARN";
        char week_flag[] = "--week-start";
        char week[] = "TU";
        char* argv[] = {prog, level_flag, level, week_flag, week};
        auto c = config::Config::from_env(5, argv);
        if (c.log_level != config::Config::LogLevel::WARN) { std::cerr << "--log-level not applied\n"; return 1; }
        if (c.default_week_start != temporal::Weekday::TU) { std::cerr << "--week-start not applied\n"; return 1; }
    }

    {
        auto c = config::Config::from_env(0, nullptr);
        c.log_level = config::Config::LogLevel::ERROR;
        c.metrics_enabled = false;
        c.max_pipeline_iterations = 9;
        config::install(c);
        if (config::current().max_pipeline_iterations != 9) { std::cerr << "install not visible\n"; return 1; }
        if (observability::log_level() != 4) { std::cerr << "install did not set log level\n"; return 1; }
        if (observability::Metrics::instance().enabled()) { std::cerr << "install did not disable metrics\n"; return 1; }
        config::install(config::Config{});
        if (!observability::Metrics::instance().enabled() || observability::log_level() != 2) {
            std::cerr << "reinstall did not restore defaults\n";
            return 1;
        }
    }

    std::cout << "config_unit ok\n";
    return 0;
}
