#include "Config.h"
#include "../json/MiniJson.h"
#include "../observability/Logging.h"
#include "../observability/Metrics.h"

#include <algorithm>
#include <cstdlib>
#include <mutex>

namespace config {

static std::string getenv_or(const char* name, const char* def) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string(def);
}

static Config::LogLevel parse_level(const std::string& s) {
    std::string u = s;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    if (u == "DEBUG") return Config::LogLevel::DEBUG;
    if (u == "WARN") return Config::LogLevel::WARN;
    if (u == "ERROR") return Config::LogLevel::ERROR;
    return Config::LogLevel::INFO;
}

static int parse_bound(const char* name, const std::string& raw, int def) {
    auto v = parse_int_strict_sv(raw);
    if (!v) {
        observability::log_warn("config.invalid_value", {{"name", std::string(name)}, {"value", raw}});
        return def;
    }
    return std::clamp(*v, 1, 100000);
}

static temporal::Weekday parse_week_start(const std::string& raw, temporal::Weekday def) {
    std::string u = raw;
    std::transform(u.begin(), u.end(), u.begin(), ::toupper);
    auto w = temporal::weekday_from_string(u);
    if (!w) {
        observability::log_warn("config.invalid_value", {{"name", std::string("DEFAULT_WEEK_START")}, {"value", raw}});
        return def;
    }
    return *w;
}

Config Config::from_env(int argc, char** argv) {
    Config c;
    c.log_level = parse_level(getenv_or("LOG_LEVEL", "INFO"));
    c.metrics_enabled = getenv_or("METRICS_ENABLED", "1") != "0";
    c.max_pipeline_iterations = parse_bound("PIPELINE_MAX_ITERATIONS", getenv_or("PIPELINE_MAX_ITERATIONS", "50"), 50);
    c.max_failed_intersection_iterations = parse_bound("INTERSECTION_MAX_FAILED_ITERATIONS", getenv_or("INTERSECTION_MAX_FAILED_ITERATIONS", "50"), 50);
    c.default_week_start = parse_week_start(getenv_or("DEFAULT_WEEK_START", "MO"), temporal::Weekday::MO);

    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--log-level" && i + 1 < argc) c.log_level = parse_level(argv[++i]);
        else if (a == "--week-start" && i + 1 < argc) c.default_week_start = parse_week_start(argv[++i], c.default_week_start);
    }
    return c;
}

int log_level_value(Config::LogLevel level) {
    switch (level) {
        case Config::LogLevel::DEBUG: return 1;
        case Config::LogLevel::INFO: return 2;
        case Config::LogLevel::WARN: return 3;
        case Config::LogLevel::ERROR: return 4;
    }
    return 2;
}

static std::mutex g_mu;

static Config& installed() {
    static Config c;
    return c;
}

Config current() {
    std::lock_guard lock(g_mu);
    return installed();
}

void install(const Config& c) {
    {
        std::lock_guard lock(g_mu);
        installed() = c;
    }
    observability::set_log_level(log_level_value(c.log_level));
    observability::Metrics::instance().set_enabled(c.metrics_enabled);
}

}
