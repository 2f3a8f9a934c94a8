#pragma once

#include "../temporal/Calendar.h"

#include <cstdint>
#include <string>

namespace config {

struct Config {
    enum class LogLevel { DEBUG, INFO, WARN, ERROR };
    LogLevel log_level = LogLevel::INFO;
    bool metrics_enabled = true;
    int max_pipeline_iterations = 50;
    int max_failed_intersection_iterations = 50;
    temporal::Weekday default_week_start = temporal::Weekday::MO;
    static Config from_env(int argc, char** argv);
};

int log_level_value(Config::LogLevel level);

// Process-wide configuration read by rules and operators at construction.
Config current();
void install(const Config& c);

}
