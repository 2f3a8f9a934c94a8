#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace observability {

struct MetricsKey {
    std::string name;
    std::string label;  // `key="value"` or empty
    bool operator<(MetricsKey const& o) const noexcept {
        return name != o.name ? name < o.name : label < o.label;
    }
};

class Metrics {
public:
    static Metrics& instance();
    void inc(const std::string& name, const std::string& label_name = "", const std::string& label_value = "");
    void observe(const std::string& name, double value);
    uint64_t counter(const std::string& name, const std::string& label_name = "", const std::string& label_value = "") const;
    std::string scrape() const;
    void set_enabled(bool enabled) { enabled_.store(enabled); }
    bool enabled() const { return enabled_.load(); }
private:
    Metrics();
    static MetricsKey make_key(const std::string& name, const std::string& label_name, const std::string& label_value);
    std::map<MetricsKey, uint64_t> counters_;
    struct HistData {
        std::vector<uint64_t> buckets;
        double sum = 0.0;
        uint64_t count = 0;
    };
    std::map<std::string, HistData> hist_;
    std::atomic<bool> enabled_{true};
    mutable std::mutex mu_;
};

}
