#include "Metrics.h"

namespace observability {

static const std::vector<double>& histogram_buckets() {
    static const std::vector<double> buckets = {1, 2, 5, 10, 20, 50};
    return buckets;
}

Metrics& Metrics::instance() {
    static Metrics m;
    return m;
}

Metrics::Metrics() {}

MetricsKey Metrics::make_key(const std::string& name, const std::string& label_name, const std::string& label_value) {
    if (label_name.empty()) return MetricsKey{name, ""};
    return MetricsKey{name, label_name + "=\"" + label_value + "\""};
}

void Metrics::inc(const std::string& name, const std::string& label_name, const std::string& label_value) {
    if (!enabled()) return;
    auto k = make_key(name, label_name, label_value);
    std::lock_guard lock(mu_);
    counters_[k] += 1;
}

void Metrics::observe(const std::string& name, double value) {
    if (!enabled()) return;
    const auto& buckets = histogram_buckets();
    std::lock_guard lock(mu_);
    auto& h = hist_[name];
    if (h.buckets.empty()) h.buckets.assign(buckets.size(), 0);
    h.count += 1;
    h.sum += value;
    for (size_t i = 0; i < buckets.size(); ++i) { if (value <= buckets[i]) { h.buckets[i] += 1; } }
}

uint64_t Metrics::counter(const std::string& name, const std::string& label_name, const std::string& label_value) const {
    auto k = make_key(name, label_name, label_value);
    std::lock_guard lock(mu_);
    auto it = counters_.find(k);
    return it == counters_.end() ? 0 : it->second;
}

std::string Metrics::scrape() const {
    std::ostringstream ss;
    std::lock_guard lock(mu_);
    std::string current;
    for (const auto& p : counters_) {
        if (p.first.name != current) {
            current = p.first.name;
            ss << "# TYPE " << current << " counter\n";
        }
        ss << p.first.name;
        if (!p.first.label.empty()) ss << '{' << p.first.label << '}';
        ss << ' ' << p.second << "\n";
    }
    const auto& buckets = histogram_buckets();
    for (const auto& p : hist_) {
        const auto& h = p.second;
        ss << "# TYPE " << p.first << " histogram\n";
        for (size_t i = 0; i < buckets.size(); ++i) {
            ss << p.first << "_bucket{le=\"" << buckets[i] << "\"} " << h.buckets[i] << "\n";
        }
        ss << p.first << "_bucket{le=\"+Inf\"} " << h.count << "\n";
        ss << p.first << "_sum " << h.sum << "\n";
        ss << p.first << "_count " << h.count << "\n";
    }
    return ss.str();
}

}
