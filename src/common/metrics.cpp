#include "metrics.hpp"
#include <algorithm>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>

namespace ic {

LatencyHistogram::LatencyHistogram(const std::vector<uint64_t>& buckets_ns)
    : buckets_(buckets_ns), counts_(buckets_ns.size() + 1) {
    std::sort(buckets_.begin(), buckets_.end());
    for (auto& count : counts_) {
        count.store(0);
    }
}

void LatencyHistogram::record(uint64_t latency_ns) {
    total_count_.fetch_add(1);

    uint64_t current_max = max_value_.load();
    while (latency_ns > current_max) {
        if (max_value_.compare_exchange_weak(current_max, latency_ns)) {
            break;
        }
    }

    // First bucket whose bound covers the value, or the overflow slot
    auto it = std::lower_bound(buckets_.begin(), buckets_.end(), latency_ns);
    counts_[static_cast<size_t>(it - buckets_.begin())].fetch_add(1);
}

LatencyHistogram::Percentiles LatencyHistogram::get_percentiles() const {
    uint64_t total = total_count_.load();
    if (total == 0) {
        return {0, 0, 0, 0, 0};
    }

    auto find_percentile = [&](double p) -> uint64_t {
        uint64_t target = static_cast<uint64_t>(total * p / 100.0);
        uint64_t cumulative = 0;
        for (size_t i = 0; i < counts_.size(); ++i) {
            cumulative += counts_[i].load();
            if (cumulative >= target && cumulative > 0) {
                return (i < buckets_.size()) ? buckets_[i] : max_value_.load();
            }
        }
        return max_value_.load();
    };

    return {
        find_percentile(50.0),
        find_percentile(95.0),
        find_percentile(99.0),
        max_value_.load(),
        total
    };
}

void LatencyHistogram::reset() {
    total_count_.store(0);
    max_value_.store(0);
    for (auto& count : counts_) {
        count.store(0);
    }
}

MetricsCollector& MetricsCollector::instance() {
    static MetricsCollector instance;
    return instance;
}

void MetricsCollector::increment_counter(const std::string& name, uint64_t delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[name] += delta;
}

uint64_t MetricsCollector::get_counter(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = counters_.find(name);
    return (it != counters_.end()) ? it->second : 0;
}

void MetricsCollector::set_gauge(const std::string& name, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[name] = value;
}

double MetricsCollector::get_gauge(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = gauges_.find(name);
    return (it != gauges_.end()) ? it->second : 0.0;
}

void MetricsCollector::record_latency(const std::string& name, uint64_t latency_ns) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& histogram = histograms_[name];
    if (!histogram) {
        histogram = std::make_unique<LatencyHistogram>(default_buckets_);
    }
    histogram->record(latency_ns);
}

LatencyHistogram::Percentiles MetricsCollector::get_latency_percentiles(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histograms_.find(name);
    return (it != histograms_.end()) ? it->second->get_percentiles() : LatencyHistogram::Percentiles{};
}

void MetricsCollector::publish_cache_stats(const CacheStats& stats) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_["string_cache_entries"] = static_cast<double>(stats.entries);
    gauges_["string_cache_shards"] = static_cast<double>(stats.shard_count);
    gauges_["string_cache_table_slots"] = static_cast<double>(stats.table_slots);
    gauges_["string_cache_allocated_bytes"] = static_cast<double>(stats.allocated_bytes);
    gauges_["string_cache_capacity_bytes"] = static_cast<double>(stats.capacity_bytes);
    gauges_["string_cache_largest_shard"] = static_cast<double>(stats.largest_shard);
}

std::string MetricsCollector::get_json_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json metrics;
    metrics["counters"] = nlohmann::json::object();
    for (const auto& [name, value] : counters_) {
        metrics["counters"][name] = value;
    }

    metrics["gauges"] = nlohmann::json::object();
    for (const auto& [name, value] : gauges_) {
        metrics["gauges"][name] = value;
    }

    metrics["histograms"] = nlohmann::json::object();
    for (const auto& [name, histogram] : histograms_) {
        auto percentiles = histogram->get_percentiles();
        metrics["histograms"][name] = {
            {"p50", percentiles.p50},
            {"p95", percentiles.p95},
            {"p99", percentiles.p99},
            {"max", percentiles.max},
            {"count", percentiles.count}
        };
    }

    return metrics.dump(2);
}

std::string MetricsCollector::get_prometheus_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::stringstream ss;

    for (const auto& [name, value] : counters_) {
        ss << "# TYPE " << name << " counter\n";
        ss << name << " " << value << "\n";
    }

    for (const auto& [name, value] : gauges_) {
        ss << "# TYPE " << name << " gauge\n";
        ss << name << " " << value << "\n";
    }

    for (const auto& [name, histogram] : histograms_) {
        auto percentiles = histogram->get_percentiles();
        ss << "# TYPE " << name << " summary\n";
        ss << name << "{quantile=\"0.5\"} " << percentiles.p50 << "\n";
        ss << name << "{quantile=\"0.95\"} " << percentiles.p95 << "\n";
        ss << name << "{quantile=\"0.99\"} " << percentiles.p99 << "\n";
        ss << name << "_max " << percentiles.max << "\n";
        ss << name << "_count " << percentiles.count << "\n";
    }

    return ss.str();
}

void MetricsCollector::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    histograms_.clear();
}

LatencyTimer::LatencyTimer(std::string metric_name)
    : metric_name_(std::move(metric_name)), start_(std::chrono::steady_clock::now()) {
}

LatencyTimer::~LatencyTimer() {
    if (!cancelled_) {
        auto end = std::chrono::steady_clock::now();
        auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_).count();
        MetricsCollector::instance().record_latency(metric_name_, static_cast<uint64_t>(duration_ns));
    }
}

} // namespace ic
