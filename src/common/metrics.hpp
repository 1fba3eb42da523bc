#pragma once

#include "../intern/string_cache.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace ic {

// Fixed-bucket latency histogram; percentiles resolve to bucket upper bounds.
class LatencyHistogram {
public:
    explicit LatencyHistogram(const std::vector<uint64_t>& buckets_ns);

    void record(uint64_t latency_ns);

    struct Percentiles {
        uint64_t p50;
        uint64_t p95;
        uint64_t p99;
        uint64_t max;
        uint64_t count;
    };

    Percentiles get_percentiles() const;
    void reset();

private:
    std::vector<uint64_t> buckets_;
    std::vector<std::atomic<uint64_t>> counts_;  // last slot is overflow
    std::atomic<uint64_t> total_count_{0};
    std::atomic<uint64_t> max_value_{0};
};

class MetricsCollector {
public:
    static MetricsCollector& instance();

    void increment_counter(const std::string& name, uint64_t delta = 1);
    uint64_t get_counter(const std::string& name) const;

    void set_gauge(const std::string& name, double value);
    double get_gauge(const std::string& name) const;

    void record_latency(const std::string& name, uint64_t latency_ns);
    LatencyHistogram::Percentiles get_latency_percentiles(const std::string& name) const;

    // Copies cache statistics into the string_cache_* gauges
    void publish_cache_stats(const CacheStats& stats);

    std::string get_prometheus_metrics() const;
    std::string get_json_metrics() const;

    void reset();

private:
    MetricsCollector() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> counters_;
    std::unordered_map<std::string, double> gauges_;
    std::unordered_map<std::string, std::unique_ptr<LatencyHistogram>> histograms_;

    // Interning runs in tens to hundreds of nanoseconds; contended locks go higher
    std::vector<uint64_t> default_buckets_ = {
        50, 100, 250, 500, 1000, 5000, 25000, 100000, 1000000
    };
};

// RAII latency timer
class LatencyTimer {
public:
    explicit LatencyTimer(std::string metric_name);
    ~LatencyTimer();

    void cancel() { cancelled_ = true; }

private:
    std::string metric_name_;
    std::chrono::steady_clock::time_point start_;
    bool cancelled_ = false;
};

#define IC_MEASURE_LATENCY(name) ic::LatencyTimer _ic_latency_timer(name)

} // namespace ic
