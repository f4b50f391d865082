#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace credpool {

// Process-wide counters and gauges for the pool, the generator and the cache.
//
// Series recorded by credpool:
//   credential_allocations_total  credentials handed to callers
//   pool_exhausted_total          allocations that found no eligible row
//   emergency_refills_total       synchronous batches fetched for a caller
//   generator_starts_total        generator processes that reached READY
//   generator_batches_total       batches parsed from the generator
//   generator_failures_total      startup and IPC failures
//   warmup_runs_total             background warm-up runs started
//   warmup_errors_total           warm-up steps that backed off
//   cache_hits_total / cache_misses_total
//   pool_available (gauge)        fresh rows after the last allocation or batch
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    double get_counter(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(counters_, name);
    }

    double get_gauge(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return lookup(gauges_, name);
    }

    // Used by tests to start from an empty registry.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

    // Prometheus text exposition; printed by `credpool stats`.
    std::string collect_prometheus() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;
        write_family(ss, counters_, "counter");
        write_family(ss, gauges_, "gauge");
        return ss.str();
    }

private:
    MetricsRegistry() = default;

    using Series = std::map<std::string, double>;

    static double lookup(const Series& series, const std::string& name) {
        auto it = series.find(name);
        return it != series.end() ? it->second : 0.0;
    }

    static void write_family(std::stringstream& ss, const Series& series, const char* type) {
        for (const auto& [name, val] : series) {
            ss << "# TYPE " << name << " " << type << "\n"
               << name << " " << val << "\n";
        }
    }

    Series counters_;
    Series gauges_;
    mutable std::mutex mutex_;
};

}
