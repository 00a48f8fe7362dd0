#pragma once

#include <string>
#include <map>
#include <mutex>
#include <sstream>

namespace streamguard {

// Singleton registry of security counters and gauges, exported in
// Prometheus text format.
class MetricsRegistry {
public:
    static MetricsRegistry& instance() {
        static MetricsRegistry instance;
        return instance;
    }

    // Counters only increase.
    void increment_counter(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_[name] += value;
    }

    void set_gauge(const std::string& name, double value) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] = value;
    }

    void increment_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] += value;
    }

    void decrement_gauge(const std::string& name, double value = 1.0) {
        std::lock_guard<std::mutex> lock(mutex_);
        gauges_[name] -= value;
    }

    double get_counter(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counters_.find(name);
        return (it != counters_.end()) ? it->second : 0.0;
    }

    double get_gauge(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = gauges_.find(name);
        return (it != gauges_.end()) ? it->second : 0.0;
    }

    /**
     * Serializes all recorded metrics into Prometheus exposition format (text version 0.0.4).
     */
    std::string collect_prometheus() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::stringstream ss;

        for (const auto& [name, val] : counters_) {
            ss << "# TYPE " << name << " counter\n";
            ss << name << " " << val << "\n";
        }

        for (const auto& [name, val] : gauges_) {
            ss << "# TYPE " << name << " gauge\n";
            ss << name << " " << val << "\n";
        }

        return ss.str();
    }

    // Test hook.
    void reset() {
        std::lock_guard<std::mutex> lock(mutex_);
        counters_.clear();
        gauges_.clear();
    }

private:
    MetricsRegistry() = default;

    std::map<std::string, double> counters_;
    std::map<std::string, double> gauges_;
    std::mutex mutex_;
};

// Metric names shared by the pipeline, handlers and tests.
namespace metric {
constexpr const char* kRequestsTotal = "streamguard_requests_total";
constexpr const char* kAccessDenied = "streamguard_access_denied_total";
constexpr const char* kSizeLimitExceeded = "streamguard_size_limit_exceeded_total";
constexpr const char* kValidationFailures = "streamguard_validation_failures_total";
constexpr const char* kSanitizationRejected = "streamguard_sanitization_rejected_total";
constexpr const char* kSuspiciousActivity = "streamguard_suspicious_activity_total";
constexpr const char* kPanicsRecovered = "streamguard_panics_recovered_total";
constexpr const char* kCacheHits = "streamguard_cache_hits_total";
constexpr const char* kCacheMisses = "streamguard_cache_misses_total";
constexpr const char* kCacheErrors = "streamguard_cache_errors_total";
constexpr const char* kRequestsCancelled = "streamguard_requests_cancelled_total";

// Gauges.
constexpr const char* kRequestsInFlight = "streamguard_requests_in_flight";
constexpr const char* kWorkerThreads = "streamguard_worker_threads";
}

}
