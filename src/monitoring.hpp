#pragma once

/**
 * Request metrics, service health and the reports served on /health,
 * /metrics and /services.
 */

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace relay {

enum class HealthStatus {
    Healthy,
    Degraded,
    Unhealthy
};

const char* health_status_name(HealthStatus status);

/**
 * Fixed-capacity ring of the most recent samples.
 */
class CircularBuffer {
public:
    explicit CircularBuffer(size_t capacity);

    void add(double value);

    // Samples oldest first.
    std::vector<double> values() const;

    size_t count() const { return count_; }
    void clear();

private:
    std::vector<double> buffer_;
    size_t index_ = 0;
    size_t count_ = 0;
};

struct ServiceHealth {
    std::string name;
    std::string type;  // "generic" or "special"
    HealthStatus status = HealthStatus::Healthy;
    std::string last_check;
    std::optional<std::string> error;
};

struct MemoryUsage {
    uint64_t used = 0;
    uint64_t total = 0;
    double percentage = 0.0;
};

struct Percentiles {
    double p50 = 0;
    double p90 = 0;
    double p95 = 0;
    double p99 = 0;
};

// Returns resident set size against physical memory, or zeros if unknown.
MemoryUsage read_memory_usage();

class MonitoringService {
public:
    using MemoryProbe = std::function<MemoryUsage()>;

    explicit MonitoringService(MemoryProbe memory_probe = read_memory_usage);

    // Counts one request; a failure marks `service` degraded.
    void record_request(bool success, double response_time_ms, const std::string& service = "");

    void update_service_health(const std::string& service, HealthStatus status,
                               const std::string& error = "");

    nlohmann::json health_check() const;

    // `extra` is merged in at the top level (cache and rate limiter stats).
    nlohmann::json detailed_metrics(const nlohmann::json& extra = nlohmann::json::object()) const;

    nlohmann::json service_status() const;

    // Status of one service, for tests and diagnostics.
    std::optional<ServiceHealth> service_health(const std::string& service) const;

    void reset();

private:
    MemoryProbe memory_probe_;
    std::chrono::steady_clock::time_point start_;
    std::string start_timestamp_;
    mutable std::mutex mutex_;
    std::map<std::string, ServiceHealth> services_;
    std::vector<std::string> service_order_;
    uint64_t total_ = 0;
    uint64_t successful_ = 0;
    uint64_t failed_ = 0;
    CircularBuffer response_times_;

    void initialize_services();
    double uptime_ms() const;
    double average_response_time() const;
    nlohmann::json services_json() const;
    HealthStatus services_status() const;
    HealthStatus requests_status() const;
    HealthStatus overall_status(const MemoryUsage& memory) const;
    Percentiles percentiles() const;
};

} // namespace relay
