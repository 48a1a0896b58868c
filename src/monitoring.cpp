#include "monitoring.hpp"
#include "config.hpp"
#include "logger.hpp"
#include "proxy/services.hpp"
#include <algorithm>
#include <fstream>
#include <numeric>
#include <sstream>
#include <unistd.h>

namespace relay {

using json = nlohmann::json;

const char* health_status_name(HealthStatus status) {
    switch (status) {
        case HealthStatus::Healthy: return "healthy";
        case HealthStatus::Degraded: return "degraded";
        case HealthStatus::Unhealthy: return "unhealthy";
    }
    return "unhealthy";
}

// ========== CircularBuffer ==========

CircularBuffer::CircularBuffer(size_t capacity) : buffer_(capacity == 0 ? 1 : capacity) {}

void CircularBuffer::add(double value) {
    buffer_[index_] = value;
    index_ = (index_ + 1) % buffer_.size();
    if (count_ < buffer_.size()) {
        ++count_;
    }
}

std::vector<double> CircularBuffer::values() const {
    if (count_ < buffer_.size()) {
        return std::vector<double>(buffer_.begin(), buffer_.begin() + static_cast<long>(count_));
    }
    std::vector<double> out(buffer_.begin() + static_cast<long>(index_), buffer_.end());
    out.insert(out.end(), buffer_.begin(), buffer_.begin() + static_cast<long>(index_));
    return out;
}

void CircularBuffer::clear() {
    index_ = 0;
    count_ = 0;
}

// ========== Memory ==========

MemoryUsage read_memory_usage() {
    MemoryUsage usage;

    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line.substr(6));
            uint64_t kb = 0;
            iss >> kb;
            usage.used = kb * 1024;
            break;
        }
    }

    long pages = sysconf(_SC_PHYS_PAGES);
    long page_size = sysconf(_SC_PAGE_SIZE);
    if (pages > 0 && page_size > 0) {
        usage.total = static_cast<uint64_t>(pages) * static_cast<uint64_t>(page_size);
    }

    if (usage.total > 0) {
        usage.percentage = static_cast<double>(usage.used) / static_cast<double>(usage.total) * 100.0;
    }
    return usage;
}

static json memory_json(const MemoryUsage& memory) {
    return {
        {"used", memory.used},
        {"total", memory.total},
        {"percentage", memory.percentage}
    };
}

// ========== MonitoringService ==========

MonitoringService::MonitoringService(MemoryProbe memory_probe)
    : memory_probe_(std::move(memory_probe))
    , start_(std::chrono::steady_clock::now())
    , start_timestamp_(timestamp())
    , response_times_(RESPONSE_TIME_SAMPLES) {
    initialize_services();
}

void MonitoringService::initialize_services() {
    services_.clear();
    service_order_.clear();
    std::string now = timestamp();

    for (const auto& [alias, host] : proxy::GENERIC_SERVICES) {
        services_[alias] = ServiceHealth{alias, "generic", HealthStatus::Healthy, now, std::nullopt};
        service_order_.push_back(alias);
    }
    for (const auto& special : proxy::special_services()) {
        services_[special.alias] = ServiceHealth{special.alias, "special", HealthStatus::Healthy, now, std::nullopt};
        service_order_.push_back(special.alias);
    }
}

void MonitoringService::record_request(bool success, double response_time_ms, const std::string& service) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++total_;
    response_times_.add(response_time_ms);

    if (success) {
        ++successful_;
        return;
    }

    ++failed_;
    auto it = services_.find(service);
    if (it != services_.end()) {
        it->second.status = HealthStatus::Degraded;
        it->second.last_check = timestamp();
    }
}

void MonitoringService::update_service_health(const std::string& service, HealthStatus status,
                                              const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = services_.find(service);
    if (it == services_.end()) {
        return;
    }
    it->second.status = status;
    it->second.last_check = timestamp();
    if (!error.empty()) {
        it->second.error = error;
    }
}

std::optional<ServiceHealth> MonitoringService::service_health(const std::string& service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = services_.find(service);
    if (it == services_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MonitoringService::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    start_ = std::chrono::steady_clock::now();
    start_timestamp_ = timestamp();
    total_ = 0;
    successful_ = 0;
    failed_ = 0;
    response_times_.clear();
    initialize_services();
}

// The helpers below expect mutex_ to be held.

double MonitoringService::uptime_ms() const {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_).count();
}

double MonitoringService::average_response_time() const {
    auto values = response_times_.values();
    if (values.empty()) return 0.0;
    return std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());
}

json MonitoringService::services_json() const {
    json out = json::array();
    for (const auto& name : service_order_) {
        const auto& health = services_.at(name);
        json entry = {
            {"name", health.name},
            {"type", health.type},
            {"status", health_status_name(health.status)},
            {"lastCheck", health.last_check}
        };
        if (health.error) {
            entry["error"] = *health.error;
        }
        out.push_back(entry);
    }
    return out;
}

HealthStatus MonitoringService::services_status() const {
    size_t unhealthy = 0;
    size_t degraded = 0;
    for (const auto& [name, health] : services_) {
        if (health.status == HealthStatus::Unhealthy) ++unhealthy;
        if (health.status == HealthStatus::Degraded) ++degraded;
    }
    if (unhealthy > 0) return HealthStatus::Unhealthy;
    if (static_cast<double>(degraded) > static_cast<double>(services_.size()) * 0.3) return HealthStatus::Degraded;
    return HealthStatus::Healthy;
}

HealthStatus MonitoringService::requests_status() const {
    double error_rate = total_ > 0 ? static_cast<double>(failed_) / static_cast<double>(total_) * 100.0 : 0.0;
    if (error_rate > 10) return HealthStatus::Unhealthy;
    if (error_rate > 5) return HealthStatus::Degraded;
    return HealthStatus::Healthy;
}

HealthStatus MonitoringService::overall_status(const MemoryUsage& memory) const {
    if (memory.percentage > 95) return HealthStatus::Unhealthy;
    if (memory.percentage > 90 || failed_ > successful_) return HealthStatus::Degraded;
    return services_status();
}

Percentiles MonitoringService::percentiles() const {
    auto sorted = response_times_.values();
    if (sorted.empty()) return {};
    std::sort(sorted.begin(), sorted.end());
    auto at = [&](double q) {
        size_t idx = static_cast<size_t>(static_cast<double>(sorted.size()) * q);
        return sorted[std::min(idx, sorted.size() - 1)];
    };
    return {at(0.5), at(0.9), at(0.95), at(0.99)};
}

json MonitoringService::health_check() const {
    MemoryUsage memory = memory_probe_();
    std::lock_guard<std::mutex> lock(mutex_);

    double success_rate = total_ > 0 ? static_cast<double>(successful_) / static_cast<double>(total_) * 100.0 : 100.0;

    return {
        {"status", health_status_name(overall_status(memory))},
        {"timestamp", timestamp()},
        {"version", GATEWAY_VERSION},
        {"uptime", uptime_ms()},
        {"checks", {
            {"memory", memory.percentage < 90 ? "healthy" : "degraded"},
            {"services", health_status_name(services_status())},
            {"requests", health_status_name(requests_status())}
        }},
        {"metrics", {
            {"totalRequests", total_},
            {"successfulRequests", successful_},
            {"failedRequests", failed_},
            {"successRate", success_rate},
            {"averageResponseTime", average_response_time()}
        }},
        {"services", services_json()}
    };
}

json MonitoringService::detailed_metrics(const json& extra) const {
    MemoryUsage memory = memory_probe_();
    std::lock_guard<std::mutex> lock(mutex_);

    double uptime = uptime_ms();
    double success_rate = total_ > 0 ? static_cast<double>(successful_) / static_cast<double>(total_) * 100.0 : 100.0;
    double error_rate = total_ > 0 ? static_cast<double>(failed_) / static_cast<double>(total_) * 100.0 : 0.0;
    double uptime_hours = uptime / (1000.0 * 60 * 60);
    double throughput = uptime_hours > 0 ? static_cast<double>(total_) / uptime_hours : 0.0;
    Percentiles p = percentiles();

    json out = {
        {"system", {
            {"uptime", uptime},
            {"startTime", start_timestamp_},
            {"memory", memory_json(memory)},
            {"version", GATEWAY_VERSION}
        }},
        {"requests", {
            {"total", total_},
            {"successful", successful_},
            {"failed", failed_},
            {"successRate", success_rate},
            {"averageResponseTime", average_response_time()},
            {"responseTimeDistribution", {
                {"p50", p.p50}, {"p90", p.p90}, {"p95", p.p95}, {"p99", p.p99}
            }}
        }},
        {"services", services_json()},
        {"performance", {
            {"throughput", throughput},
            {"errorRate", error_rate}
        }}
    };

    if (extra.is_object()) {
        for (auto it = extra.begin(); it != extra.end(); ++it) {
            out[it.key()] = it.value();
        }
    }
    return out;
}

json MonitoringService::service_status() const {
    std::lock_guard<std::mutex> lock(mutex_);

    json generic_names = json::array();
    for (const auto& [alias, host] : proxy::GENERIC_SERVICES) {
        generic_names.push_back(alias);
    }

    json special = json::array();
    for (const auto& service : proxy::special_services()) {
        special.push_back({
            {"alias", service.alias},
            {"pathPrefix", service.path_prefix},
            {"models", service.models}
        });
    }

    return {
        {"generic", {{"count", proxy::GENERIC_SERVICES.size()}, {"services", generic_names}}},
        {"special", {{"count", proxy::special_services().size()}, {"services", special}}},
        {"health", services_json()}
    };
}

} // namespace relay
