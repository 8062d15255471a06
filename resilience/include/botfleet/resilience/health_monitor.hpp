#pragma once

#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/errors.hpp"
#include "botfleet/resilience/observability.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace botfleet {
namespace resilience {

enum class HealthStatus { healthy, degraded, unhealthy, suspended };

std::string to_string(HealthStatus status);
std::optional<HealthStatus> parse_health_status(const std::string& name);

struct HealthMetrics {
    std::string tenant_id;
    HealthStatus status = HealthStatus::healthy;
    uint64_t total_requests = 0;
    uint64_t successful_requests = 0;
    uint64_t failed_requests = 0;
    double error_rate = 0.0;         // failed / total
    double avg_latency_ms = 0.0;     // EMA over successful calls
    uint32_t consecutive_failures = 0;
    std::optional<WallTime> last_success;
    std::optional<WallTime> last_failure;
    std::optional<WallTime> last_check;
    std::string last_error_type;
    bool is_rate_limited = false;    // Last failure was a rate limit, cleared by a success
    std::string suspension_reason;
    bool latency_seeded = false;
};

struct HealthSummary {
    size_t total_tenants = 0;
    size_t healthy = 0;
    size_t degraded = 0;
    size_t unhealthy = 0;
    size_t suspended = 0;
    uint64_t total_requests = 0;
    uint64_t failed_requests = 0;
    double global_error_rate = 0.0;
    double average_latency_ms = 0.0;  // Over tenants that served at least one request
    double healthy_fraction = 1.0;
    std::string health_band = "excellent";
};

// excellent >= 0.9, good >= 0.75, fair >= 0.5, poor otherwise
std::string health_band_for(double healthy_fraction);

/**
 * Rolling per-tenant success/failure statistics and status classification.
 *
 * Status is re-evaluated after every record:
 *   consecutive failures at the limit, or error rate at critical -> unhealthy
 *   error rate at warning, or latency at critical                -> degraded
 *   latency at warning                     -> degraded (unhealthy stays unhealthy)
 *   otherwise                                                    -> healthy
 * suspended is set and cleared only through suspend() and resume().
 */
class HealthMonitor {
public:
    HealthMonitor(const HealthThresholds& thresholds, std::shared_ptr<Clock> clock,
                  std::shared_ptr<Observability> observability);

    void record_success(const std::string& tenant_id, double latency_ms);
    void record_failure(const std::string& tenant_id, ErrorCategory category,
                        const std::string& error_type);

    std::optional<HealthMetrics> get_metrics(const std::string& tenant_id) const;
    std::map<std::string, HealthMetrics> get_all_metrics() const;

    // Unhealthy and suspended tenants
    std::vector<HealthMetrics> get_unhealthy_tenants() const;

    HealthSummary get_health_summary() const;

    void suspend(const std::string& tenant_id, const std::string& reason);
    // Returns false if the tenant is not suspended
    bool resume(const std::string& tenant_id);

    // Clears counters and latency; a suspension survives the reset
    bool reset_metrics(const std::string& tenant_id);

    // Loads a persisted record for a tenant not tracked yet; returns false otherwise
    bool restore(const HealthMetrics& metrics);

    bool is_suspended(const std::string& tenant_id) const;
    void remove(const std::string& tenant_id);
    size_t size() const;

private:
    HealthThresholds thresholds_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mutex_;
    std::map<std::string, HealthMetrics> metrics_;

    // Caller holds mutex_
    HealthMetrics& metrics_for(const std::string& tenant_id);
    void evaluate(HealthMetrics& metrics);
    void set_status(HealthMetrics& metrics, HealthStatus next, const std::string& reason);
    void publish_status_counts();
};

} // namespace resilience
} // namespace botfleet
