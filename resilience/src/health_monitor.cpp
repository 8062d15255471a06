#include "botfleet/resilience/health_monitor.hpp"

namespace botfleet {
namespace resilience {

std::string to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::healthy:
            return "healthy";
        case HealthStatus::degraded:
            return "degraded";
        case HealthStatus::unhealthy:
            return "unhealthy";
        case HealthStatus::suspended:
            return "suspended";
    }
    return "unknown";
}

std::optional<HealthStatus> parse_health_status(const std::string& name) {
    if (name == "healthy") return HealthStatus::healthy;
    if (name == "degraded") return HealthStatus::degraded;
    if (name == "unhealthy") return HealthStatus::unhealthy;
    if (name == "suspended") return HealthStatus::suspended;
    return std::nullopt;
}

std::string health_band_for(double healthy_fraction) {
    if (healthy_fraction >= 0.9) {
        return "excellent";
    }
    if (healthy_fraction >= 0.75) {
        return "good";
    }
    if (healthy_fraction >= 0.5) {
        return "fair";
    }
    return "poor";
}

HealthMonitor::HealthMonitor(const HealthThresholds& thresholds, std::shared_ptr<Clock> clock,
                             std::shared_ptr<Observability> observability)
    : thresholds_(thresholds), clock_(std::move(clock)), observability_(std::move(observability)) {}

HealthMetrics& HealthMonitor::metrics_for(const std::string& tenant_id) {
    auto it = metrics_.find(tenant_id);
    if (it == metrics_.end()) {
        HealthMetrics fresh;
        fresh.tenant_id = tenant_id;
        it = metrics_.emplace(tenant_id, fresh).first;
    }
    return it->second;
}

void HealthMonitor::set_status(HealthMetrics& metrics, HealthStatus next, const std::string& reason) {
    if (metrics.status == next) {
        return;
    }
    LogContext context{{"from", to_string(metrics.status)}, {"to", to_string(next)},
                       {"reason", reason}};
    metrics.status = next;
    if (next == HealthStatus::unhealthy || next == HealthStatus::suspended) {
        observability_->log_warn("Tenant health status changed", metrics.tenant_id, context);
    } else {
        observability_->log_info("Tenant health status changed", metrics.tenant_id, context);
    }
    publish_status_counts();
}

void HealthMonitor::publish_status_counts() {
    int64_t counts[4] = {0, 0, 0, 0};
    for (const auto& entry : metrics_) {
        counts[static_cast<int>(entry.second.status)]++;
    }
    for (int i = 0; i < 4; ++i) {
        observability_->set_tenant_status_count(to_string(static_cast<HealthStatus>(i)), counts[i]);
    }
}

void HealthMonitor::evaluate(HealthMetrics& metrics) {
    if (metrics.status == HealthStatus::suspended) {
        return;
    }

    if (metrics.consecutive_failures >= thresholds_.max_consecutive_failures) {
        set_status(metrics, HealthStatus::unhealthy, "consecutive failures");
    } else if (metrics.error_rate >= thresholds_.critical_error_rate) {
        set_status(metrics, HealthStatus::unhealthy, "critical error rate");
    } else if (metrics.error_rate >= thresholds_.warning_error_rate) {
        set_status(metrics, HealthStatus::degraded, "elevated error rate");
    } else if (metrics.avg_latency_ms >= thresholds_.critical_latency_ms) {
        set_status(metrics, HealthStatus::degraded, "critical latency");
    } else if (metrics.avg_latency_ms >= thresholds_.warning_latency_ms) {
        if (metrics.status != HealthStatus::unhealthy) {
            set_status(metrics, HealthStatus::degraded, "elevated latency");
        }
    } else {
        set_status(metrics, HealthStatus::healthy, "recovered");
    }
}

void HealthMonitor::record_success(const std::string& tenant_id, double latency_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& metrics = metrics_for(tenant_id);
    auto now = clock_->wall_now();

    metrics.total_requests++;
    metrics.successful_requests++;
    metrics.consecutive_failures = 0;
    metrics.is_rate_limited = false;
    metrics.last_success = now;
    metrics.last_check = now;

    if (!metrics.latency_seeded) {
        metrics.avg_latency_ms = latency_ms;
        metrics.latency_seeded = true;
    } else {
        double alpha = thresholds_.latency_ema_alpha;
        metrics.avg_latency_ms = alpha * latency_ms + (1.0 - alpha) * metrics.avg_latency_ms;
    }
    metrics.error_rate = static_cast<double>(metrics.failed_requests) / metrics.total_requests;

    evaluate(metrics);
}

void HealthMonitor::record_failure(const std::string& tenant_id, ErrorCategory category,
                                   const std::string& error_type) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& metrics = metrics_for(tenant_id);
    auto now = clock_->wall_now();

    metrics.total_requests++;
    metrics.failed_requests++;
    metrics.consecutive_failures++;
    metrics.last_failure = now;
    metrics.last_check = now;
    metrics.last_error_type = error_type;
    if (category == ErrorCategory::rate_limited) {
        metrics.is_rate_limited = true;
    }
    metrics.error_rate = static_cast<double>(metrics.failed_requests) / metrics.total_requests;

    evaluate(metrics);
}

std::optional<HealthMetrics> HealthMonitor::get_metrics(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(tenant_id);
    if (it == metrics_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, HealthMetrics> HealthMonitor::get_all_metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

std::vector<HealthMetrics> HealthMonitor::get_unhealthy_tenants() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<HealthMetrics> result;
    for (const auto& entry : metrics_) {
        if (entry.second.status == HealthStatus::unhealthy ||
            entry.second.status == HealthStatus::suspended) {
            result.push_back(entry.second);
        }
    }
    return result;
}

HealthSummary HealthMonitor::get_health_summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    HealthSummary summary;
    summary.total_tenants = metrics_.size();

    double latency_sum = 0.0;
    size_t active = 0;
    for (const auto& entry : metrics_) {
        const auto& metrics = entry.second;
        switch (metrics.status) {
            case HealthStatus::healthy:
                summary.healthy++;
                break;
            case HealthStatus::degraded:
                summary.degraded++;
                break;
            case HealthStatus::unhealthy:
                summary.unhealthy++;
                break;
            case HealthStatus::suspended:
                summary.suspended++;
                break;
        }
        summary.total_requests += metrics.total_requests;
        summary.failed_requests += metrics.failed_requests;
        if (metrics.total_requests > 0) {
            latency_sum += metrics.avg_latency_ms;
            active++;
        }
    }

    if (summary.total_requests > 0) {
        summary.global_error_rate =
            static_cast<double>(summary.failed_requests) / summary.total_requests;
    }
    if (active > 0) {
        summary.average_latency_ms = latency_sum / active;
    }
    if (summary.total_tenants > 0) {
        summary.healthy_fraction =
            static_cast<double>(summary.healthy) / summary.total_tenants;
    }
    summary.health_band = health_band_for(summary.healthy_fraction);
    return summary;
}

void HealthMonitor::suspend(const std::string& tenant_id, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& metrics = metrics_for(tenant_id);
    metrics.suspension_reason = reason;
    metrics.last_check = clock_->wall_now();
    set_status(metrics, HealthStatus::suspended, reason);
}

bool HealthMonitor::resume(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(tenant_id);
    if (it == metrics_.end() || it->second.status != HealthStatus::suspended) {
        return false;
    }
    auto& metrics = it->second;
    metrics.suspension_reason.clear();
    metrics.last_check = clock_->wall_now();
    set_status(metrics, HealthStatus::healthy, "resumed");
    evaluate(metrics);
    return true;
}

bool HealthMonitor::reset_metrics(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(tenant_id);
    if (it == metrics_.end()) {
        return false;
    }
    HealthMetrics fresh;
    fresh.tenant_id = tenant_id;
    fresh.last_check = clock_->wall_now();
    if (it->second.status == HealthStatus::suspended) {
        fresh.status = HealthStatus::suspended;
        fresh.suspension_reason = it->second.suspension_reason;
    }
    bool status_changed = fresh.status != it->second.status;
    it->second = fresh;
    if (status_changed) {
        publish_status_counts();
    }
    observability_->log_info("Tenant health metrics reset", tenant_id);
    return true;
}

bool HealthMonitor::restore(const HealthMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (metrics_.count(metrics.tenant_id) > 0) {
        return false;
    }
    metrics_.emplace(metrics.tenant_id, metrics);
    publish_status_counts();
    return true;
}

bool HealthMonitor::is_suspended(const std::string& tenant_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = metrics_.find(tenant_id);
    return it != metrics_.end() && it->second.status == HealthStatus::suspended;
}

void HealthMonitor::remove(const std::string& tenant_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (metrics_.erase(tenant_id) > 0) {
        publish_status_counts();
    }
}

size_t HealthMonitor::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_.size();
}

} // namespace resilience
} // namespace botfleet
