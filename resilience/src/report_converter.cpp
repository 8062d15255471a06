#include "botfleet/resilience/report_converter.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace botfleet {
namespace resilience {

namespace {

nlohmann::json optional_time(const std::optional<WallTime>& t) {
    if (!t) {
        return nullptr;
    }
    return ReportConverter::format_timestamp(*t);
}

} // namespace

std::string ReportConverter::format_timestamp(WallTime t) {
    auto time_t_value = std::chrono::system_clock::to_time_t(t);
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(t.time_since_epoch()) % 1000000;
    if (micros.count() < 0) {
        micros += std::chrono::microseconds(1000000);
    }
    std::tm tm_utc{};
    gmtime_r(&time_t_value, &tm_utc);
    std::ostringstream oss;
    oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(6)
        << micros.count() << "Z";
    return oss.str();
}

nlohmann::json ReportConverter::to_json(const RateLimitStats& stats) {
    return nlohmann::json{
        {"scope", stats.scope},
        {"known", stats.known},
        {"tokens_available", stats.tokens_available},
        {"capacity", stats.capacity},
        {"refill_per_second", stats.refill_per_second},
        {"allowed", stats.allowed},
        {"rejected", stats.rejected},
        {"penalties", stats.penalties},
        {"store_failures", stats.store_failures},
    };
}

nlohmann::json ReportConverter::to_json(const TransitionEvent& event) {
    return nlohmann::json{
        {"from", to_string(event.from)},
        {"to", to_string(event.to)},
        {"at", format_timestamp(event.at)},
        {"reason", event.reason},
    };
}

nlohmann::json ReportConverter::to_json(const BreakerSnapshot& snapshot) {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& event : snapshot.history) {
        history.push_back(to_json(event));
    }
    return nlohmann::json{
        {"tenant_id", snapshot.tenant_id},
        {"state", to_string(snapshot.state)},
        {"failure_count", snapshot.failure_count},
        {"success_count", snapshot.success_count},
        {"failure_threshold", snapshot.failure_threshold},
        {"success_threshold", snapshot.success_threshold},
        {"timeout_seconds", snapshot.timeout_seconds},
        {"timeout_remaining_seconds", snapshot.timeout_remaining_seconds},
        {"opened_at", optional_time(snapshot.opened_at)},
        {"last_failure_reason", snapshot.last_failure_reason},
        {"total_calls", snapshot.total_calls},
        {"total_successes", snapshot.total_successes},
        {"total_failures", snapshot.total_failures},
        {"rejected_calls", snapshot.rejected_calls},
        {"transitions", snapshot.transitions},
        {"trials_in_flight", snapshot.trials_in_flight},
        {"history", history},
    };
}

nlohmann::json ReportConverter::to_json(const HealthMetrics& metrics) {
    return nlohmann::json{
        {"tenant_id", metrics.tenant_id},
        {"status", to_string(metrics.status)},
        {"total_requests", metrics.total_requests},
        {"successful_requests", metrics.successful_requests},
        {"failed_requests", metrics.failed_requests},
        {"error_rate", metrics.error_rate},
        {"avg_latency_ms", metrics.avg_latency_ms},
        {"consecutive_failures", metrics.consecutive_failures},
        {"last_success", optional_time(metrics.last_success)},
        {"last_failure", optional_time(metrics.last_failure)},
        {"last_check", optional_time(metrics.last_check)},
        {"last_error_type", metrics.last_error_type},
        {"is_rate_limited", metrics.is_rate_limited},
        {"suspension_reason", metrics.suspension_reason},
    };
}

nlohmann::json ReportConverter::to_json(const HealthSummary& summary) {
    return nlohmann::json{
        {"total_tenants", summary.total_tenants},
        {"status_counts",
         {{"healthy", summary.healthy},
          {"degraded", summary.degraded},
          {"unhealthy", summary.unhealthy},
          {"suspended", summary.suspended}}},
        {"total_requests", summary.total_requests},
        {"failed_requests", summary.failed_requests},
        {"global_error_rate", summary.global_error_rate},
        {"average_latency_ms", summary.average_latency_ms},
        {"healthy_fraction", summary.healthy_fraction},
        {"health_band", summary.health_band},
    };
}

nlohmann::json ReportConverter::to_json(const PoolStatus& status) {
    return nlohmann::json{
        {"active_sessions", status.active_sessions},
        {"max_connections", status.max_connections},
        {"available", status.available},
        {"pending", status.pending},
        {"counters",
         {{"acquired", status.acquired},
          {"released", status.released},
          {"busy_rejections", status.busy_rejections},
          {"exhausted", status.exhausted},
          {"stale_released", status.stale_released}}},
        {"recent_window",
         {{"window_seconds", status.window_seconds},
          {"sessions", status.recent_sessions},
          {"avg_duration_seconds", status.avg_duration_seconds},
          {"avg_messages", status.avg_messages},
          {"avg_channels", status.avg_channels},
          {"avg_errors", status.avg_errors}}},
        {"active_tenants", status.active_tenants},
    };
}

nlohmann::json ReportConverter::to_json(const SessionRecord& record) {
    return nlohmann::json{
        {"session_id", record.session_id},
        {"tenant_id", record.tenant_id},
        {"started_at", format_timestamp(record.started_at)},
        {"ended_at", format_timestamp(record.ended_at)},
        {"duration_seconds", record.duration_seconds},
        {"messages", record.stats.messages},
        {"channels", record.stats.channels},
        {"errors", record.stats.errors},
        {"forced", record.forced},
    };
}

nlohmann::json ReportConverter::to_json(const StoredSnapshot& snapshot) {
    auto json = to_json(snapshot.snapshot.metrics);
    json["timestamp"] = format_timestamp(snapshot.timestamp);
    if (snapshot.snapshot.breaker_state) {
        json["breaker_state"] = to_string(*snapshot.snapshot.breaker_state);
    } else {
        json["breaker_state"] = nullptr;
    }
    return json;
}

nlohmann::json ReportConverter::breakers_to_json(const std::map<std::string, BreakerSnapshot>& states) {
    nlohmann::json result = nlohmann::json::object();
    for (const auto& entry : states) {
        result[entry.first] = to_json(entry.second);
    }
    return result;
}

nlohmann::json ReportConverter::tenants_to_json(const std::vector<HealthMetrics>& tenants) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& metrics : tenants) {
        result.push_back(to_json(metrics));
    }
    return result;
}

nlohmann::json ReportConverter::snapshots_to_json(const std::vector<StoredSnapshot>& snapshots) {
    nlohmann::json result = nlohmann::json::array();
    for (const auto& snapshot : snapshots) {
        result.push_back(to_json(snapshot));
    }
    return result;
}

} // namespace resilience
} // namespace botfleet
