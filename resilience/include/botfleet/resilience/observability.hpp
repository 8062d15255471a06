#pragma once

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace botfleet {
namespace resilience {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3 };

LogLevel parse_log_level(const std::string& name);

using LogContext = std::unordered_map<std::string, std::string>;

/**
 * Structured logging and Prometheus metrics for the resilience layer.
 *
 * Constructed once per process and shared by every component. Log lines are
 * single JSON objects; secret-looking context keys are redacted.
 */
class Observability {
public:
    explicit Observability(const std::string& instance_id);
    ~Observability();

    Observability(const Observability&) = delete;
    Observability& operator=(const Observability&) = delete;

    // Logging
    void log_debug(const std::string& message, const std::string& tenant_id = "",
                   const LogContext& context = {});
    void log_info(const std::string& message, const std::string& tenant_id = "",
                  const LogContext& context = {});
    void log_warn(const std::string& message, const std::string& tenant_id = "",
                  const LogContext& context = {});
    void log_error(const std::string& message, const std::string& tenant_id = "",
                   const LogContext& context = {});

    void set_log_level(LogLevel level) { min_level_ = level; }
    LogLevel log_level() const { return min_level_; }

    // Redirects log lines (tests); nullptr restores stdout/stderr
    void set_log_sink(std::function<void(LogLevel, const std::string&)> sink);

    std::string format_json_log(const std::string& level,
                                const std::string& message,
                                const std::string& tenant_id,
                                const LogContext& context) const;

    // Metrics (recorded only when BOTFLEET_METRICS_ENABLED is set)
    void record_rate_limit_decision(const std::string& scope, bool allowed);
    void record_breaker_transition(const std::string& to_state);
    void record_breaker_rejection();
    void record_retry(const std::string& category);
    void record_call(const std::string& outcome, double duration_seconds);
    void set_active_sessions(int64_t count);
    void record_session_event(const std::string& event);
    void set_tenant_status_count(const std::string& status, int64_t count);

    std::shared_ptr<prometheus::Registry> registry() { return registry_; }

    // Prometheus text format
    std::string get_metrics_response();

    // GET /metrics and GET /_health on a plain socket
    void set_health_provider(std::function<std::string()> provider);
    void start_metrics_endpoint(const std::string& address, uint16_t port);
    void stop_metrics_endpoint();
    bool metrics_endpoint_running() const { return server_running_; }

private:
    std::string instance_id_;
    std::atomic<LogLevel> min_level_{LogLevel::info};
    bool metrics_enabled_;

    mutable std::mutex sink_mutex_;
    std::function<void(LogLevel, const std::string&)> sink_;

    std::shared_ptr<prometheus::Registry> registry_;
    prometheus::Family<prometheus::Counter>* rate_limit_decisions_family_;
    prometheus::Family<prometheus::Counter>* breaker_transitions_family_;
    prometheus::Family<prometheus::Counter>* breaker_rejections_family_;
    prometheus::Family<prometheus::Counter>* retries_family_;
    prometheus::Family<prometheus::Counter>* calls_family_;
    prometheus::Family<prometheus::Histogram>* call_duration_family_;
    prometheus::Family<prometheus::Gauge>* active_sessions_family_;
    prometheus::Family<prometheus::Counter>* session_events_family_;
    prometheus::Family<prometheus::Gauge>* tenants_family_;

    std::mutex health_provider_mutex_;
    std::function<std::string()> health_provider_;

    std::thread server_thread_;
    std::atomic<bool> server_running_{false};
    int server_socket_{-1};

    void initialize_metrics();
    void write_log(LogLevel level, const std::string& level_name, const std::string& message,
                   const std::string& tenant_id, const LogContext& context);
    void server_loop(int socket_fd);
    std::string get_health_response();
};

} // namespace resilience
} // namespace botfleet
