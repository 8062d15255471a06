#include <iostream>
#include <caf/actor_system.hpp>
#include <caf/actor_system_config.hpp>
#include "botfleet/resilience/bucket_store.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/feature_flags.hpp"
#include "botfleet/resilience/guard_options.hpp"
#include "botfleet/resilience/observability.hpp"
#include "botfleet/resilience/report_converter.hpp"
#include "botfleet/resilience/snapshot_store.hpp"
#include "botfleet/resilience/tenant_registry.hpp"
#include <unistd.h>

using namespace botfleet::resilience;

class GuardConfig : public caf::actor_system_config {
public:
    GuardConfig() {
        opt_group{custom_options_, "botfleet"}
            .add(options.instance_id, "instance-id", "Instance identifier used in logs")
            .add(options.worker_threads, "worker-threads", "Shared worker pool size")
            .add(options.global_capacity, "global-capacity", "Global bucket capacity")
            .add(options.global_refill, "global-refill", "Global bucket refill (tokens/s)")
            .add(options.tenant_capacity, "tenant-capacity", "Per-tenant bucket capacity")
            .add(options.tenant_refill, "tenant-refill", "Per-tenant bucket refill (tokens/s)")
            .add(options.idle_bucket_ttl_ms, "idle-bucket-ttl-ms", "Idle bucket purge window (ms)")
            .add(options.max_admission_wait_ms, "max-admission-wait-ms", "Bounded rate-limit wait (ms)")
            .add(options.shared_store_timeout_ms, "shared-store-timeout-ms", "Bucket store request timeout (ms)")
            .add(options.breaker_failure_threshold, "breaker-failure-threshold", "Failures before opening")
            .add(options.breaker_success_threshold, "breaker-success-threshold", "Trial successes before closing")
            .add(options.breaker_timeout_ms, "breaker-timeout-ms", "Open cool-down (ms)")
            .add(options.breaker_transition_history, "breaker-transition-history", "Transitions kept per breaker");
        add_retry_options(options.retry_rate_limited, "rate-limited");
        add_retry_options(options.retry_transient, "transient");
        add_retry_options(options.retry_unknown, "unknown");
        opt_group{custom_options_, "botfleet"}
            .add(options.warning_error_rate, "warning-error-rate", "Degraded error rate")
            .add(options.critical_error_rate, "critical-error-rate", "Unhealthy error rate")
            .add(options.max_consecutive_failures, "max-consecutive-failures", "Unhealthy failure streak")
            .add(options.warning_latency_ms, "warning-latency-ms", "Degraded latency (ms)")
            .add(options.critical_latency_ms, "critical-latency-ms", "Critical latency (ms)")
            .add(options.latency_ema_alpha, "latency-ema-alpha", "Latency smoothing factor")
            .add(options.max_total_connections, "max-connections", "Maximum open sessions")
            .add(options.acquire_timeout_ms, "acquire-timeout-ms", "Session permit timeout (ms)")
            .add(options.session_timeout_ms, "session-timeout-ms", "Stale session age (ms)")
            .add(options.session_history_size, "session-history-size", "Closed sessions kept")
            .add(options.session_metrics_window_ms, "session-metrics-window-ms", "Pool status window (ms)")
            .add(options.cleanup_interval_ms, "cleanup-interval-ms", "Idle tenant sweep interval (ms)")
            .add(options.tenant_idle_timeout_ms, "tenant-idle-timeout-ms", "Idle tenant age (ms)")
            .add(options.stale_session_interval_ms, "stale-session-interval-ms", "Stale session sweep interval (ms)")
            .add(options.persistence_enabled, "persistence", "Enable health snapshots")
            .add(options.database_path, "database", "SQLite snapshot database")
            .add(options.persist_interval_ms, "persist-interval-ms", "Snapshot interval (ms)")
            .add(options.retention_days, "retention-days", "Snapshot retention (days)")
            .add(options.metrics_endpoint, "metrics-endpoint", "address:port for /metrics and /_health");
    }

    GuardOptions options;

private:
    // retry-<category>-* options for one error category
    void add_retry_options(RetryOptions& retry, const std::string& category) {
        auto name = [&category](const char* suffix) { return "retry-" + category + "-" + suffix; };
        opt_group{custom_options_, "botfleet"}
            .add(retry.max_retries, name("max-retries"), "Retries before giving up")
            .add(retry.base_delay_ms, name("base-delay-ms"), "Backoff base delay (ms)")
            .add(retry.max_delay_ms, name("max-delay-ms"), "Backoff ceiling (ms)")
            .add(retry.strategy, name("strategy"), "exponential|linear|fixed|fibonacci")
            .add(retry.exponential_base, name("exponential-base"), "Growth factor for exponential backoff")
            .add(retry.jitter, name("jitter"), "Perturb delays by up to 25%")
            .add(retry.honor_retry_after, name("honor-retry-after"), "Wait the server-provided hint verbatim");
    }
};

int caf_main(caf::actor_system& system, const GuardConfig& guard_config) {
    std::shared_ptr<Observability> observability;

    try {
        observability = std::make_shared<Observability>(
            guard_config.options.instance_id + "_" + std::to_string(getpid()));

        auto config = to_resilience_config(guard_config.options);
        if (!config) {
            observability->log_error("Invalid configuration", "",
                                     {{"error", caf::to_string(config.error())}});
            return 1;
        }

        RegistryPlugins plugins;
        if (FeatureFlags::is_shared_bucket_store_enabled()) {
            auto store = system.spawn(bucket_store_actor);
            plugins.bucket_backend = std::make_shared<ActorBucketBackend>(
                system, store, config->rate_limiter.shared_store_timeout);
        }
        if (config->persistence.enabled) {
            auto store = SqliteSnapshotStore::open(config->persistence.database_path);
            if (!store) {
                observability->log_error("Snapshot store unavailable", "",
                                         {{"error", caf::to_string(store.error())}});
                return 1;
            }
            plugins.snapshot_store = std::shared_ptr<SnapshotStore>(std::move(*store));
        }

        auto clock = std::make_shared<SystemClock>();
        TenantRegistry registry(*config, clock, observability, plugins);

        observability->log_info("Resilience layer starting", "", {
            {"worker_threads", std::to_string(config->worker_threads)},
            {"max_connections", std::to_string(config->session_pool.max_total_connections)},
            {"shared_bucket_store", FeatureFlags::is_shared_bucket_store_enabled() ? "true" : "false"},
            {"persistence", config->persistence.enabled ? "true" : "false"}
        });

        auto restored = registry.restore_latest();
        if (!restored) {
            observability->log_warn("Starting without persisted health state", "",
                                    {{"error", caf::to_string(restored.error())}});
        }

        // Parse metrics_endpoint (format: "address:port")
        std::string address = "0.0.0.0";
        uint16_t port = 9090;
        const auto& endpoint = guard_config.options.metrics_endpoint;
        size_t colon_pos = endpoint.find(':');
        if (colon_pos != std::string::npos) {
            address = endpoint.substr(0, colon_pos);
            port = static_cast<uint16_t>(std::stoi(endpoint.substr(colon_pos + 1)));
        }
        observability->set_health_provider([&registry]() {
            nlohmann::json health = ReportConverter::to_json(registry.get_health_summary());
            health["pool"] = ReportConverter::to_json(registry.get_pool_status());
            health["open_breakers"] = registry.breakers().get_open_breakers();
            return health.dump();
        });
        observability->start_metrics_endpoint(address, port);

        registry.start_background_tasks();

        observability->log_info("Resilience layer is running. Press Enter to exit...");
        std::cin.get();

        observability->log_info("Resilience layer shutting down");
        registry.stop_background_tasks();
        if (auto* persistence = registry.persistence()) {
            auto persisted = persistence->persist_all();
            if (!persisted) {
                observability->log_warn("Final health snapshot failed", "",
                                        {{"error", caf::to_string(persisted.error())}});
            }
        }
        observability->stop_metrics_endpoint();

    } catch (const std::exception& e) {
        if (observability) {
            observability->log_error("Fatal error", "", {{"error", e.what()}});
        } else {
            std::cerr << "Fatal error (observability not initialized): " << e.what() << std::endl;
        }
        return 1;
    }
    return 0;
}

int main(int argc, char** argv) {
    GuardConfig config;

    if (auto err = config.parse(argc, argv)) {
        std::cerr << "Failed to parse arguments: " << caf::to_string(err) << std::endl;
        return 1;
    }

    caf::actor_system system(config);
    return caf_main(system, config);
}
