#include "botfleet/resilience/health_persistence.hpp"
#include <stdexcept>

namespace botfleet {
namespace resilience {

HealthPersistenceService::HealthPersistenceService(const PersistenceConfig& config,
                                                   std::shared_ptr<SnapshotStore> store,
                                                   std::shared_ptr<HealthMonitor> health,
                                                   std::shared_ptr<BreakerRegistry> breakers,
                                                   std::shared_ptr<Clock> clock,
                                                   std::shared_ptr<Observability> observability)
    : config_(config),
      store_(std::move(store)),
      health_(std::move(health)),
      breakers_(std::move(breakers)),
      clock_(std::move(clock)),
      observability_(std::move(observability)) {}

HealthPersistenceService::~HealthPersistenceService() {
    stop();
}

caf::expected<size_t> HealthPersistenceService::persist_all() {
    auto all_metrics = health_->get_all_metrics();
    if (all_metrics.empty()) {
        observability_->log_debug("No health metrics to persist");
        return size_t{0};
    }

    auto breaker_states = breakers_->get_all_states();
    auto timestamp = clock_->wall_now();
    // One batch per cycle so load_latest never sees a partial set
    std::vector<StoredSnapshot> rows;
    rows.reserve(all_metrics.size());
    for (const auto& entry : all_metrics) {
        StoredSnapshot row;
        row.tenant_id = entry.first;
        row.timestamp = timestamp;
        row.snapshot.metrics = entry.second;
        auto breaker = breaker_states.find(entry.first);
        if (breaker != breaker_states.end()) {
            row.snapshot.breaker_state = breaker->second.state;
        }
        rows.push_back(std::move(row));
    }
    auto stored = store_->store_batch(rows);
    if (!stored) {
        observability_->log_error("Failed to persist health snapshots", "",
                                  {{"error", caf::to_string(stored.error())},
                                   {"count", std::to_string(rows.size())}});
        return stored.error();
    }
    observability_->log_info("Persisted tenant health snapshots", "",
                             {{"count", std::to_string(rows.size())}});
    return rows.size();
}

caf::expected<size_t> HealthPersistenceService::cleanup_old_snapshots() {
    auto cutoff = clock_->wall_now() - config_.retention;
    auto removed = store_->cleanup_older_than(cutoff);
    if (!removed) {
        observability_->log_error("Failed to clean up health snapshots", "",
                                  {{"error", caf::to_string(removed.error())}});
        return removed;
    }
    if (*removed > 0) {
        observability_->log_info("Cleaned up old health snapshots", "",
                                 {{"removed", std::to_string(*removed)}});
    }
    return removed;
}

caf::expected<size_t> HealthPersistenceService::restore_latest() {
    auto latest = store_->load_latest();
    if (!latest) {
        observability_->log_error("Failed to load persisted health metrics", "",
                                  {{"error", caf::to_string(latest.error())}});
        return latest.error();
    }
    if (latest->empty()) {
        observability_->log_info("No persisted health metrics found");
        return size_t{0};
    }
    size_t restored = 0;
    for (const auto& row : *latest) {
        if (health_->restore(row.snapshot.metrics)) {
            restored++;
        }
    }
    observability_->log_info("Restored tenant health metrics", "",
                             {{"count", std::to_string(restored)}});
    return restored;
}

caf::expected<std::vector<StoredSnapshot>> HealthPersistenceService::get_tenant_history(
    const std::string& tenant_id, std::chrono::hours window) {
    return store_->load_history(tenant_id, clock_->wall_now() - window);
}

caf::expected<std::vector<StoredSnapshot>> HealthPersistenceService::get_unhealthy_history(
    std::chrono::hours window) {
    return store_->load_unhealthy_since(clock_->wall_now() - window);
}

void HealthPersistenceService::run_cycle() {
    auto persisted = persist_all();
    auto cleaned = cleanup_old_snapshots();
    // Reported to the periodic task, which counts the failure and keeps the schedule
    if (!persisted) {
        throw std::runtime_error(caf::to_string(persisted.error()));
    }
    if (!cleaned) {
        throw std::runtime_error(caf::to_string(cleaned.error()));
    }
}

void HealthPersistenceService::start() {
    if (!config_.enabled) {
        observability_->log_info("Health persistence disabled");
        return;
    }
    if (!task_) {
        task_ = std::make_unique<PeriodicTask>(
            "health_persistence", std::chrono::duration_cast<Seconds>(config_.persist_interval),
            [this]() { run_cycle(); }, observability_);
    }
    task_->start();
}

void HealthPersistenceService::stop() {
    if (task_) {
        task_->stop();
    }
}

} // namespace resilience
} // namespace botfleet
