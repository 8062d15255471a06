#pragma once

#include "botfleet/resilience/circuit_breaker.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/health_monitor.hpp"
#include "botfleet/resilience/periodic_task.hpp"
#include "botfleet/resilience/snapshot_store.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <string>
#include <vector>

namespace botfleet {
namespace resilience {

/**
 * Periodic snapshotting of tenant health into a SnapshotStore.
 *
 * Each run writes one row per tracked tenant, all sharing one timestamp and
 * carrying the tenant's breaker state, then drops rows older than the
 * retention window. restore_latest() seeds the HealthMonitor from the most
 * recent snapshot set at start-up.
 */
class HealthPersistenceService {
public:
    HealthPersistenceService(const PersistenceConfig& config,
                             std::shared_ptr<SnapshotStore> store,
                             std::shared_ptr<HealthMonitor> health,
                             std::shared_ptr<BreakerRegistry> breakers,
                             std::shared_ptr<Clock> clock,
                             std::shared_ptr<Observability> observability);
    ~HealthPersistenceService();

    // Returns the number of snapshots written
    caf::expected<size_t> persist_all();
    caf::expected<size_t> cleanup_old_snapshots();
    caf::expected<size_t> restore_latest();

    caf::expected<std::vector<StoredSnapshot>> get_tenant_history(const std::string& tenant_id,
                                                                  std::chrono::hours window);
    caf::expected<std::vector<StoredSnapshot>> get_unhealthy_history(std::chrono::hours window);

    // Runs persist_all and cleanup every persist_interval
    void start();
    void stop();
    bool running() const { return task_ && task_->running(); }

private:
    PersistenceConfig config_;
    std::shared_ptr<SnapshotStore> store_;
    std::shared_ptr<HealthMonitor> health_;
    std::shared_ptr<BreakerRegistry> breakers_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;
    std::unique_ptr<PeriodicTask> task_;

    void run_cycle();
};

} // namespace resilience
} // namespace botfleet
