#pragma once

#include "botfleet/resilience/circuit_breaker.hpp"
#include "botfleet/resilience/health_monitor.hpp"
#include <caf/expected.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

namespace botfleet {
namespace resilience {

// Health metrics of one tenant at one point in time
struct HealthSnapshot {
    HealthMetrics metrics;
    std::optional<BreakerState> breaker_state;
};

struct StoredSnapshot {
    std::string tenant_id;
    WallTime timestamp;
    HealthSnapshot snapshot;
};

/**
 * Sink and query contract for long-term health history.
 *
 * Timestamps are wall-clock and compared with microsecond precision.
 */
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    virtual caf::expected<void> store_snapshot(const std::string& tenant_id,
                                               const HealthSnapshot& snapshot,
                                               WallTime timestamp) = 0;

    // All rows or none
    virtual caf::expected<void> store_batch(const std::vector<StoredSnapshot>& rows) = 0;

    // Oldest first
    virtual caf::expected<std::vector<StoredSnapshot>> load_history(const std::string& tenant_id,
                                                                    WallTime since) = 0;

    // Every row sharing the most recent timestamp
    virtual caf::expected<std::vector<StoredSnapshot>> load_latest() = 0;

    // Unhealthy or suspended rows, newest first
    virtual caf::expected<std::vector<StoredSnapshot>> load_unhealthy_since(WallTime since) = 0;

    // Returns the number of rows removed
    virtual caf::expected<size_t> cleanup_older_than(WallTime cutoff) = 0;
};

class InMemorySnapshotStore : public SnapshotStore {
public:
    caf::expected<void> store_snapshot(const std::string& tenant_id, const HealthSnapshot& snapshot,
                                       WallTime timestamp) override;
    caf::expected<void> store_batch(const std::vector<StoredSnapshot>& rows) override;
    caf::expected<std::vector<StoredSnapshot>> load_history(const std::string& tenant_id,
                                                            WallTime since) override;
    caf::expected<std::vector<StoredSnapshot>> load_latest() override;
    caf::expected<std::vector<StoredSnapshot>> load_unhealthy_since(WallTime since) override;
    caf::expected<size_t> cleanup_older_than(WallTime cutoff) override;

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<StoredSnapshot> rows_;
};

/**
 * SQLite-backed store, one row per tenant per snapshot in health_snapshots.
 * A single connection is shared and serialized by a mutex.
 */
class SqliteSnapshotStore : public SnapshotStore {
public:
    // Opens (or creates) the database and its schema; ":memory:" is accepted
    static caf::expected<std::unique_ptr<SqliteSnapshotStore>> open(const std::string& path);

    ~SqliteSnapshotStore() override;

    SqliteSnapshotStore(const SqliteSnapshotStore&) = delete;
    SqliteSnapshotStore& operator=(const SqliteSnapshotStore&) = delete;

    caf::expected<void> store_snapshot(const std::string& tenant_id, const HealthSnapshot& snapshot,
                                       WallTime timestamp) override;
    // One transaction, rolled back if any insert fails
    caf::expected<void> store_batch(const std::vector<StoredSnapshot>& rows) override;
    caf::expected<std::vector<StoredSnapshot>> load_history(const std::string& tenant_id,
                                                            WallTime since) override;
    caf::expected<std::vector<StoredSnapshot>> load_latest() override;
    caf::expected<std::vector<StoredSnapshot>> load_unhealthy_since(WallTime since) override;
    caf::expected<size_t> cleanup_older_than(WallTime cutoff) override;

private:
    explicit SqliteSnapshotStore(sqlite3* db) : db_(db) {}

    // Caller holds mutex_; throws on failure
    void insert_row(const std::string& tenant_id, const HealthSnapshot& snapshot,
                    WallTime timestamp);

    std::mutex mutex_;
    sqlite3* db_;
};

} // namespace resilience
} // namespace botfleet
