#pragma once

#include "botfleet/resilience/clock.hpp"
#include "botfleet/resilience/config.hpp"
#include "botfleet/resilience/errors.hpp"
#include "botfleet/resilience/observability.hpp"
#include <caf/expected.hpp>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace botfleet {
namespace resilience {

enum class SessionStatus { open, released };

std::string to_string(SessionStatus status);

struct SessionStats {
    uint64_t messages = 0;
    uint64_t channels = 0;
    uint64_t errors = 0;
};

struct SessionSlot {
    uint64_t session_id = 0;
    std::string tenant_id;
    TimePoint acquired_at;
    WallTime acquired_wall;
    SessionStatus status = SessionStatus::open;
    SessionStats stats;
};

struct SessionRecord {
    uint64_t session_id = 0;
    std::string tenant_id;
    WallTime started_at;
    WallTime ended_at;
    double duration_seconds = 0.0;
    SessionStats stats;
    bool forced = false;  // Released by the stale-session sweep
};

struct PoolStatus {
    size_t active_sessions = 0;
    size_t max_connections = 0;
    size_t available = 0;
    size_t pending = 0;
    uint64_t acquired = 0;
    uint64_t released = 0;
    uint64_t busy_rejections = 0;
    uint64_t exhausted = 0;
    uint64_t stale_released = 0;
    // Aggregates over sessions that ended inside the metrics window
    double window_seconds = 0.0;
    size_t recent_sessions = 0;
    double avg_duration_seconds = 0.0;
    double avg_messages = 0.0;
    double avg_channels = 0.0;
    double avg_errors = 0.0;
    std::vector<std::string> active_tenants;
};

/**
 * Bounded, single-flight session bookkeeping.
 *
 * At most one open slot per tenant; a second acquire for the same tenant is
 * rejected immediately, even while the first one is still waiting for a
 * permit. The total of open slots never exceeds max_total_connections.
 */
class SessionPool {
public:
    SessionPool(const SessionPoolConfig& config, std::shared_ptr<Clock> clock,
                std::shared_ptr<Observability> observability);

    // Fails with session_busy, pool_exhausted or cancelled
    caf::expected<SessionSlot> acquire_session(const std::string& tenant_id,
                                               const CancellationToken* cancel = nullptr);

    caf::expected<void> record_activity(const std::string& tenant_id, const SessionStats& delta);

    // session_id guards against releasing a newer session after a forced release
    caf::expected<SessionRecord> release_session(const std::string& tenant_id,
                                                 const SessionStats& stats = {},
                                                 std::optional<uint64_t> session_id = std::nullopt);

    // Force-releases slots open longer than session_timeout
    std::vector<SessionRecord> sweep_stale();

    PoolStatus get_pool_status() const;
    bool has_open_session(const std::string& tenant_id) const;
    std::optional<SessionSlot> get_session(const std::string& tenant_id) const;
    std::vector<SessionRecord> history() const;

    const SessionPoolConfig& config() const { return config_; }

private:
    friend class SessionLease;

    SessionPoolConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<Observability> observability_;

    mutable std::mutex mutex_;
    std::condition_variable permit_released_;
    std::map<std::string, SessionSlot> active_;
    std::set<std::string> pending_;
    std::deque<SessionRecord> history_;
    uint64_t next_session_id_ = 1;

    uint64_t acquired_ = 0;
    uint64_t released_ = 0;
    uint64_t busy_rejections_ = 0;
    uint64_t exhausted_ = 0;
    uint64_t stale_released_ = 0;

    // Caller holds mutex_
    SessionRecord close_slot(std::map<std::string, SessionSlot>::iterator it, bool forced);

    void release_lease(const std::string& tenant_id, uint64_t session_id,
                       const SessionStats& stats);
};

/**
 * Open session held for the lifetime of the lease. Releases on every exit path.
 * Move-only.
 */
class SessionLease {
public:
    SessionLease() = default;
    SessionLease(SessionPool& pool, SessionSlot slot);
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;
    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    // Accumulated locally, handed to the pool on release
    void add_stats(const SessionStats& delta);

    void release();
    bool active() const { return pool_ != nullptr; }
    const SessionSlot& slot() const { return slot_; }

private:
    SessionPool* pool_ = nullptr;
    SessionSlot slot_;
    SessionStats pending_stats_;
};

} // namespace resilience
} // namespace botfleet
