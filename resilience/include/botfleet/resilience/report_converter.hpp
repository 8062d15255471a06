#pragma once

#include "botfleet/resilience/circuit_breaker.hpp"
#include "botfleet/resilience/health_monitor.hpp"
#include "botfleet/resilience/rate_limiter.hpp"
#include "botfleet/resilience/session_pool.hpp"
#include "botfleet/resilience/snapshot_store.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace botfleet {
namespace resilience {

// JSON shapes handed to the admin layer. Enums are rendered as lowercase strings,
// timestamps as ISO-8601 UTC, absent timestamps as null.
class ReportConverter {
public:
    static std::string format_timestamp(WallTime t);

    static nlohmann::json to_json(const RateLimitStats& stats);
    static nlohmann::json to_json(const TransitionEvent& event);
    static nlohmann::json to_json(const BreakerSnapshot& snapshot);
    static nlohmann::json to_json(const HealthMetrics& metrics);
    static nlohmann::json to_json(const HealthSummary& summary);
    static nlohmann::json to_json(const PoolStatus& status);
    static nlohmann::json to_json(const SessionRecord& record);
    static nlohmann::json to_json(const StoredSnapshot& snapshot);

    static nlohmann::json breakers_to_json(const std::map<std::string, BreakerSnapshot>& states);
    static nlohmann::json tenants_to_json(const std::vector<HealthMetrics>& tenants);
    static nlohmann::json snapshots_to_json(const std::vector<StoredSnapshot>& snapshots);
};

} // namespace resilience
} // namespace botfleet
