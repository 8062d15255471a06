#pragma once

#include "botfleet/resilience/clock.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace botfleet {
namespace resilience {

// Last time each tenant went through the guarded path
class TenantActivity {
public:
    void touch(const std::string& tenant_id, TimePoint now) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_seen_[tenant_id] = now;
    }

    std::optional<TimePoint> last_seen(const std::string& tenant_id) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_seen_.find(tenant_id);
        if (it == last_seen_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::string> idle_since(TimePoint cutoff) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> idle;
        for (const auto& entry : last_seen_) {
            if (entry.second <= cutoff) {
                idle.push_back(entry.first);
            }
        }
        return idle;
    }

    std::vector<std::string> tenants() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& entry : last_seen_) {
            ids.push_back(entry.first);
        }
        return ids;
    }

    void forget(const std::string& tenant_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_seen_.erase(tenant_id);
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, TimePoint> last_seen_;
};

} // namespace resilience
} // namespace botfleet
