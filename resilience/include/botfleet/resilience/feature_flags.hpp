#pragma once

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>

namespace botfleet {
namespace resilience {

/**
 * Runtime feature flags read from the environment.
 *
 * - BOTFLEET_METRICS_ENABLED: record Prometheus metrics and allow the /metrics endpoint
 * - BOTFLEET_SHARED_BUCKET_STORE_ENABLED: route bucket updates through the shared store actor
 * - BOTFLEET_LOG_LEVEL: minimum log level (debug|info|warn|error), defaults to info
 */
class FeatureFlags {
public:
    static bool is_metrics_enabled() {
        return get_env_bool("BOTFLEET_METRICS_ENABLED", false);
    }

    static bool is_shared_bucket_store_enabled() {
        return get_env_bool("BOTFLEET_SHARED_BUCKET_STORE_ENABLED", false);
    }

    static std::string log_level() {
        const char* value = std::getenv("BOTFLEET_LOG_LEVEL");
        if (value == nullptr) {
            return "info";
        }
        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);
        return str_value;
    }

private:
    // "true", "1" and "yes" (case-insensitive) are true; anything else is the default
    static bool get_env_bool(const char* env_var, bool default_value) {
        const char* value = std::getenv(env_var);
        if (value == nullptr) {
            return default_value;
        }

        std::string str_value(value);
        std::transform(str_value.begin(), str_value.end(), str_value.begin(), ::tolower);

        return (str_value == "true" || str_value == "1" || str_value == "yes");
    }
};

} // namespace resilience
} // namespace botfleet
