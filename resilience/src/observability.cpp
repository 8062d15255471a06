#include "botfleet/resilience/observability.hpp"
#include "botfleet/resilience/feature_flags.hpp"
#include <prometheus/text_serializer.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>
#include <vector>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

namespace botfleet {
namespace resilience {

using json = nlohmann::json;

// Context keys carrying tenant credentials or personal data
static const std::vector<std::string> SECRET_FIELDS = {
    "token", "api_key", "session_string", "password", "secret",
    "authorization", "phone", "api_hash"
};

static bool is_secret_field(const std::string& field_name) {
    std::string lower_field = field_name;
    std::transform(lower_field.begin(), lower_field.end(), lower_field.begin(), ::tolower);

    for (const auto& secret_field : SECRET_FIELDS) {
        if (lower_field.find(secret_field) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ISO 8601 timestamp with microseconds
static std::string get_iso8601_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto microseconds = std::chrono::duration_cast<std::chrono::microseconds>(
        now.time_since_epoch()) % 1000000;

    std::tm tm_buf;
    gmtime_r(&time_t, &tm_buf);

    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%06ldZ",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<long>(microseconds.count()));

    return std::string(buf);
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::debug;
    if (name == "warn" || name == "warning") return LogLevel::warn;
    if (name == "error") return LogLevel::error;
    return LogLevel::info;
}

Observability::Observability(const std::string& instance_id)
    : instance_id_(instance_id),
      metrics_enabled_(FeatureFlags::is_metrics_enabled()) {
    min_level_ = parse_log_level(FeatureFlags::log_level());
    initialize_metrics();
}

Observability::~Observability() {
    stop_metrics_endpoint();
}

void Observability::initialize_metrics() {
    registry_ = std::make_shared<prometheus::Registry>();

    rate_limit_decisions_family_ = &prometheus::BuildCounter()
        .Name("botfleet_rate_limit_decisions_total")
        .Help("Token bucket admission decisions by scope")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    breaker_transitions_family_ = &prometheus::BuildCounter()
        .Name("botfleet_breaker_transitions_total")
        .Help("Circuit breaker state transitions by target state")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    breaker_rejections_family_ = &prometheus::BuildCounter()
        .Name("botfleet_breaker_rejections_total")
        .Help("Calls rejected by an open circuit breaker")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    retries_family_ = &prometheus::BuildCounter()
        .Name("botfleet_retries_total")
        .Help("Retries scheduled by error category")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    calls_family_ = &prometheus::BuildCounter()
        .Name("botfleet_calls_total")
        .Help("Guarded calls by final outcome")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    call_duration_family_ = &prometheus::BuildHistogram()
        .Name("botfleet_call_duration_seconds")
        .Help("Guarded call duration including retries")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    active_sessions_family_ = &prometheus::BuildGauge()
        .Name("botfleet_active_sessions")
        .Help("Currently open tenant sessions")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    session_events_family_ = &prometheus::BuildCounter()
        .Name("botfleet_session_events_total")
        .Help("Session pool events")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);

    tenants_family_ = &prometheus::BuildGauge()
        .Name("botfleet_tenants")
        .Help("Tracked tenants by health status")
        .Labels({{"instance", instance_id_}})
        .Register(*registry_);
}

void Observability::record_rate_limit_decision(const std::string& scope, bool allowed) {
    if (!metrics_enabled_) {
        return;
    }
    rate_limit_decisions_family_->Add({
        {"scope", scope},
        {"decision", allowed ? "allowed" : "rejected"}
    }).Increment();
}

void Observability::record_breaker_transition(const std::string& to_state) {
    if (!metrics_enabled_) {
        return;
    }
    breaker_transitions_family_->Add({{"to", to_state}}).Increment();
}

void Observability::record_breaker_rejection() {
    if (!metrics_enabled_) {
        return;
    }
    breaker_rejections_family_->Add({}).Increment();
}

void Observability::record_retry(const std::string& category) {
    if (!metrics_enabled_) {
        return;
    }
    retries_family_->Add({{"category", category}}).Increment();
}

void Observability::record_call(const std::string& outcome, double duration_seconds) {
    if (!metrics_enabled_) {
        return;
    }
    calls_family_->Add({{"outcome", outcome}}).Increment();
    call_duration_family_->Add({}, prometheus::Histogram::BucketBoundaries{
        0.005, 0.01, 0.05, 0.1, 0.5, 1.0, 2.0, 5.0, 10.0, 30.0, 60.0
    }).Observe(duration_seconds);
}

void Observability::set_active_sessions(int64_t count) {
    if (!metrics_enabled_) {
        return;
    }
    active_sessions_family_->Add({}).Set(static_cast<double>(count));
}

void Observability::record_session_event(const std::string& event) {
    if (!metrics_enabled_) {
        return;
    }
    session_events_family_->Add({{"event", event}}).Increment();
}

void Observability::set_tenant_status_count(const std::string& status, int64_t count) {
    if (!metrics_enabled_) {
        return;
    }
    tenants_family_->Add({{"status", status}}).Set(static_cast<double>(count));
}

std::string Observability::get_metrics_response() {
    if (!metrics_enabled_) {
        return "";
    }
    prometheus::TextSerializer serializer;
    return serializer.Serialize(registry_->Collect());
}

void Observability::log_debug(const std::string& message, const std::string& tenant_id,
                              const LogContext& context) {
    write_log(LogLevel::debug, "DEBUG", message, tenant_id, context);
}

void Observability::log_info(const std::string& message, const std::string& tenant_id,
                             const LogContext& context) {
    write_log(LogLevel::info, "INFO", message, tenant_id, context);
}

void Observability::log_warn(const std::string& message, const std::string& tenant_id,
                             const LogContext& context) {
    write_log(LogLevel::warn, "WARN", message, tenant_id, context);
}

void Observability::log_error(const std::string& message, const std::string& tenant_id,
                              const LogContext& context) {
    write_log(LogLevel::error, "ERROR", message, tenant_id, context);
}

void Observability::set_log_sink(std::function<void(LogLevel, const std::string&)> sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void Observability::write_log(LogLevel level, const std::string& level_name,
                              const std::string& message, const std::string& tenant_id,
                              const LogContext& context) {
    if (level < min_level_.load()) {
        return;
    }
    auto line = format_json_log(level_name, message, tenant_id, context);

    std::lock_guard<std::mutex> lock(sink_mutex_);
    if (sink_) {
        sink_(level, line);
    } else if (level == LogLevel::error) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

std::string Observability::format_json_log(const std::string& level,
                                           const std::string& message,
                                           const std::string& tenant_id,
                                           const LogContext& context) const {
    json log_entry;

    log_entry["timestamp"] = get_iso8601_timestamp();
    log_entry["level"] = level;
    log_entry["component"] = "resilience";
    log_entry["message"] = message;

    if (!tenant_id.empty()) {
        log_entry["tenant_id"] = tenant_id;
    }

    json context_obj;
    context_obj["instance_id"] = instance_id_;
    for (const auto& [key, value] : context) {
        context_obj[key] = is_secret_field(key) ? std::string("[REDACTED]") : value;
    }
    log_entry["context"] = context_obj;

    return log_entry.dump();
}

void Observability::set_health_provider(std::function<std::string()> provider) {
    std::lock_guard<std::mutex> lock(health_provider_mutex_);
    health_provider_ = std::move(provider);
}

std::string Observability::get_health_response() {
    std::lock_guard<std::mutex> lock(health_provider_mutex_);
    if (health_provider_) {
        return health_provider_();
    }
    json health_response;
    health_response["status"] = "unknown";
    health_response["timestamp"] = get_iso8601_timestamp();
    return health_response.dump();
}

void Observability::server_loop(int socket_fd) {
    char buffer[4096];

    while (server_running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(socket_fd, (struct sockaddr*)&client_addr, &client_len);
        if (client_fd < 0) {
            if (server_running_) {
                continue;
            }
            break;
        }

        ssize_t bytes_read = recv(client_fd, buffer, sizeof(buffer) - 1, 0);
        if (bytes_read > 0) {
            buffer[bytes_read] = '\0';
            std::string request(buffer);

            std::string status_line = "HTTP/1.1 200 OK\r\n";
            std::string content_type;
            std::string body;
            if (request.rfind("GET /metrics", 0) == 0) {
                content_type = "text/plain; version=0.0.4";
                body = get_metrics_response();
            } else if (request.rfind("GET /_health", 0) == 0) {
                content_type = "application/json";
                body = get_health_response();
            } else {
                status_line = "HTTP/1.1 404 Not Found\r\n";
                content_type = "text/plain";
                body = "404 Not Found";
            }

            std::string response = status_line +
                "Content-Type: " + content_type + "\r\n"
                "Content-Length: " + std::to_string(body.length()) + "\r\n"
                "\r\n" + body;
            if (send(client_fd, response.c_str(), response.length(), 0) < 0) {
                log_debug("Failed to write endpoint response", "", {{"error", std::strerror(errno)}});
            }
        }

        close(client_fd);
    }
}

void Observability::start_metrics_endpoint(const std::string& address, uint16_t port) {
    if (server_running_) {
        return;
    }

    struct sockaddr_in server_addr;
    memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);

    if (address == "0.0.0.0" || address.empty()) {
        server_addr.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, address.c_str(), &server_addr.sin_addr) != 1) {
        log_error("Invalid metrics endpoint address", "", {{"address", address}});
        return;
    }

    int socket_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (socket_fd < 0) {
        log_error("Failed to create metrics endpoint socket", "", {
            {"error", "socket creation failed"}
        });
        return;
    }

    int opt = 1;
    setsockopt(socket_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(socket_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        log_error("Failed to bind metrics endpoint socket", "", {
            {"error", "bind failed"},
            {"address", address},
            {"port", std::to_string(port)}
        });
        close(socket_fd);
        return;
    }

    if (listen(socket_fd, 5) < 0) {
        log_error("Failed to listen on metrics endpoint socket", "", {
            {"error", "listen failed"}
        });
        close(socket_fd);
        return;
    }

    server_socket_ = socket_fd;
    server_running_ = true;
    server_thread_ = std::thread(&Observability::server_loop, this, socket_fd);

    log_info("Metrics endpoint started", "", {
        {"address", address},
        {"port", std::to_string(port)}
    });
}

void Observability::stop_metrics_endpoint() {
    if (!server_running_) {
        return;
    }

    server_running_ = false;

    // Unblocks accept()
    if (server_socket_ >= 0) {
        shutdown(server_socket_, SHUT_RDWR);
        close(server_socket_);
        server_socket_ = -1;
    }

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    log_info("Metrics endpoint stopped");
}

} // namespace resilience
} // namespace botfleet
