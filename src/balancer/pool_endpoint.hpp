/**
 * Pool records shared with the durable store
 *
 * PoolEndpoint and SessionAffinity are serialized as JSON carrying
 * schema_version; from_json() rejects records written by a newer schema.
 */
#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace warden::balancer {

constexpr int POOL_SCHEMA_VERSION = 1;

enum class PoolStatus {
    HEALTHY,
    DEGRADED,
    UNHEALTHY,
    OFFLINE
};

inline const char* pool_status_to_string(PoolStatus status) {
    switch (status) {
        case PoolStatus::HEALTHY: return "healthy";
        case PoolStatus::DEGRADED: return "degraded";
        case PoolStatus::UNHEALTHY: return "unhealthy";
        case PoolStatus::OFFLINE: return "offline";
        default: return "unknown";
    }
}

inline std::optional<PoolStatus> pool_status_from_string(const std::string& s) {
    if (s == "healthy") return PoolStatus::HEALTHY;
    if (s == "degraded") return PoolStatus::DEGRADED;
    if (s == "unhealthy") return PoolStatus::UNHEALTHY;
    if (s == "offline") return PoolStatus::OFFLINE;
    return std::nullopt;
}

struct PoolEndpoint {
    std::string name;
    std::string region;
    std::string url;
    int weight = 100;
    int priority = 1;           // lower wins
    int max_sessions = 100;
    int current_sessions = 0;
    PoolStatus status = PoolStatus::HEALTHY;
    double last_health_check = 0.0;
    double response_time_ms = 0.0;
    double error_rate = 0.0;
    double cpu_utilization = 0.0;
    double memory_utilization = 0.0;
    int queue_depth = 0;

    double utilization() const {
        return max_sessions > 0 ? static_cast<double>(current_sessions) / max_sessions : 1.0;
    }

    nlohmann::json to_json() const;
    // nullopt for malformed records or a newer schema
    static std::optional<PoolEndpoint> from_json(const nlohmann::json& j);
};

// Sticky binding of a session to a pool
struct SessionAffinity {
    std::string session_id;
    std::string pool_name;
    double created_at = 0.0;    // wall clock seconds
    double ttl = 3600.0;

    bool is_expired(double now) const { return now - created_at > ttl; }

    nlohmann::json to_json() const;
    static std::optional<SessionAffinity> from_json(const nlohmann::json& j);
};

} // namespace warden::balancer
