#include "balancer/pool_endpoint.hpp"
#include <spdlog/spdlog.h>

namespace warden::balancer {

using json = nlohmann::json;

namespace {

bool newer_schema(const json& j) {
    return j.value("schema_version", POOL_SCHEMA_VERSION) > POOL_SCHEMA_VERSION;
}

} // namespace

json PoolEndpoint::to_json() const {
    return {
        {"schema_version", POOL_SCHEMA_VERSION},
        {"name", name},
        {"region", region},
        {"url", url},
        {"weight", weight},
        {"priority", priority},
        {"max_sessions", max_sessions},
        {"current_sessions", current_sessions},
        {"status", pool_status_to_string(status)},
        {"last_health_check", last_health_check},
        {"response_time_ms", response_time_ms},
        {"error_rate", error_rate},
        {"cpu_utilization", cpu_utilization},
        {"memory_utilization", memory_utilization},
        {"queue_depth", queue_depth}
    };
}

std::optional<PoolEndpoint> PoolEndpoint::from_json(const json& j) {
    if (!j.is_object() || newer_schema(j)) {
        return std::nullopt;
    }
    try {
        PoolEndpoint pool;
        pool.name = j.at("name").get<std::string>();
        pool.region = j.value("region", "");
        pool.url = j.at("url").get<std::string>();
        pool.weight = j.value("weight", 100);
        pool.priority = j.value("priority", 1);
        pool.max_sessions = j.value("max_sessions", 100);
        pool.current_sessions = j.value("current_sessions", 0);
        pool.status = pool_status_from_string(j.value("status", "healthy")).value_or(PoolStatus::HEALTHY);
        pool.last_health_check = j.value("last_health_check", 0.0);
        pool.response_time_ms = j.value("response_time_ms", 0.0);
        pool.error_rate = j.value("error_rate", 0.0);
        pool.cpu_utilization = j.value("cpu_utilization", 0.0);
        pool.memory_utilization = j.value("memory_utilization", 0.0);
        pool.queue_depth = j.value("queue_depth", 0);
        return pool;
    } catch (const json::exception& e) {
        spdlog::error("Malformed pool record: {}", e.what());
        return std::nullopt;
    }
}

json SessionAffinity::to_json() const {
    return {
        {"schema_version", POOL_SCHEMA_VERSION},
        {"session_id", session_id},
        {"pool_name", pool_name},
        {"created_at", created_at},
        {"ttl", ttl}
    };
}

std::optional<SessionAffinity> SessionAffinity::from_json(const json& j) {
    if (!j.is_object() || newer_schema(j)) {
        return std::nullopt;
    }
    try {
        SessionAffinity affinity;
        affinity.session_id = j.at("session_id").get<std::string>();
        affinity.pool_name = j.at("pool_name").get<std::string>();
        affinity.created_at = j.at("created_at").get<double>();
        affinity.ttl = j.value("ttl", 3600.0);
        return affinity;
    } catch (const json::exception& e) {
        spdlog::error("Malformed affinity record: {}", e.what());
        return std::nullopt;
    }
}

} // namespace warden::balancer
