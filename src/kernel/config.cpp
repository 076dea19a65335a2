#include "kernel/config.hpp"
#include "util/env.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <climits>
#include <fstream>

namespace warden::kernel {

using json = nlohmann::json;

namespace {

std::string hostname() {
    char name[HOST_NAME_MAX + 1] = {};
    if (gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') {
        return "localhost";
    }
    return name;
}

void apply_sessions(session::SessionManagerConfig& c, const json& j) {
    c.default_ttl = j.value("default_ttl", c.default_ttl);
    c.max_sessions = j.value("max_sessions", c.max_sessions);
    c.cleanup_interval = j.value("cleanup_interval", c.cleanup_interval);
    c.background_cleanup = j.value("background_cleanup", c.background_cleanup);
}

void apply_balancer(balancer::LoadBalancerConfig& c, const json& j) {
    c.health_check_interval = j.value("health_check_interval", c.health_check_interval);
    c.health_check_timeout = j.value("health_check_timeout", c.health_check_timeout);
    c.geo_routing = j.value("geo_routing", c.geo_routing);
    c.affinity_ttl = j.value("affinity_ttl", c.affinity_ttl);
    c.top_k = j.value("top_k", c.top_k);
    c.max_queue_depth = j.value("max_queue_depth", c.max_queue_depth);
    c.degraded_health_factor = j.value("degraded_health_factor", c.degraded_health_factor);
    c.degraded_utilization = j.value("degraded_utilization", c.degraded_utilization);
    if (j.contains("seed") && !j["seed"].is_null()) {
        c.seed = j["seed"].get<uint32_t>();
    }
    if (j.contains("breaker")) {
        const json& b = j["breaker"];
        c.breaker.failure_threshold = b.value("failure_threshold", c.breaker.failure_threshold);
        c.breaker.recovery_timeout = b.value("recovery_timeout", c.breaker.recovery_timeout);
        c.breaker.half_open_max_calls = b.value("half_open_max_calls", c.breaker.half_open_max_calls);
    }
}

void apply_persistence(persistence::PersistenceConfig& c, const json& j) {
    c.compression_enabled = j.value("compression_enabled", c.compression_enabled);
    c.max_file_size = j.value("max_file_size", c.max_file_size);
    c.snapshot_interval = j.value("snapshot_interval", c.snapshot_interval);
    c.files_ttl = j.value("files_ttl", c.files_ttl);
}

void apply_policy(ServiceConfig& config, const json& j) {
    config.policy_enabled = j.value("enabled", config.policy_enabled);
    policy::PolicyConfig& c = config.policy;
    c.opa_url = j.value("opa_url", c.opa_url);
    if (j.contains("mode")) c.mode = policy::policy_mode_from_string(j["mode"].get<std::string>());
    if (j.contains("fail_mode")) c.fail_open = j["fail_mode"].get<std::string>() == "open";
    c.timeout_ms = j.value("timeout_ms", c.timeout_ms);
}

balancer::PoolEndpoint parse_pool(const json& j) {
    balancer::PoolEndpoint pool;
    pool.name = j.at("name").get<std::string>();
    pool.url = j.at("url").get<std::string>();
    pool.region = j.value("region", "");
    pool.weight = j.value("weight", pool.weight);
    pool.priority = j.value("priority", pool.priority);
    pool.max_sessions = j.value("max_sessions", pool.max_sessions);
    return pool;
}

} // namespace

void apply_json(ServiceConfig& config, const json& doc) {
    if (!doc.is_object()) {
        throw ConfigError("configuration must be a JSON object");
    }
    try {
        config.store_url = doc.value("store_url", config.store_url);
        config.pod_name = doc.value("pod_name", config.pod_name);
        config.pool_name = doc.value("pool_name", config.pool_name);
        config.log_level = doc.value("log_level", config.log_level);
        config.templates_file = doc.value("templates_file", config.templates_file);
        config.docker_binary = doc.value("docker_binary", config.docker_binary);

        if (doc.contains("sessions")) apply_sessions(config.sessions, doc["sessions"]);
        if (doc.contains("balancer")) apply_balancer(config.balancer, doc["balancer"]);
        if (doc.contains("persistence")) apply_persistence(config.persistence, doc["persistence"]);
        if (doc.contains("policy")) apply_policy(config, doc["policy"]);

        if (doc.contains("pools")) {
            config.pools.clear();
            for (const auto& entry : doc["pools"]) {
                config.pools.push_back(parse_pool(entry));
            }
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what());
    }
}

void apply_env(ServiceConfig& config) {
    if (auto v = util::env_string("WARDEN_REDIS_URL")) config.store_url = *v;
    if (auto v = util::env_string("WARDEN_POD_NAME")) config.pod_name = *v;
    if (auto v = util::env_string("WARDEN_POOL_NAME")) config.pool_name = *v;
    if (auto v = util::env_string("WARDEN_LOG_LEVEL")) config.log_level = *v;
    if (auto v = util::env_string("WARDEN_TEMPLATES")) config.templates_file = *v;
    if (auto v = util::env_int("WARDEN_MAX_SESSIONS")) {
        if (*v > 0) {
            config.sessions.max_sessions = static_cast<size_t>(*v);
        } else {
            spdlog::warn("Ignoring WARDEN_MAX_SESSIONS={}", *v);
        }
    }

    // An explicit policy endpoint turns evaluation on
    if (util::env_string("OPA_URL")) {
        config.policy_enabled = true;
    }
    policy::PolicyConfig from_env = policy::PolicyConfig::from_env();
    if (util::env_string("OPA_URL")) config.policy.opa_url = from_env.opa_url;
    if (util::env_string("POLICY_MODE")) config.policy.mode = from_env.mode;
    if (util::env_string("POLICY_FAIL_MODE")) config.policy.fail_open = from_env.fail_open;
    if (util::env_int("POLICY_TIMEOUT_MS")) config.policy.timeout_ms = from_env.timeout_ms;
}

ServiceConfig load_service_config(const std::optional<std::string>& path) {
    util::load_dotenv();

    ServiceConfig config;

    std::optional<std::string> file = path;
    if (!file) {
        file = util::env_string("WARDEN_CONFIG");
    }
    if (file) {
        std::ifstream in(*file);
        if (!in) {
            throw ConfigError("cannot open configuration file " + *file);
        }
        json doc;
        try {
            doc = json::parse(in);
        } catch (const json::parse_error& e) {
            throw ConfigError("cannot parse " + *file + ": " + e.what());
        }
        apply_json(config, doc);
    }

    apply_env(config);

    if (config.pod_name.empty()) {
        config.pod_name = hostname();
    }
    return config;
}

} // namespace warden::kernel
