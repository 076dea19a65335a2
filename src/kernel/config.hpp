/**
 * Service configuration
 *
 * Built-in defaults, overridden by a JSON file, overridden by the
 * environment. A .env file is loaded before the environment is read.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "balancer/load_balancer.hpp"
#include "balancer/pool_endpoint.hpp"
#include "persistence/persistence_manager.hpp"
#include "policy/policy_client.hpp"
#include "session/session_manager.hpp"

namespace warden::kernel {

struct ServiceConfig {
    std::string store_url = "redis://localhost:6379";  // or memory://
    std::string pod_name;                               // defaults to the hostname
    std::string pool_name = "default";
    std::string log_level = "info";
    std::string templates_file;
    std::string docker_binary = "docker";

    session::SessionManagerConfig sessions;
    balancer::LoadBalancerConfig balancer;
    std::vector<balancer::PoolEndpoint> pools;   // registered at startup
    persistence::PersistenceConfig persistence;

    bool policy_enabled = false;
    policy::PolicyConfig policy;
};

// Throws ConfigError on a malformed document
void apply_json(ServiceConfig& config, const nlohmann::json& doc);

// WARDEN_* and policy variables
void apply_env(ServiceConfig& config);

// Defaults, then path (or WARDEN_CONFIG) when given, then the
// environment. Throws ConfigError if the file cannot be read or parsed.
ServiceConfig load_service_config(const std::optional<std::string>& path);

} // namespace warden::kernel
