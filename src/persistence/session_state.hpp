/**
 * Durable session snapshot
 *
 * The scalar record is stored as JSON under executor:session:<id>; files
 * live in their own hash and never appear in to_json().
 */
#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::persistence {

constexpr int SESSION_SCHEMA_VERSION = 1;

struct SessionState {
    std::string session_id;
    std::string pool_name;
    std::string pod_name;
    std::string template_name = "default";
    std::string created_at;         // ISO-8601, UTC
    std::string last_activity;
    std::string expires_at;

    std::map<std::string, std::string> files;   // path -> content
    std::map<std::string, std::string> environment;
    nlohmann::json execution_history = nlohmann::json::array();
    std::vector<std::string> installed_packages;
    std::map<std::string, std::string> metadata;

    nlohmann::json to_json() const;
    // nullopt for malformed records or a newer schema
    static std::optional<SessionState> from_json(const nlohmann::json& j);

    // Apply the recognised fields of updates; throws nlohmann::json::exception
    // on a value of the wrong type
    void apply_updates(const nlohmann::json& updates);
};

} // namespace warden::persistence
