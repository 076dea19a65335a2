#include "persistence/session_state.hpp"
#include <spdlog/spdlog.h>

namespace warden::persistence {

using json = nlohmann::json;

json SessionState::to_json() const {
    return {
        {"schema_version", SESSION_SCHEMA_VERSION},
        {"session_id", session_id},
        {"pool_name", pool_name},
        {"pod_name", pod_name},
        {"template", template_name},
        {"created_at", created_at},
        {"last_activity", last_activity},
        {"expires_at", expires_at},
        {"environment", environment},
        {"execution_history", execution_history},
        {"installed_packages", installed_packages},
        {"metadata", metadata}
    };
}

std::optional<SessionState> SessionState::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    if (j.value("schema_version", SESSION_SCHEMA_VERSION) > SESSION_SCHEMA_VERSION) {
        spdlog::warn("Skipping session record with schema version {}", j.value("schema_version", 0));
        return std::nullopt;
    }

    try {
        SessionState state;
        state.session_id = j.at("session_id").get<std::string>();
        state.pool_name = j.at("pool_name").get<std::string>();
        state.pod_name = j.at("pod_name").get<std::string>();
        state.template_name = j.at("template").get<std::string>();
        state.created_at = j.at("created_at").get<std::string>();
        state.last_activity = j.at("last_activity").get<std::string>();
        state.expires_at = j.at("expires_at").get<std::string>();
        state.environment = j.value("environment", std::map<std::string, std::string>{});
        state.execution_history = j.value("execution_history", json::array());
        state.installed_packages = j.value("installed_packages", std::vector<std::string>{});
        state.metadata = j.value("metadata", std::map<std::string, std::string>{});
        return state;
    } catch (const json::exception& e) {
        spdlog::error("Malformed session record: {}", e.what());
        return std::nullopt;
    }
}

void SessionState::apply_updates(const json& updates) {
    if (!updates.is_object()) {
        return;
    }
    // Parse everything first so a bad field leaves the state untouched
    SessionState next = *this;
    for (const auto& [key, value] : updates.items()) {
        if (key == "pool_name") next.pool_name = value.get<std::string>();
        else if (key == "pod_name") next.pod_name = value.get<std::string>();
        else if (key == "template") next.template_name = value.get<std::string>();
        else if (key == "expires_at") next.expires_at = value.get<std::string>();
        else if (key == "environment") next.environment = value.get<std::map<std::string, std::string>>();
        else if (key == "execution_history") next.execution_history = value;
        else if (key == "installed_packages") next.installed_packages = value.get<std::vector<std::string>>();
        else if (key == "metadata") next.metadata = value.get<std::map<std::string, std::string>>();
    }
    *this = std::move(next);
}

} // namespace warden::persistence
