#include "policy/policy_client.hpp"
#include "net/http_client.hpp"
#include "util/env.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace warden::policy {

using json = nlohmann::json;

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Python-style truthiness for loosely typed policy documents
bool truthy(const json& value) {
    if (value.is_boolean()) return value.get<bool>();
    if (value.is_number_integer()) return value.get<int64_t>() != 0;
    if (value.is_number()) return value.get<double>() != 0.0;
    if (value.is_string()) return !value.get<std::string>().empty();
    if (value.is_array() || value.is_object()) return !value.empty();
    return false;
}

std::string as_text(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

json PolicyDecision::to_json() const {
    json j = {
        {"policy_id", policy_id},
        {"policy_version", policy_version},
        {"decision", decision},
        {"allow", allow},
        {"requires_approval", requires_approval},
        {"risk_score", risk_score},
        {"reasons", reasons}
    };
    j["error"] = error ? json(*error) : json(nullptr);
    return j;
}

PolicyConfig PolicyConfig::from_env() {
    PolicyConfig config;
    if (auto url = util::env_string("OPA_URL")) config.opa_url = *url;
    if (auto mode = util::env_string("POLICY_MODE")) config.mode = policy_mode_from_string(lower(*mode));
    if (auto fail = util::env_string("POLICY_FAIL_MODE")) config.fail_open = lower(*fail) == "open";
    if (auto timeout = util::env_int("POLICY_TIMEOUT_MS")) config.timeout_ms = static_cast<int>(*timeout);
    return config;
}

OpaPolicyClient::OpaPolicyClient(PolicyConfig config)
    : config_(std::move(config)) {
    std::string base = config_.opa_url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    endpoint_ = base + "/v1/data/ai/policy/result";
}

PolicyDecision OpaPolicyClient::evaluate(const PolicyRequest& request) {
    json body = {{"input", request.to_json()}};
    net::HttpResponse response = net::http_request(
        "POST", endpoint_, body.dump(), {{"Content-Type", "application/json"}}, config_.timeout_ms);

    if (!response.ok) {
        spdlog::warn("Policy engine unreachable: {}", response.error);
        return fallback(response.error);
    }
    if (response.status < 200 || response.status >= 300) {
        spdlog::warn("Policy engine returned HTTP {}", response.status);
        return fallback("HTTP Error " + std::to_string(response.status));
    }

    try {
        auto decision = normalize(json::parse(response.body));
        if (!decision) {
            return fallback("invalid_policy_response");
        }
        spdlog::debug("Policy {} for {} {}: {}", decision->policy_id, request.action,
                      request.resource, decision->decision);
        return *decision;
    } catch (const json::exception& e) {
        spdlog::warn("Unreadable policy response: {}", e.what());
        return fallback(e.what());
    }
}

std::optional<PolicyDecision> OpaPolicyClient::normalize(const json& raw) {
    if (!raw.is_object()) {
        return std::nullopt;
    }
    json result = raw.value("result", json::object());
    if (!result.is_object()) {
        return std::nullopt;
    }

    PolicyDecision decision;
    decision.decision = result.contains("decision") ? as_text(result["decision"]) : "deny";
    decision.allow = result.contains("allow") ? truthy(result["allow"]) : decision.decision == "allow";
    decision.requires_approval = result.contains("requires_approval")
        ? truthy(result["requires_approval"])
        : decision.decision == "requires_approval";
    decision.policy_id = result.contains("policy_id") ? as_text(result["policy_id"]) : "unknown";
    decision.policy_version = result.contains("policy_version") ? as_text(result["policy_version"]) : "unknown";

    const json& risk = result.contains("risk_score") ? result["risk_score"] : json(0);
    if (risk.is_number()) {
        decision.risk_score = static_cast<int>(risk.get<double>());
    } else if (risk.is_string()) {
        decision.risk_score = std::atoi(risk.get<std::string>().c_str());
    }

    if (result.contains("reasons")) {
        const json& reasons = result["reasons"];
        if (reasons.is_array()) {
            for (const auto& reason : reasons) {
                decision.reasons.push_back(as_text(reason));
            }
        } else {
            decision.reasons.push_back(as_text(reasons));
        }
    }
    return decision;
}

PolicyDecision OpaPolicyClient::fallback(const std::string& error) const {
    PolicyDecision decision;
    decision.policy_id = "fallback";
    decision.policy_version = "fallback";
    decision.decision = config_.fail_open ? "allow" : "deny";
    decision.allow = config_.fail_open;
    decision.requires_approval = !config_.fail_open;
    decision.risk_score = 0;
    decision.reasons = {"policy_unavailable"};
    decision.error = error;
    return decision;
}

bool OpaPolicyClient::enforce(const PolicyDecision& decision) const {
    if (config_.mode != PolicyMode::ENFORCE) {
        return true;
    }
    return decision.allow;
}

} // namespace warden::policy
