/**
 * Policy decision contract
 *
 * Components that enforce authorization submit a request and act on the
 * normalized decision. In shadow mode decisions are logged but never
 * block; in enforce mode a decision that does not allow blocks.
 */
#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace warden::policy {

enum class PolicyMode {
    SHADOW,
    ENFORCE
};

inline std::string policy_mode_to_string(PolicyMode mode) {
    return mode == PolicyMode::ENFORCE ? "enforce" : "shadow";
}

inline PolicyMode policy_mode_from_string(const std::string& str) {
    return str == "enforce" ? PolicyMode::ENFORCE : PolicyMode::SHADOW;
}

struct PolicyRequest {
    std::string subject;
    std::string resource;
    std::string action;
    nlohmann::json context = nlohmann::json::object();

    nlohmann::json to_json() const {
        return {{"subject", subject}, {"resource", resource},
                {"action", action}, {"context", context}};
    }
};

struct PolicyDecision {
    std::string policy_id = "unknown";
    std::string policy_version = "unknown";
    std::string decision = "deny";     // allow | deny | requires_approval
    bool allow = false;
    bool requires_approval = false;
    int risk_score = 0;
    std::vector<std::string> reasons;
    std::optional<std::string> error;

    nlohmann::json to_json() const;
};

class PolicyEngine {
public:
    virtual ~PolicyEngine() = default;

    // Never blocks past the engine's configured timeout
    virtual PolicyDecision evaluate(const PolicyRequest& request) = 0;

    // True if the request may proceed
    virtual bool enforce(const PolicyDecision& decision) const = 0;
};

} // namespace warden::policy
