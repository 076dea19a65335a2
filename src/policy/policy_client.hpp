/**
 * OPA policy client
 *
 * POSTs {"input": request} to <opa_url>/v1/data/ai/policy/result and
 * normalizes the "result" object. Any transport, status or parse failure
 * yields the configured fail-open or fail-closed fallback decision.
 */
#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "policy/policy_engine.hpp"

namespace warden::policy {

struct PolicyConfig {
    std::string opa_url = "http://opa:8181";
    PolicyMode mode = PolicyMode::SHADOW;
    bool fail_open = true;
    int timeout_ms = 800;

    // OPA_URL, POLICY_MODE, POLICY_FAIL_MODE, POLICY_TIMEOUT_MS
    static PolicyConfig from_env();
};

class OpaPolicyClient : public PolicyEngine {
public:
    explicit OpaPolicyClient(PolicyConfig config);

    PolicyDecision evaluate(const PolicyRequest& request) override;
    bool enforce(const PolicyDecision& decision) const override;

    const std::string& endpoint() const { return endpoint_; }
    const PolicyConfig& config() const { return config_; }

    // Normalize an OPA response document; nullopt when "result" is not an object
    static std::optional<PolicyDecision> normalize(const nlohmann::json& raw);
    PolicyDecision fallback(const std::string& error) const;

private:
    PolicyConfig config_;
    std::string endpoint_;
};

} // namespace warden::policy
