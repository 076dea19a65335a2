/**
 * Sandbox environment templates
 *
 * Named, pre-configured environments (image, limits, environment
 * variables) that sessions are created from. Built-ins are always
 * present; custom templates can be loaded from a JSON file.
 */
#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/sandbox.hpp"

namespace warden::runtime {

struct SandboxTemplate {
    std::string name;
    std::string description;
    std::string base_image;
    std::vector<std::string> packages;              // pre-installed in the image
    std::map<std::string, std::string> environment_variables;
    std::vector<std::string> setup_commands;        // run once after start
    std::string memory_limit = "512m";
    int64_t cpu_quota = 100000;
    int timeout = 30;
    bool network_enabled = false;

    nlohmann::json to_json() const;
    // Throws nlohmann::json::exception on missing name/base_image
    static SandboxTemplate from_json(const nlohmann::json& j);
};

// "512m" / "2G" -> bytes; nullopt if malformed
std::optional<uint64_t> parse_memory_limit(const std::string& limit);

class TemplateRegistry {
public:
    static constexpr const char* DEFAULT_TEMPLATE = "default";

    TemplateRegistry();

    // Non-copyable
    TemplateRegistry(const TemplateRegistry&) = delete;
    TemplateRegistry& operator=(const TemplateRegistry&) = delete;

    // Load {"name": {...}, ...}; invalid entries are skipped with a log.
    // Returns the number of templates loaded.
    size_t load_file(const std::string& path);

    // Validation problems, empty if the template is usable
    static std::vector<std::string> validate(const SandboxTemplate& tmpl);

    bool register_template(const SandboxTemplate& tmpl);
    bool unregister_template(const std::string& name);
    bool is_builtin(const std::string& name) const;

    std::optional<SandboxTemplate> get(const std::string& name) const;
    std::vector<std::string> names() const;
    nlohmann::json list() const;

    // Sandbox parameters for a template; unknown names use "default"
    SandboxConfig sandbox_config(const std::string& name) const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, SandboxTemplate> templates_;
    std::vector<std::string> builtin_names_;

    bool is_builtin_locked(const std::string& name) const;
};

} // namespace warden::runtime
