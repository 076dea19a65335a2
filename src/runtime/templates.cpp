#include "runtime/templates.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <regex>

using json = nlohmann::json;

namespace warden::runtime {

namespace {

std::vector<SandboxTemplate> builtin_templates() {
    std::vector<SandboxTemplate> list;

    SandboxTemplate def;
    def.name = "default";
    def.description = "Default Python sandbox with essential packages";
    def.base_image = "executor-sandbox:latest";
    list.push_back(def);

    SandboxTemplate data;
    data.name = "python-data";
    data.description = "Python data science environment";
    data.base_image = "executor-sandbox:latest";
    data.packages = {"pandas==2.2.0", "numpy==1.26.4", "matplotlib==3.8.3",
                     "seaborn==0.13.2", "scipy==1.12.0", "scikit-learn==1.4.0",
                     "openpyxl==3.1.2", "xlrd==2.0.1"};
    data.environment_variables = {{"MPLBACKEND", "Agg"}, {"PYTHONDONTWRITEBYTECODE", "1"}};
    data.memory_limit = "1g";
    data.timeout = 60;
    list.push_back(data);

    SandboxTemplate ml;
    ml.name = "python-ml";
    ml.description = "Python machine learning environment";
    ml.base_image = "executor-sandbox:latest";
    ml.packages = {"torch==2.2.0", "transformers==4.37.2", "datasets==2.16.1",
                   "numpy==1.26.4", "pandas==2.2.0", "scikit-learn==1.4.0"};
    ml.environment_variables = {{"MPLBACKEND", "Agg"},
                                {"TRANSFORMERS_CACHE", "/tmp/transformers_cache"},
                                {"HF_HOME", "/tmp/huggingface"}};
    ml.memory_limit = "2g";
    ml.cpu_quota = 200000;
    ml.timeout = 120;
    list.push_back(ml);

    SandboxTemplate web;
    web.name = "python-web";
    web.description = "Web scraping and HTTP requests";
    web.base_image = "executor-sandbox:latest";
    web.packages = {"requests==2.31.0", "beautifulsoup4==4.12.3", "lxml==5.1.0"};
    web.timeout = 60;
    web.network_enabled = true;
    list.push_back(web);

    SandboxTemplate node;
    node.name = "node-basic";
    node.description = "Node.js basic environment";
    node.base_image = "node:18-slim";
    node.environment_variables = {{"NODE_ENV", "production"},
                                  {"npm_config_cache", "/tmp/npm-cache"}};
    list.push_back(node);

    SandboxTemplate minimal;
    minimal.name = "minimal";
    minimal.description = "Minimal environment with no extra packages";
    minimal.base_image = "python:3.11-slim";
    minimal.memory_limit = "256m";
    minimal.cpu_quota = 50000;
    list.push_back(minimal);

    SandboxTemplate go;
    go.name = "go-basic";
    go.description = "Go programming environment";
    go.base_image = "golang:1.21-alpine";
    go.environment_variables = {{"GOPATH", "/go"}, {"GOCACHE", "/tmp/go-cache"}};
    list.push_back(go);

    SandboxTemplate rust;
    rust.name = "rust-basic";
    rust.description = "Rust programming environment";
    rust.base_image = "rust:1.75-slim";
    rust.environment_variables = {{"CARGO_HOME", "/tmp/cargo"}, {"RUSTUP_HOME", "/tmp/rustup"}};
    rust.memory_limit = "1g";
    rust.timeout = 60;
    list.push_back(rust);

    SandboxTemplate java;
    java.name = "java-basic";
    java.description = "Java programming environment";
    java.base_image = "openjdk:21-slim";
    java.environment_variables = {{"JAVA_HOME", "/usr/local/openjdk-21"}};
    java.memory_limit = "1g";
    java.timeout = 45;
    list.push_back(java);

    return list;
}

} // namespace

json SandboxTemplate::to_json() const {
    return {
        {"name", name},
        {"description", description},
        {"base_image", base_image},
        {"packages", packages},
        {"environment_variables", environment_variables},
        {"setup_commands", setup_commands},
        {"memory_limit", memory_limit},
        {"cpu_quota", cpu_quota},
        {"timeout", timeout},
        {"network_enabled", network_enabled}
    };
}

SandboxTemplate SandboxTemplate::from_json(const json& j) {
    SandboxTemplate t;
    t.name = j.at("name").get<std::string>();
    t.base_image = j.at("base_image").get<std::string>();
    t.description = j.value("description", "");
    t.packages = j.value("packages", std::vector<std::string>{});
    t.environment_variables = j.value("environment_variables", std::map<std::string, std::string>{});
    t.setup_commands = j.value("setup_commands", std::vector<std::string>{});
    t.memory_limit = j.value("memory_limit", t.memory_limit);
    t.cpu_quota = j.value("cpu_quota", t.cpu_quota);
    t.timeout = j.value("timeout", t.timeout);
    t.network_enabled = j.value("network_enabled", t.network_enabled);
    return t;
}

std::optional<uint64_t> parse_memory_limit(const std::string& limit) {
    static const std::regex pattern("^(\\d+)([mgMG])$");
    std::smatch m;
    if (!std::regex_match(limit, m, pattern)) {
        return std::nullopt;
    }
    uint64_t value = std::stoull(m[1].str());
    char unit = m[2].str()[0];
    uint64_t scale = (unit == 'g' || unit == 'G') ? 1024ULL * 1024 * 1024 : 1024ULL * 1024;
    return value * scale;
}

// ============================================================================
// TemplateRegistry Implementation
// ============================================================================

TemplateRegistry::TemplateRegistry() {
    for (auto& t : builtin_templates()) {
        builtin_names_.push_back(t.name);
        templates_[t.name] = std::move(t);
    }
    spdlog::debug("Loaded {} built-in templates", builtin_names_.size());
}

size_t TemplateRegistry::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Template file not found: {}", path);
        return 0;
    }

    json data;
    try {
        data = json::parse(file);
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to parse template file {}: {}", path, e.what());
        return 0;
    }
    if (!data.is_object()) {
        spdlog::error("Template file {} must contain an object", path);
        return 0;
    }

    size_t loaded = 0;
    for (auto it = data.begin(); it != data.end(); ++it) {
        try {
            json entry = it.value();
            if (!entry.contains("name")) {
                entry["name"] = it.key();
            }
            if (register_template(SandboxTemplate::from_json(entry))) {
                loaded++;
            }
        } catch (const json::exception& e) {
            spdlog::error("Skipping template {}: {}", it.key(), e.what());
        }
    }
    spdlog::info("Loaded {} custom templates from {}", loaded, path);
    return loaded;
}

std::vector<std::string> TemplateRegistry::validate(const SandboxTemplate& tmpl) {
    static const std::regex memory_pattern("^\\d+[mgMG]$");
    std::vector<std::string> errors;

    if (tmpl.name.empty()) {
        errors.push_back("Template name is required");
    }
    if (tmpl.base_image.empty()) {
        errors.push_back("Base image is required");
    }
    if (!std::regex_match(tmpl.memory_limit, memory_pattern)) {
        errors.push_back("Invalid memory limit format: " + tmpl.memory_limit);
    }
    if (tmpl.timeout < 1 || tmpl.timeout > 3600) {
        errors.push_back("Timeout must be between 1 and 3600 seconds");
    }
    if (tmpl.cpu_quota <= 0) {
        errors.push_back("CPU quota must be positive");
    }
    return errors;
}

bool TemplateRegistry::register_template(const SandboxTemplate& tmpl) {
    auto errors = validate(tmpl);
    if (!errors.empty()) {
        spdlog::warn("Rejected template '{}': {}", tmpl.name, errors.front());
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (is_builtin_locked(tmpl.name)) {
        spdlog::info("Template {} overrides a built-in", tmpl.name);
    }
    templates_[tmpl.name] = tmpl;
    spdlog::info("Registered template: {}", tmpl.name);
    return true;
}

bool TemplateRegistry::unregister_template(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (templates_.find(name) == templates_.end()) {
        return false;
    }
    if (is_builtin_locked(name)) {
        spdlog::warn("Cannot unregister built-in template: {}", name);
        return false;
    }
    templates_.erase(name);
    spdlog::info("Unregistered template: {}", name);
    return true;
}

bool TemplateRegistry::is_builtin(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_builtin_locked(name);
}

bool TemplateRegistry::is_builtin_locked(const std::string& name) const {
    return std::find(builtin_names_.begin(), builtin_names_.end(), name) != builtin_names_.end();
}

std::optional<SandboxTemplate> TemplateRegistry::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = templates_.find(name);
    if (it == templates_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> TemplateRegistry::names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> result;
    for (const auto& [name, _] : templates_) {
        result.push_back(name);
    }
    return result;
}

json TemplateRegistry::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json result = json::array();
    for (const auto& [name, t] : templates_) {
        result.push_back({
            {"name", t.name},
            {"description", t.description},
            {"base_image", t.base_image},
            {"memory_limit", t.memory_limit},
            {"cpu_quota", t.cpu_quota},
            {"timeout", t.timeout},
            {"network_enabled", t.network_enabled},
            {"package_count", t.packages.size()}
        });
    }
    return result;
}

SandboxConfig TemplateRegistry::sandbox_config(const std::string& name) const {
    auto tmpl = get(name);
    if (!tmpl) {
        spdlog::warn("Template not found: {}, using default", name);
        tmpl = get(DEFAULT_TEMPLATE);
    }

    SandboxConfig config;
    if (tmpl) {
        config.image = tmpl->base_image;
        config.memory_limit = tmpl->memory_limit;
        config.cpu_quota = tmpl->cpu_quota;
        config.timeout_seconds = tmpl->timeout;
        config.network_enabled = tmpl->network_enabled;
        for (const auto& [key, value] : tmpl->environment_variables) {
            config.environment[key] = value;
        }
        config.setup_commands = tmpl->setup_commands;
    }
    return config;
}

} // namespace warden::runtime
