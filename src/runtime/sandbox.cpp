#include "runtime/sandbox.hpp"
#include "runtime/tar_archive.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"
#include "util/utf8.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <sstream>

using json = nlohmann::json;

namespace warden::runtime {

namespace {

constexpr const char* WORKSPACE = "/workspace";
constexpr const char* SANDBOX_USER = "sandbox";

std::string normalize_language(const std::string& language) {
    size_t start = language.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = language.find_last_not_of(" \t\r\n");
    std::string lang = language.substr(start, end - start + 1);
    std::transform(lang.begin(), lang.end(), lang.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lang;
}

double elapsed_since(std::chrono::steady_clock::time_point start) {
    double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    return std::round(secs * 1000.0) / 1000.0;
}

std::string trim_output(const std::string& text) {
    std::string clean = util::sanitize_utf8(text);
    size_t end = clean.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : clean.substr(0, end + 1);
}

FileOperation failed_operation(const std::string& path, std::string error) {
    FileOperation op;
    op.path = path;
    op.error = std::move(error);
    return op;
}

} // namespace

LaunchPlan launch_plan_for(const std::string& language) {
    std::string lang = normalize_language(language);

    if (lang == "python") {
        return {{"python", "main.py"}, "main.py"};
    }
    if (lang == "node" || lang == "javascript" || lang == "js") {
        return {{"node", "main.js"}, "main.js"};
    }
    if (lang == "r" || lang == "rscript") {
        return {{"Rscript", "main.R"}, "main.R"};
    }
    if (lang == "bash" || lang == "sh" || lang == "shell") {
        return {{"sh", "main.sh"}, "main.sh"};
    }
    if (lang == "go") {
        return {{"sh", "-lc", "go run main.go"}, "main.go"};
    }
    if (lang == "rust" || lang == "rs") {
        return {{"sh", "-lc", "rustc main.rs -O -o main && ./main"}, "main.rs"};
    }
    if (lang == "java") {
        return {{"sh", "-lc", "javac Main.java && java Main"}, "Main.java"};
    }
    if (lang == "cpp" || lang == "c++") {
        return {{"sh", "-lc", "g++ main.cpp -O2 -o main && ./main"}, "main.cpp"};
    }
    throw UnsupportedLanguageError("Unsupported language: " + language);
}

json ExecutionResult::to_json() const {
    json j = {
        {"status", status},
        {"exit_code", exit_code},
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"execution_time", execution_time},
        {"container_id", container_id},
        {"language", language}
    };
    if (!error.empty()) {
        j["error"] = error;
        j["error_kind"] = error_kind;
    }
    return j;
}

ExecutionResult ExecutionResult::failure(const std::string& kind, const std::string& message,
                                         const std::string& language) {
    ExecutionResult r;
    r.status = "error";
    r.exit_code = -1;
    r.error_kind = kind;
    r.error = message;
    r.stderr_text = message;
    r.language = language;
    return r;
}

json FileResult::to_json() const {
    json j = {{"path", path}, {"is_binary", is_binary}, {"size", content.size()}};
    if (is_binary) {
        j["content"] = util::base64_encode(content);
        j["encoding"] = "base64";
    } else {
        j["content"] = content;
        j["encoding"] = "utf-8";
    }
    return j;
}

json FileOperation::to_json() const {
    json j = {{"success", success}, {"path", path}};
    if (!success) {
        j["error"] = error;
    }
    return j;
}

json DirectoryEntry::to_json() const {
    return {
        {"name", name},
        {"type", type},
        {"size", size},
        {"permissions", permissions},
        {"owner", owner},
        {"group", group}
    };
}

json BatchWriteResult::to_json() const {
    json entries = json::object();
    for (const auto& [path, op] : results) {
        entries[path] = op.to_json();
    }
    json j = {
        {"success", success},
        {"results", entries},
        {"total_files", total_files},
        {"successful", successful}
    };
    if (!error.empty()) {
        j["error"] = error;
    }
    return j;
}

std::vector<DirectoryEntry> parse_directory_listing(const std::string& listing,
                                                    bool include_hidden) {
    std::vector<DirectoryEntry> entries;
    std::istringstream lines(listing);
    std::string line;
    while (std::getline(lines, line)) {
        if (line.compare(0, 6, "total ") == 0) {
            continue;
        }

        // mode links owner group size month day time-or-year name
        std::istringstream fields(line);
        std::string permissions, links, owner, group, size, month, day, when;
        if (!(fields >> permissions >> links >> owner >> group >> size >> month >> day >> when)) {
            continue;
        }
        std::string name;
        std::getline(fields >> std::ws, name);
        if (!name.empty() && name.back() == '\r') {
            name.pop_back();
        }
        if (permissions.front() == 'l') {
            size_t arrow = name.find(" -> ");
            if (arrow != std::string::npos) name.resize(arrow);
        }
        if (name.empty() || name == "." || name == "..") {
            continue;
        }
        if (!include_hidden && name.front() == '.') {
            continue;
        }

        DirectoryEntry entry;
        entry.name = name;
        entry.type = permissions.front() == 'd' ? "directory" : "file";
        bool numeric = !size.empty() &&
            std::all_of(size.begin(), size.end(), [](unsigned char c) { return std::isdigit(c); });
        entry.size = numeric ? std::strtoull(size.c_str(), nullptr, 10) : 0;
        entry.permissions = permissions;
        entry.owner = owner;
        entry.group = group;
        entries.push_back(std::move(entry));
    }
    return entries;
}

// ============================================================================
// Sandbox Implementation
// ============================================================================

Sandbox::Sandbox(SandboxConfig config, std::shared_ptr<ContainerRuntime> runtime)
    : config_(std::move(config))
    , runtime_(std::move(runtime)) {
    if (config_.name.empty()) {
        config_.name = "sandbox-" + util::random_hex(8);
    }
}

Sandbox::~Sandbox() {
    destroy();
}

ContainerSpec Sandbox::container_spec() const {
    ContainerSpec spec;
    spec.image = config_.image;
    spec.name = config_.name;
    spec.memory_limit = config_.memory_limit;
    spec.cpu_quota = config_.cpu_quota;
    spec.cpu_period = config_.cpu_period;
    spec.network_enabled = config_.network_enabled;
    spec.read_only_root = true;
    spec.security_opts = {"no-new-privileges:true"};
    spec.cap_drop = {"ALL"};
    spec.tmpfs = {
        {"/tmp", "rw,noexec,nosuid,size=100m,uid=1000,gid=1000"},
        {WORKSPACE, "rw,exec,nosuid,size=50m,uid=1000,gid=1000"},
    };
    spec.environment = {
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"},
        {"MPLBACKEND", "Agg"},
        {"HOME", WORKSPACE},
    };
    for (const auto& [key, value] : config_.environment) {
        spec.environment[key] = value;
    }
    if (config_.network_enabled) {
        spec.dns = {"8.8.8.8", "1.1.1.1"};
    }
    spec.working_dir = WORKSPACE;
    spec.user = SANDBOX_USER;
    return spec;
}

void Sandbox::create() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SandboxState::RUNNING) {
        return;
    }
    if (state_ == SandboxState::DESTROYED) {
        throw SandboxStateError("sandbox " + config_.name + " was destroyed; create a new one");
    }

    container_id_ = runtime_->create(container_spec());
    state_ = SandboxState::RUNNING;
    spdlog::info("Sandbox {} created (container={}, image={}, network={})",
        config_.name, container_id_, config_.image,
        config_.network_enabled ? "enabled" : "disabled");

    // Anything escaping setup must leave no container behind
    try {
        for (const auto& command : config_.setup_commands) {
            auto out = exec_with_timeout_locked({"sh", "-lc", command});
            if (out.exit_code != 0) {
                spdlog::error("Setup command failed in {} (exit={}): {}",
                    config_.name, out.exit_code, util::sanitize_utf8(out.stderr_data));
                throw ProvisionError("setup command failed for sandbox " + config_.name);
            }
        }
    } catch (const TimeoutError&) {
        // Already destroyed by the timeout
        throw ProvisionError("setup command timed out for sandbox " + config_.name);
    } catch (const ProvisionError&) {
        destroy_locked();
        throw;
    } catch (const Error& e) {
        spdlog::error("Setup command errored in {}: {}", config_.name, e.what());
        destroy_locked();
        throw ProvisionError("setup failed for sandbox " + config_.name);
    } catch (const std::exception& e) {
        spdlog::error("Setup of {} aborted: {}", config_.name, e.what());
        destroy_locked();
        throw;
    }
}

ExecutionResult Sandbox::run(const std::string& code, const std::string& language,
                             const std::map<std::string, std::string>& files) {
    // Resolve the language before any container interaction
    LaunchPlan plan = launch_plan_for(language);

    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    auto start = std::chrono::steady_clock::now();

    if (!upload_locked(files, {{plan.source_file, code}})) {
        ExecutionResult failed = ExecutionResult::failure(
            "upload_failed", "Failed to upload files to sandbox", language);
        failed.container_id = container_id_;
        failed.execution_time = elapsed_since(start);
        return failed;
    }

    spdlog::info("Executing {} code in {}", normalize_language(language), config_.name);
    ExecOutput out = exec_with_timeout_locked(plan.command);

    ExecutionResult result;
    result.status = out.exit_code == 0 ? "success" : "error";
    result.exit_code = out.exit_code;
    result.stdout_text = util::sanitize_utf8(out.stdout_data);
    result.stderr_text = util::sanitize_utf8(out.stderr_data);
    result.execution_time = elapsed_since(start);
    result.container_id = container_id_;
    result.language = language;

    spdlog::info("Execution in {} completed in {:.3f}s (exit={})",
        config_.name, result.execution_time, result.exit_code);
    return result;
}

bool Sandbox::write_file(const std::string& path, const std::string& content) {
    return write_files({{path, content}});
}

bool Sandbox::write_files(const std::map<std::string, std::string>& files) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();
    return upload_locked(files);
}

std::optional<FileResult> Sandbox::read_file(const std::string& path) {
    std::string safe_path = PathValidator::validate(path);

    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    auto archive = runtime_->get_archive(container_id_, std::string(WORKSPACE) + "/" + safe_path);
    if (!archive) {
        return std::nullopt;
    }

    TarFile file = read_first_file(*archive, config_.limits.max_file_size);

    FileResult result;
    result.path = safe_path;
    result.is_binary = !util::is_valid_utf8(file.content);
    result.content = std::move(file.content);
    return result;
}

FileOperation Sandbox::create_directory(const std::string& path) {
    std::string safe_path = PathValidator::validate(path, true);

    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    ExecOutput out = exec_with_timeout_locked(
        {"mkdir", "-p", "--", std::string(WORKSPACE) + "/" + safe_path});
    if (out.exit_code != 0) {
        return failed_operation(safe_path, "mkdir failed: " + trim_output(out.stderr_data));
    }
    FileOperation op;
    op.success = true;
    op.path = safe_path;
    return op;
}

std::optional<std::vector<DirectoryEntry>> Sandbox::list_directory(const std::string& path,
                                                                   bool include_hidden) {
    std::string target = WORKSPACE;
    if (!path.empty() && path != "." && path != "./") {
        target += "/" + PathValidator::validate(path, true);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    ExecOutput out = exec_with_timeout_locked({"ls", "-la", "--", target});
    if (out.exit_code != 0) {
        spdlog::debug("Listing {} in {} failed: {}", target, config_.name, trim_output(out.stderr_data));
        return std::nullopt;
    }
    return parse_directory_listing(util::sanitize_utf8(out.stdout_data), include_hidden);
}

FileOperation Sandbox::remove_path(const std::string& path, bool recursive) {
    std::string safe_path = PathValidator::validate(path, true);

    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    std::vector<std::string> cmd = {"rm"};
    if (recursive) {
        cmd.push_back("-r");
    }
    cmd.push_back("--");
    cmd.push_back(std::string(WORKSPACE) + "/" + safe_path);

    ExecOutput out = exec_with_timeout_locked(cmd);
    if (out.exit_code != 0) {
        std::string error = trim_output(out.stderr_data);
        return failed_operation(safe_path, error.empty() ? "Unknown error" : error);
    }
    FileOperation op;
    op.success = true;
    op.path = safe_path;
    return op;
}

uint64_t Sandbox::storage_usage() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    ExecOutput out = exec_with_timeout_locked({"du", "-sb", WORKSPACE});
    if (out.exit_code != 0) {
        spdlog::warn("Storage usage of {} unavailable: {}", config_.name, trim_output(out.stderr_data));
        return 0;
    }
    const char* text = out.stdout_data.c_str();
    char* end = nullptr;
    unsigned long long used = std::strtoull(text, &end, 10);
    if (end == text) {
        spdlog::warn("Unexpected du output from {}: {}", config_.name, trim_output(out.stdout_data));
        return 0;
    }
    return used;
}

BatchWriteResult Sandbox::batch_write(const std::map<std::string, std::string>& files) {
    BatchWriteResult result;
    result.total_files = files.size();

    uint64_t total = 0;
    for (const auto& [path, content] : files) {
        total += content.size();
    }
    if (total > config_.limits.max_total_size) {
        result.error = "Batch size " + std::to_string(total) + " exceeds limit " +
                       std::to_string(config_.limits.max_total_size);
        return result;
    }

    std::vector<TarEntry> entries;
    for (const auto& [path, content] : files) {
        std::string safe_path;
        try {
            safe_path = PathValidator::validate(path);
        } catch (const PathSecurityError& e) {
            result.results[path] = failed_operation(path, e.what());
            continue;
        }
        if (content.size() > config_.limits.max_file_size) {
            result.results[safe_path] = failed_operation(safe_path,
                "file exceeds limit of " + std::to_string(config_.limits.max_file_size) + " bytes");
            continue;
        }
        FileOperation accepted;
        accepted.success = true;
        accepted.path = safe_path;
        result.results[safe_path] = accepted;
        entries.push_back({safe_path, content});
    }

    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    if (!entries.empty() && !runtime_->put_archive(container_id_, WORKSPACE, write_tar(entries))) {
        spdlog::error("Batch upload of {} files to {} failed", entries.size(), config_.name);
        for (const auto& entry : entries) {
            result.results[entry.path] = failed_operation(entry.path, "Failed to upload batch to container");
        }
        result.error = "Failed to upload batch to container";
        return result;
    }

    result.success = true;
    result.successful = entries.size();
    spdlog::debug("Batch wrote {}/{} files to {}", result.successful, result.total_files, config_.name);
    return result;
}

ExecutionResult Sandbox::install_packages(const std::vector<std::string>& packages) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_running_locked();

    if (packages.empty()) {
        ExecutionResult empty;
        empty.status = "success";
        empty.exit_code = 0;
        empty.container_id = container_id_;
        return empty;
    }

    spdlog::info("Installing {} packages in {}", packages.size(), config_.name);
    std::vector<std::string> cmd = {"pip", "install", "--user", "--no-cache-dir"};
    cmd.insert(cmd.end(), packages.begin(), packages.end());

    auto start = std::chrono::steady_clock::now();
    ExecOutput out = exec_with_timeout_locked(cmd);

    ExecutionResult result;
    result.status = out.exit_code == 0 ? "success" : "error";
    result.exit_code = out.exit_code;
    result.stdout_text = util::sanitize_utf8(out.stdout_data);
    result.stderr_text = util::sanitize_utf8(out.stderr_data);
    result.execution_time = elapsed_since(start);
    result.container_id = container_id_;
    return result;
}

void Sandbox::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    destroy_locked();
}

SandboxState Sandbox::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string Sandbox::container_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return container_id_;
}

void Sandbox::require_running_locked() const {
    if (state_ != SandboxState::RUNNING) {
        throw SandboxStateError("sandbox " + config_.name + " is " +
                                sandbox_state_to_string(state_) + "; call create() first");
    }
}

void Sandbox::destroy_locked() {
    if (container_id_.empty()) {
        if (state_ == SandboxState::RUNNING) {
            state_ = SandboxState::DESTROYED;
        }
        return;
    }

    std::string id = container_id_;
    spdlog::info("Destroying {}", config_.name);
    try {
        runtime_->stop(id, 1);
    } catch (const Error& e) {
        spdlog::warn("Error stopping {}: {}", config_.name, e.what());
    }
    try {
        runtime_->remove(id, true);
    } catch (const Error& e) {
        spdlog::warn("Error removing {}: {}", config_.name, e.what());
    }

    container_id_.clear();
    state_ = SandboxState::DESTROYED;
    spdlog::info("{} destroyed", config_.name);
}

bool Sandbox::upload_locked(const std::map<std::string, std::string>& files,
                            const std::map<std::string, std::string>& trusted) {
    std::vector<TarEntry> entries;
    uint64_t total = 0;

    auto add = [&](const std::string& path, const std::string& content, bool allow_dangerous) {
        std::string safe_path = PathValidator::validate(path, allow_dangerous);
        if (content.size() > config_.limits.max_file_size) {
            throw FileSizeError("file " + safe_path + " exceeds limit of " +
                                std::to_string(config_.limits.max_file_size) + " bytes");
        }
        total += content.size();
        entries.push_back({safe_path, content});
    };

    for (const auto& [path, content] : files) {
        add(path, content, false);
    }
    for (const auto& [path, content] : trusted) {
        add(path, content, true);
    }

    if (total > config_.limits.max_total_size) {
        throw FileSizeError("upload of " + std::to_string(total) + " bytes exceeds limit of " +
                            std::to_string(config_.limits.max_total_size) + " bytes");
    }
    if (entries.empty()) {
        return true;
    }

    std::string archive = write_tar(entries);
    if (!runtime_->put_archive(container_id_, WORKSPACE, archive)) {
        spdlog::error("Upload of {} files to {} failed", entries.size(), config_.name);
        return false;
    }
    spdlog::debug("Uploaded {} files ({} bytes) to {}", entries.size(), total, config_.name);
    return true;
}

ExecOutput Sandbox::exec_with_timeout_locked(const std::vector<std::string>& argv) {
    ExecOptions options;
    options.user = SANDBOX_USER;
    options.working_dir = WORKSPACE;
    options.timeout_seconds = config_.timeout_seconds;

    try {
        return runtime_->exec(container_id_, argv, options);
    } catch (const TimeoutError&) {
        spdlog::error("Execution in {} exceeded timeout ({}s), destroying",
            config_.name, config_.timeout_seconds);
        // Removing the container ends the runaway process
        destroy_locked();
        throw TimeoutError("Execution exceeded timeout (" +
                           fmt::format("{}", config_.timeout_seconds) + "s)");
    }
}

} // namespace warden::runtime
