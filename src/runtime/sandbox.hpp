/**
 * Warden Sandbox
 *
 * One isolated execution environment (one container) with a read-only
 * root, dropped capabilities, no network unless enabled, CPU and memory
 * ceilings and size-capped scratch mounts. Code runs under a hard
 * wall-clock timeout: on expiry the container is force-destroyed.
 */
#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "runtime/container_runtime.hpp"
#include "runtime/file_transfer.hpp"

namespace warden::runtime {

// Sandbox configuration
struct SandboxConfig {
    std::string name;                                // container name, generated if empty
    std::string image = "executor-sandbox:latest";
    std::string memory_limit = "512m";
    int64_t cpu_quota = 100000;                      // 100ms per 100ms period
    int64_t cpu_period = 100000;
    double timeout_seconds = 30.0;                   // wall clock per execution
    bool network_enabled = false;
    std::map<std::string, std::string> environment;  // merged over the base environment
    std::vector<std::string> setup_commands;
    TransferLimits limits;
};

enum class SandboxState {
    UNCREATED,
    RUNNING,
    DESTROYED
};

inline std::string sandbox_state_to_string(SandboxState state) {
    switch (state) {
        case SandboxState::UNCREATED: return "uncreated";
        case SandboxState::RUNNING:   return "running";
        case SandboxState::DESTROYED: return "destroyed";
        default: return "unknown";
    }
}

// How a language is launched inside the workspace
struct LaunchPlan {
    std::vector<std::string> command;
    std::string source_file;
};

// Case-insensitive, whitespace-trimmed. Throws UnsupportedLanguageError.
LaunchPlan launch_plan_for(const std::string& language);

struct ExecutionResult {
    std::string status = "error";   // "success" | "error"
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;
    double execution_time = 0.0;    // seconds
    std::string container_id;
    std::string language;
    std::string error;              // user-safe message, empty on success
    std::string error_kind;         // stable identifier, empty on success

    bool ok() const { return status == "success"; }
    nlohmann::json to_json() const;

    static ExecutionResult failure(const std::string& kind, const std::string& message,
                                   const std::string& language = "");
};

struct FileResult {
    std::string path;
    std::string content;            // raw bytes when is_binary
    bool is_binary = false;

    nlohmann::json to_json() const;
};

// Outcome of one workspace operation
struct FileOperation {
    bool success = false;
    std::string path;
    std::string error;

    nlohmann::json to_json() const;
};

struct DirectoryEntry {
    std::string name;
    std::string type;               // "directory" | "file"
    uint64_t size = 0;
    std::string permissions;
    std::string owner;
    std::string group;

    nlohmann::json to_json() const;
};

// Parse `ls -la` output. The total line, "." and ".." are dropped, and
// dot-files unless include_hidden.
std::vector<DirectoryEntry> parse_directory_listing(const std::string& listing,
                                                    bool include_hidden);

struct BatchWriteResult {
    bool success = false;
    std::string error;
    // Keyed by normalized path, or by the path as given when rejected
    std::map<std::string, FileOperation> results;
    size_t total_files = 0;
    size_t successful = 0;

    nlohmann::json to_json() const;
};

class Sandbox {
public:
    Sandbox(SandboxConfig config, std::shared_ptr<ContainerRuntime> runtime);
    ~Sandbox();

    // Non-copyable
    Sandbox(const Sandbox&) = delete;
    Sandbox& operator=(const Sandbox&) = delete;

    // Start the container and run setup commands. Throws ProvisionError;
    // whatever was started is torn down first. A destroyed sandbox
    // cannot be created again (SandboxStateError).
    void create();

    // Upload files, write the source and execute it. Throws
    // UnsupportedLanguageError before touching the container,
    // SandboxStateError if not running, PathSecurityError/FileSizeError
    // for rejected files and TimeoutError after destroying the sandbox.
    ExecutionResult run(const std::string& code, const std::string& language,
                        const std::map<std::string, std::string>& files = {});

    // Single atomic upload. Returns false if the runtime rejected it.
    bool write_file(const std::string& path, const std::string& content);
    bool write_files(const std::map<std::string, std::string>& files);

    // nullopt if the file does not exist; NotAFileError if the path
    // names a directory or anything else that is not a regular file
    std::optional<FileResult> read_file(const std::string& path);

    // Workspace management. Paths are validated like uploads (throwing
    // PathSecurityError) but may carry any extension; command failures
    // are reported in the result.
    FileOperation create_directory(const std::string& path);
    // "." lists the workspace root; nullopt if the listing failed
    std::optional<std::vector<DirectoryEntry>> list_directory(const std::string& path = ".",
                                                              bool include_hidden = false);
    FileOperation remove_path(const std::string& path, bool recursive = false);
    // Bytes used under the workspace, 0 when it cannot be measured
    uint64_t storage_usage();

    // One archive for every accepted file. Rejected paths and oversized
    // files are reported per entry; a batch over max_total_size uploads
    // nothing.
    BatchWriteResult batch_write(const std::map<std::string, std::string>& files);

    ExecutionResult install_packages(const std::vector<std::string>& packages);

    // Idempotent; runtime failures are logged, never thrown
    void destroy();

    SandboxState state() const;
    std::string container_id() const;
    const std::string& name() const { return config_.name; }
    const SandboxConfig& config() const { return config_; }

    // Full container description derived from the config
    ContainerSpec container_spec() const;

private:
    SandboxConfig config_;
    std::shared_ptr<ContainerRuntime> runtime_;

    mutable std::mutex mutex_;
    SandboxState state_ = SandboxState::UNCREATED;
    std::string container_id_;

    void require_running_locked() const;
    void destroy_locked();

    // Validates and packs entries; `trusted` entries skip the
    // dangerous-extension check (launcher sources)
    bool upload_locked(const std::map<std::string, std::string>& files,
                       const std::map<std::string, std::string>& trusted = {});

    // Runs as the sandbox user under the wall-clock limit; on expiry the
    // sandbox is destroyed and TimeoutError thrown
    ExecOutput exec_with_timeout_locked(const std::vector<std::string>& argv);
};

// Scoped acquisition: create() on construction, destroy() on every exit path
class ScopedSandbox {
public:
    explicit ScopedSandbox(Sandbox& sandbox) : sandbox_(sandbox) { sandbox_.create(); }
    ~ScopedSandbox() { sandbox_.destroy(); }

    ScopedSandbox(const ScopedSandbox&) = delete;
    ScopedSandbox& operator=(const ScopedSandbox&) = delete;

    Sandbox& get() { return sandbox_; }
    Sandbox* operator->() { return &sandbox_; }

private:
    Sandbox& sandbox_;
};

} // namespace warden::runtime
