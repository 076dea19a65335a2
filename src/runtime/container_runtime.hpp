/**
 * Container runtime capability
 *
 * The narrow set of operations a Sandbox needs from an isolation
 * runtime. DockerCliRuntime is the production implementation; tests
 * supply an in-memory double.
 */
#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden::runtime {

struct TmpfsMount {
    std::string path;
    std::string options;   // e.g. "rw,noexec,nosuid,size=100m"
};

// Everything needed to start one long-lived container
struct ContainerSpec {
    std::string image;
    std::string name;
    std::string memory_limit = "512m";
    int64_t cpu_quota = 100000;
    int64_t cpu_period = 100000;
    bool network_enabled = false;
    bool read_only_root = true;
    std::vector<std::string> security_opts = {"no-new-privileges:true"};
    std::vector<std::string> cap_drop = {"ALL"};
    std::vector<TmpfsMount> tmpfs;
    std::map<std::string, std::string> environment;
    std::vector<std::string> dns;
    std::string working_dir = "/workspace";
    std::string user = "sandbox";
    std::vector<std::string> command = {"sleep", "infinity"};
};

struct ExecOptions {
    std::string user;
    std::string working_dir;
    double timeout_seconds = 0.0;   // 0 waits indefinitely
};

// Raw bytes; decoding is the caller's concern
struct ExecOutput {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;
};

class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    // Returns the container id. Throws ProvisionError.
    virtual std::string create(const ContainerSpec& spec) = 0;

    // Blocks until the command exits or options.timeout_seconds passes.
    // Throws TimeoutError at the deadline, having stopped waiting on the
    // command, and warden::Error if the runtime itself cannot be reached.
    virtual ExecOutput exec(const std::string& id,
                            const std::vector<std::string>& argv,
                            const ExecOptions& options) = 0;

    // Extract an uncompressed tar into dest_dir
    virtual bool put_archive(const std::string& id, const std::string& dest_dir,
                             const std::string& tar_bytes) = 0;

    // Tar stream rooted at path, nullopt if the path does not exist
    virtual std::optional<std::string> get_archive(const std::string& id,
                                                   const std::string& path) = 0;

    // Both throw warden::Error on failure
    virtual void stop(const std::string& id, int timeout_seconds) = 0;
    virtual void remove(const std::string& id, bool force) = 0;
};

} // namespace warden::runtime
