#include "runtime/docker_runtime.hpp"
#include "util/errors.hpp"
#include "util/subprocess.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <algorithm>

namespace warden::runtime {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

DockerCliRuntime::DockerCliRuntime(std::string docker_binary)
    : docker_binary_(std::move(docker_binary)) {}

std::vector<std::string> DockerCliRuntime::build_run_args(const ContainerSpec& spec) {
    std::vector<std::string> args = {"run", "-d"};

    if (!spec.name.empty()) {
        args.insert(args.end(), {"--name", spec.name});
    }
    args.insert(args.end(), {"--memory", spec.memory_limit});
    args.insert(args.end(), {"--cpu-quota", std::to_string(spec.cpu_quota)});
    args.insert(args.end(), {"--cpu-period", std::to_string(spec.cpu_period)});

    if (spec.read_only_root) {
        args.push_back("--read-only");
    }
    for (const auto& opt : spec.security_opts) {
        args.insert(args.end(), {"--security-opt", opt});
    }
    for (const auto& cap : spec.cap_drop) {
        args.insert(args.end(), {"--cap-drop", cap});
    }

    if (spec.network_enabled) {
        for (const auto& server : spec.dns) {
            args.insert(args.end(), {"--dns", server});
        }
    } else {
        args.insert(args.end(), {"--network", "none"});
    }

    for (const auto& mount : spec.tmpfs) {
        args.insert(args.end(), {"--tmpfs", mount.path + ":" + mount.options});
    }
    for (const auto& [key, value] : spec.environment) {
        args.insert(args.end(), {"-e", key + "=" + value});
    }
    if (!spec.working_dir.empty()) {
        args.insert(args.end(), {"-w", spec.working_dir});
    }
    if (!spec.user.empty()) {
        args.insert(args.end(), {"-u", spec.user});
    }

    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());
    return args;
}

std::string DockerCliRuntime::create(const ContainerSpec& spec) {
    std::vector<std::string> argv = {docker_binary_};
    auto run_args = build_run_args(spec);
    argv.insert(argv.end(), run_args.begin(), run_args.end());

    auto result = util::run_process(argv);
    if (!result.spawned) {
        throw ProvisionError("container runtime unavailable: " + result.error);
    }
    if (result.exit_code != 0) {
        spdlog::error("docker run failed for {}: {}", spec.name, trim(result.stderr_data));
        // docker may leave a created-but-not-started container behind
        if (!spec.name.empty()) {
            auto cleanup = util::run_process({docker_binary_, "rm", "-f", spec.name});
            if (!cleanup.spawned || cleanup.exit_code != 0) {
                spdlog::debug("No leftover container {} to remove", spec.name);
            }
        }
        throw ProvisionError("failed to start container " + spec.name);
    }

    std::string id = trim(result.stdout_data);
    if (id.empty()) {
        throw ProvisionError("container runtime returned no id for " + spec.name);
    }
    return id;
}

ExecOutput DockerCliRuntime::exec(const std::string& id, const std::vector<std::string>& argv,
                                  const ExecOptions& options) {
    std::vector<std::string> cmd = {docker_binary_, "exec"};
    if (!options.user.empty()) {
        cmd.insert(cmd.end(), {"-u", options.user});
    }
    if (!options.working_dir.empty()) {
        cmd.insert(cmd.end(), {"-w", options.working_dir});
    }
    cmd.push_back(id);
    cmd.insert(cmd.end(), argv.begin(), argv.end());

    int timeout_ms = options.timeout_seconds > 0
        ? std::max(1, static_cast<int>(options.timeout_seconds * 1000.0))
        : 0;
    auto result = util::run_process(cmd, {}, timeout_ms);
    if (!result.spawned) {
        throw Error("container runtime unavailable: " + result.error);
    }
    // Killing the client leaves the process running in the container
    if (result.timed_out) {
        throw TimeoutError("exec in " + id + " exceeded " +
                           fmt::format("{}", options.timeout_seconds) + "s");
    }

    ExecOutput out;
    out.exit_code = result.exit_code;
    out.stdout_data = std::move(result.stdout_data);
    out.stderr_data = std::move(result.stderr_data);
    return out;
}

bool DockerCliRuntime::put_archive(const std::string& id, const std::string& dest_dir,
                                   const std::string& tar_bytes) {
    auto result = util::run_process({docker_binary_, "cp", "-", id + ":" + dest_dir}, tar_bytes);
    if (!result.spawned) {
        spdlog::error("docker cp unavailable: {}", result.error);
        return false;
    }
    if (result.exit_code != 0) {
        spdlog::error("docker cp into {} failed: {}", id, trim(result.stderr_data));
        return false;
    }
    return true;
}

std::optional<std::string> DockerCliRuntime::get_archive(const std::string& id,
                                                         const std::string& path) {
    auto result = util::run_process({docker_binary_, "cp", id + ":" + path, "-"});
    if (!result.spawned) {
        spdlog::error("docker cp unavailable: {}", result.error);
        return std::nullopt;
    }
    if (result.exit_code != 0) {
        spdlog::debug("docker cp from {}:{} failed: {}", id, path, trim(result.stderr_data));
        return std::nullopt;
    }
    return std::move(result.stdout_data);
}

void DockerCliRuntime::stop(const std::string& id, int timeout_seconds) {
    auto result = util::run_process(
        {docker_binary_, "stop", "-t", std::to_string(timeout_seconds), id});
    if (!result.spawned) {
        throw Error("container runtime unavailable: " + result.error);
    }
    if (result.exit_code != 0) {
        throw Error("docker stop " + id + ": " + trim(result.stderr_data));
    }
}

void DockerCliRuntime::remove(const std::string& id, bool force) {
    std::vector<std::string> argv = {docker_binary_, "rm"};
    if (force) argv.push_back("-f");
    argv.push_back(id);

    auto result = util::run_process(argv);
    if (!result.spawned) {
        throw Error("container runtime unavailable: " + result.error);
    }
    if (result.exit_code != 0) {
        throw Error("docker rm " + id + ": " + trim(result.stderr_data));
    }
}

} // namespace warden::runtime
