/**
 * Docker CLI runtime
 *
 * Drives the docker binary as a subprocess. Requires the calling user
 * to be able to talk to the docker daemon.
 */
#pragma once
#include <string>
#include <vector>
#include "runtime/container_runtime.hpp"

namespace warden::runtime {

class DockerCliRuntime : public ContainerRuntime {
public:
    explicit DockerCliRuntime(std::string docker_binary = "docker");

    std::string create(const ContainerSpec& spec) override;
    ExecOutput exec(const std::string& id, const std::vector<std::string>& argv,
                    const ExecOptions& options) override;
    bool put_archive(const std::string& id, const std::string& dest_dir,
                     const std::string& tar_bytes) override;
    std::optional<std::string> get_archive(const std::string& id,
                                           const std::string& path) override;
    void stop(const std::string& id, int timeout_seconds) override;
    void remove(const std::string& id, bool force) override;

    // `docker run` argument vector for spec (without the binary)
    static std::vector<std::string> build_run_args(const ContainerSpec& spec);

private:
    std::string docker_binary_;
};

} // namespace warden::runtime
