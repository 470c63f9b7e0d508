#pragma once

#include "sandbox/isolation_backend.hpp"
#include "sandbox/process_runner.hpp"
#include "logging/logger.hpp"
#include <string>
#include <vector>

namespace atdd {

struct DockerOptions {
    std::string docker_binary = "docker";
    std::string image = "atdd-pytest:latest";
    std::string owner_label = "atdd.owner=atdd";
    std::string container_prefix = "atdd-";
    std::string workdir = "/workspace";
    std::string tmpfs = "/tmp:rw,size=16m";
    double control_timeout_seconds = 30.0;   // docker version / kill / rm / ps
};

/// Docker Backend: drives the docker CLI. Each run gets a fresh, named,
/// labelled container that is force-removed on every exit path.
class DockerBackend : public IsolationBackend {
public:
    explicit DockerBackend(DockerOptions options = {}, LoggerPtr logger = nullptr);

    void ensureAvailable() override;
    BackendResult run(const BackendRequest& request, const CancellationToken* cancel) override;
    int collectGarbage() override;
    std::string name() const override { return "docker"; }

    /// Full `docker run` argument vector for a request.
    std::vector<std::string> buildRunCommand(const BackendRequest& request,
                                             const std::string& container_name) const;

    /// Fresh container name: prefix plus random hex.
    std::string makeContainerName() const;

    /// True for docker CLI output that means the daemon cannot be reached.
    static bool isDaemonUnreachable(int exit_code, const std::string& stderr_text);

    const DockerOptions& options() const { return options_; }

private:
    ProcessResult control(const std::vector<std::string>& args) const;
    void killContainer(const std::string& container_name) const;
    void removeContainer(const std::string& container_name) const;

    DockerOptions options_;
    LoggerPtr logger_;
    ProcessRunner runner_;
};

} // namespace atdd
