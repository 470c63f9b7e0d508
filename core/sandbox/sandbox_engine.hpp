#pragma once

#include "sandbox/isolation_backend.hpp"
#include "common/cancellation.hpp"
#include "logging/logger.hpp"
#include "outcome/test_outcome.hpp"
#include <memory>
#include <string>

namespace atdd {

struct SandboxConfig {
    std::string docker_image = "atdd-pytest:latest";
    std::string docker_binary = "docker";
    std::string memory_limit = "50m";
    int cpu_quota = 50000;
    int cpu_period = 100000;
    int pids_limit = 64;
    double execution_timeout = 30.0;        // seconds, default for execute()
    std::string workspace_prefix = "atdd-";
    std::string candidate_filename = "impl.py";
    std::string oracle_filename = "test_impl.py";
};

/// Sandbox Execution Engine: runs one (candidate, oracle) pair in a fresh
/// isolated environment and returns the raw result.
class SandboxEngine {
public:
    SandboxEngine(SandboxConfig config, std::unique_ptr<IsolationBackend> backend,
                  LoggerPtr logger = nullptr);

    /// Verify the backend and remove environments leaked by earlier runs.
    /// Throws InfrastructureError when the backend is unreachable.
    void initialize();

    /// Candidate failures (non-zero exit, timeout, unwritable workspace)
    /// come back as data. Throws InfrastructureError only when the backend
    /// is unreachable. A non-positive timeout uses `execution_timeout`.
    RawExecution execute(const std::string& candidate_source,
                         const std::string& oracle_source,
                         double timeout_seconds,
                         const CancellationToken* cancel = nullptr);

    /// Request for a workspace, with the configured limits and pytest command.
    BackendRequest makeRequest(const std::string& workspace, double timeout_seconds) const;

    const SandboxConfig& config() const { return config_; }
    IsolationBackend& backend() { return *backend_; }

private:
    SandboxConfig config_;
    std::unique_ptr<IsolationBackend> backend_;
    LoggerPtr logger_;
};

/// Engine backed by the docker CLI, configured from `config`.
std::unique_ptr<SandboxEngine> makeDockerSandbox(const SandboxConfig& config = {},
                                                 LoggerPtr logger = nullptr);

} // namespace atdd
