#include "sandbox/sandbox_engine.hpp"
#include "sandbox/docker_backend.hpp"
#include "sandbox/workspace.hpp"
#include "common/errors.hpp"

#include <chrono>

namespace atdd {

SandboxEngine::SandboxEngine(SandboxConfig config, std::unique_ptr<IsolationBackend> backend,
                             LoggerPtr logger)
    : config_(std::move(config)),
      backend_(std::move(backend)),
      logger_(orNull(std::move(logger))) {
    if (!backend_) throw InfrastructureError("sandbox engine requires an isolation backend");
}

void SandboxEngine::initialize() {
    backend_->ensureAvailable();
    int removed = backend_->collectGarbage();
    logger_->info("Sandbox initialized backend={} image={} leaked_removed={}",
                  backend_->name(), config_.docker_image, removed);
}

BackendRequest SandboxEngine::makeRequest(const std::string& workspace, double timeout_seconds) const {
    BackendRequest request;
    request.workspace = workspace;
    request.limits.memory_limit = config_.memory_limit;
    request.limits.cpu_quota = config_.cpu_quota;
    request.limits.cpu_period = config_.cpu_period;
    request.limits.pids_limit = config_.pids_limit;
    request.timeout_seconds = timeout_seconds;
    request.command = {"pytest", config_.oracle_filename, "-v", "--tb=short", "--no-header"};
    request.environment = {
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTEST_DISABLE_PLUGIN_AUTOLOAD", "1"},
    };
    return request;
}

RawExecution SandboxEngine::execute(const std::string& candidate_source,
                                    const std::string& oracle_source,
                                    double timeout_seconds,
                                    const CancellationToken* cancel) {
    const auto start = std::chrono::steady_clock::now();
    auto elapsed = [&start] {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    };

    if (timeout_seconds <= 0.0) timeout_seconds = config_.execution_timeout;

    if (isCancelled(cancel)) {
        RawExecution raw;
        raw.cancelled = true;
        raw.exit_code = -1;
        return raw;
    }

    try {
        Workspace workspace(config_.workspace_prefix);
        workspace.write(config_.candidate_filename, candidate_source);
        workspace.write(config_.oracle_filename, oracle_source);

        logger_->info("Executing tests in sandbox timeout={} code_length={}",
                      timeout_seconds, candidate_source.size());
        RawExecution raw = backend_->run(makeRequest(workspace.path(), timeout_seconds), cancel);
        logger_->info("Sandbox execution completed exit_code={} timed_out={} duration={:.2f}s",
                      raw.exit_code, raw.timed_out, raw.duration_seconds);
        return raw;
    } catch (const WorkspaceError& e) {
        logger_->error("Workspace preparation failed error={}", e.what());
        RawExecution raw;
        raw.exit_code = 1;
        raw.stderr_text = e.what();
        raw.duration_seconds = elapsed();
        return raw;
    }
}

std::unique_ptr<SandboxEngine> makeDockerSandbox(const SandboxConfig& config, LoggerPtr logger) {
    DockerOptions options;
    options.docker_binary = config.docker_binary;
    options.image = config.docker_image;
    auto backend = std::make_unique<DockerBackend>(options, logger);
    return std::make_unique<SandboxEngine>(config, std::move(backend), logger);
}

} // namespace atdd
