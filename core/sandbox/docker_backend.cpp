#include "sandbox/docker_backend.hpp"
#include "common/errors.hpp"

#include <functional>
#include <iomanip>
#include <random>
#include <sstream>

namespace atdd {

namespace {

/// Force-removes the named container when the run scope ends.
class ContainerGuard {
public:
    explicit ContainerGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~ContainerGuard() { release_(); }

    ContainerGuard(const ContainerGuard&) = delete;
    ContainerGuard& operator=(const ContainerGuard&) = delete;

private:
    std::function<void()> release_;
};

} // namespace

DockerBackend::DockerBackend(DockerOptions options, LoggerPtr logger)
    : options_(std::move(options)),
      logger_(orNull(std::move(logger))),
      runner_(logger_) {}

bool DockerBackend::isDaemonUnreachable(int exit_code, const std::string& stderr_text) {
    if (exit_code != 125 && exit_code != 1) return false;
    return stderr_text.find("Cannot connect to the Docker daemon") != std::string::npos ||
           stderr_text.find("Is the docker daemon running") != std::string::npos ||
           stderr_text.find("error during connect") != std::string::npos;
}

ProcessResult DockerBackend::control(const std::vector<std::string>& args) const {
    std::vector<std::string> argv{options_.docker_binary};
    argv.insert(argv.end(), args.begin(), args.end());
    ProcessOptions opts;
    opts.timeout_seconds = options_.control_timeout_seconds;
    return runner_.run(argv, opts);
}

void DockerBackend::ensureAvailable() {
    ProcessResult r = control({"version", "--format", "{{.Server.Version}}"});
    if (r.timed_out) {
        throw InfrastructureError("docker version timed out after " +
                                  std::to_string(options_.control_timeout_seconds) + "s");
    }
    if (r.exit_code != 0) {
        throw InfrastructureError("Docker daemon unavailable: " + r.stderr_text);
    }
    std::string version = r.stdout_text.substr(0, r.stdout_text.find('\n'));
    logger_->info("Docker available server_version={} image={}", version, options_.image);
}

std::string DockerBackend::makeContainerName() const {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::ostringstream name;
    name << options_.container_prefix << std::hex << std::setfill('0') << std::setw(16) << rng();
    return name.str();
}

std::vector<std::string> DockerBackend::buildRunCommand(const BackendRequest& request,
                                                        const std::string& container_name) const {
    const ResourceLimits& limits = request.limits;
    std::vector<std::string> argv{
        options_.docker_binary, "run",
        "--name", container_name,
        "--label", options_.owner_label,
    };
    if (limits.network_disabled) {
        argv.insert(argv.end(), {"--network", "none"});
    }
    argv.insert(argv.end(), {
        "--memory", limits.memory_limit,
        "--memory-swap", limits.memory_limit,
        "--cpu-period", std::to_string(limits.cpu_period),
        "--cpu-quota", std::to_string(limits.cpu_quota),
        "--pids-limit", std::to_string(limits.pids_limit),
    });
    if (limits.filesystem_read_only) {
        argv.push_back("--read-only");
    }
    argv.insert(argv.end(), {
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "--tmpfs", options_.tmpfs,
        "-v", request.workspace + ":" + options_.workdir + ":ro",
        "-w", options_.workdir,
    });
    for (const auto& [key, value] : request.environment) {
        argv.insert(argv.end(), {"-e", key + "=" + value});
    }
    argv.push_back(options_.image);
    argv.insert(argv.end(), request.command.begin(), request.command.end());
    return argv;
}

void DockerBackend::killContainer(const std::string& container_name) const {
    ProcessResult r = control({"kill", container_name});
    if (r.exit_code != 0) {
        logger_->debug("docker kill failed container={} stderr={}", container_name, r.stderr_text);
    }
}

void DockerBackend::removeContainer(const std::string& container_name) const {
    try {
        ProcessResult r = control({"rm", "-f", container_name});
        if (r.exit_code != 0) {
            logger_->warn("docker rm failed container={} stderr={}", container_name, r.stderr_text);
        }
    } catch (const InfrastructureError& e) {
        // Runs from a destructor; the next collectGarbage() picks it up.
        logger_->error("Container cleanup failed container={} error={}", container_name, e.what());
    }
}

BackendResult DockerBackend::run(const BackendRequest& request, const CancellationToken* cancel) {
    const std::string container = makeContainerName();
    std::vector<std::string> argv = buildRunCommand(request, container);
    ContainerGuard guard([this, &container] { removeContainer(container); });

    logger_->debug("Starting container name={} timeout={}s", container, request.timeout_seconds);

    ProcessOptions opts;
    opts.timeout_seconds = request.timeout_seconds;
    ProcessResult r = runner_.run(argv, opts, cancel);

    if (isDaemonUnreachable(r.exit_code, r.stderr_text) && !r.timed_out && !r.cancelled) {
        throw InfrastructureError("Docker daemon unreachable: " + r.stderr_text);
    }

    BackendResult result;
    result.stdout_text = std::move(r.stdout_text);
    result.stderr_text = std::move(r.stderr_text);
    result.exit_code = r.exit_code;
    result.timed_out = r.timed_out;
    result.cancelled = r.cancelled;
    result.duration_seconds = r.duration_seconds;

    if (r.timed_out || r.cancelled) {
        // Killing the CLI client leaves the container running.
        killContainer(container);
    }
    if (r.timed_out) {
        result.exit_code = kTimeoutExitCode;
        logger_->warn("Container timed out name={} timeout={}s", container, request.timeout_seconds);
    }
    return result;
}

int DockerBackend::collectGarbage() {
    ProcessResult r = control({"ps", "-aq", "--filter", "label=" + options_.owner_label});
    if (r.exit_code != 0) {
        logger_->warn("Leaked container scan failed stderr={}", r.stderr_text);
        return 0;
    }

    int removed = 0;
    std::istringstream ids(r.stdout_text);
    std::string id;
    while (ids >> id) {
        ProcessResult rm = control({"rm", "-f", id});
        if (rm.exit_code == 0) {
            removed++;
        } else {
            logger_->warn("Leaked container removal failed id={} stderr={}", id, rm.stderr_text);
        }
    }
    if (removed > 0) logger_->info("Removed leaked containers count={}", removed);
    return removed;
}

} // namespace atdd
