#include <gtest/gtest.h>
#include "sandbox/process_runner.hpp"
#include "sandbox/workspace.hpp"
#include "sandbox/docker_backend.hpp"
#include "sandbox/sandbox_engine.hpp"
#include "fake_backend.hpp"

#include <algorithm>
#include <filesystem>

using namespace atdd;
namespace fs = std::filesystem;

namespace {

/// Stand-in docker CLI: a shell script answering the subcommands the
/// backend uses. kill and rm calls are logged beside the script.
std::string makeFakeDocker(Workspace& ws, const std::string& run_body,
                           const std::string& version_body = "echo 24.0.7") {
    ws.write("docker",
             "#!/bin/sh\n"
             "dir=$(dirname \"$0\")\n"
             "case \"$1\" in\n"
             "  version) " + version_body + " ;;\n"
             "  ps) printf 'c1\\nc2\\n' ;;\n"
             "  rm) echo \"$3\" >> \"$dir/removed.log\" ;;\n"
             "  kill) echo \"$2\" >> \"$dir/killed.log\" ;;\n"
             "  run) " + run_body + " ;;\n"
             "esac\n");
    std::string path = ws.path() + "/docker";
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                              fs::perms::others_read | fs::perms::others_exec);
    return path;
}

BackendRequest sampleRequest(const std::string& workspace) {
    BackendRequest request;
    request.workspace = workspace;
    request.timeout_seconds = 5.0;
    request.command = {"pytest", "test_impl.py", "-v"};
    request.environment = {{"PYTHONDONTWRITEBYTECODE", "1"}};
    return request;
}

bool hasPair(const std::vector<std::string>& argv, const std::string& flag, const std::string& value) {
    for (size_t i = 0; i + 1 < argv.size(); i++) {
        if (argv[i] == flag && argv[i + 1] == value) return true;
    }
    return false;
}

bool has(const std::vector<std::string>& argv, const std::string& value) {
    return std::find(argv.begin(), argv.end(), value) != argv.end();
}

} // namespace

// ─── Process Runner ────────────────────────────────────────────

TEST(SandboxTest, RunnerCapturesStreams) {
    ProcessRunner runner;
    ProcessResult r = runner.run({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 3"});

    EXPECT_EQ(r.stdout_text, "out\n");
    EXPECT_EQ(r.stderr_text, "err\n");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.timed_out);
    EXPECT_FALSE(r.cancelled);
    EXPECT_GE(r.duration_seconds, 0.0);
}

TEST(SandboxTest, RunnerTimesOut) {
    ProcessRunner runner;
    ProcessOptions options;
    options.timeout_seconds = 0.2;
    ProcessResult r = runner.run({"/bin/sh", "-c", "echo started; exec sleep 5"}, options);

    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, 128 + 9);  // SIGKILL
    EXPECT_EQ(r.stdout_text, "started\n");
    EXPECT_LT(r.duration_seconds, 4.0);
}

TEST(SandboxTest, RunnerHonoursCancellation) {
    ProcessRunner runner;
    CancellationToken token;
    token.cancel();
    ProcessResult r = runner.run({"/bin/sh", "-c", "exec sleep 5"}, {}, &token);

    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.timed_out);
    EXPECT_LT(r.duration_seconds, 4.0);
}

TEST(SandboxTest, RunnerCapsOutput) {
    ProcessRunner runner;
    ProcessOptions options;
    options.max_output_bytes = 1000;
    ProcessResult r = runner.run({"/bin/sh", "-c", "head -c 100000 /dev/zero"}, options);

    EXPECT_EQ(r.stdout_text.size(), 1000u);
    EXPECT_TRUE(r.truncated);
    EXPECT_EQ(r.exit_code, 0);
}

TEST(SandboxTest, RunnerReportsSignalExit) {
    ProcessRunner runner;
    ProcessResult r = runner.run({"/bin/sh", "-c", "kill -9 $$"});
    EXPECT_EQ(r.exit_code, 137);
}

TEST(SandboxTest, RunnerMissingBinaryThrows) {
    ProcessRunner runner;
    EXPECT_THROW(runner.run({"/nonexistent/atdd-missing-binary"}), InfrastructureError);
    EXPECT_THROW(runner.run({}), InfrastructureError);
}

// ─── Workspace ─────────────────────────────────────────────────

TEST(SandboxTest, WorkspaceLifecycle) {
    std::string path;
    {
        Workspace ws("atdd-test-");
        path = ws.path();
        EXPECT_TRUE(fs::is_directory(path));
        EXPECT_NE(fs::path(path).filename().string().find("atdd-test-"), std::string::npos);

        ws.write("impl.py", "def f():\n    return 1\n");
        EXPECT_EQ(readFile(path + "/impl.py"), "def f():\n    return 1\n");
    }
    EXPECT_FALSE(fs::exists(path));  // removed with its contents
}

TEST(SandboxTest, WorkspaceRejectsBadNames) {
    Workspace ws;
    EXPECT_THROW(ws.write("../escape.py", "x = 1\n"), WorkspaceError);
    EXPECT_THROW(ws.write("", "x = 1\n"), WorkspaceError);
}

// ─── Docker Backend ────────────────────────────────────────────

TEST(SandboxTest, DockerRunCommandCarriesLimits) {
    DockerBackend backend;
    BackendRequest request = sampleRequest("/tmp/atdd-abc");
    request.limits.memory_limit = "64m";
    request.limits.pids_limit = 32;

    auto argv = backend.buildRunCommand(request, "atdd-0001");
    ASSERT_GE(argv.size(), 3u);
    EXPECT_EQ(argv[0], "docker");
    EXPECT_EQ(argv[1], "run");
    EXPECT_TRUE(hasPair(argv, "--name", "atdd-0001"));
    EXPECT_TRUE(hasPair(argv, "--label", "atdd.owner=atdd"));
    EXPECT_TRUE(hasPair(argv, "--network", "none"));
    EXPECT_TRUE(hasPair(argv, "--memory", "64m"));
    EXPECT_TRUE(hasPair(argv, "--memory-swap", "64m"));
    EXPECT_TRUE(hasPair(argv, "--cpu-quota", "50000"));
    EXPECT_TRUE(hasPair(argv, "--cpu-period", "100000"));
    EXPECT_TRUE(hasPair(argv, "--pids-limit", "32"));
    EXPECT_TRUE(has(argv, "--read-only"));
    EXPECT_TRUE(hasPair(argv, "--cap-drop", "ALL"));
    EXPECT_TRUE(hasPair(argv, "-v", "/tmp/atdd-abc:/workspace:ro"));
    EXPECT_TRUE(hasPair(argv, "-e", "PYTHONDONTWRITEBYTECODE=1"));

    // Image immediately precedes the command.
    auto image = std::find(argv.begin(), argv.end(), "atdd-pytest:latest");
    ASSERT_NE(image, argv.end());
    std::vector<std::string> tail(image + 1, argv.end());
    EXPECT_EQ(tail, request.command);
}

TEST(SandboxTest, DockerRelaxedLimitsDropFlags) {
    DockerBackend backend;
    BackendRequest request = sampleRequest("/tmp/ws");
    request.limits.network_disabled = false;
    request.limits.filesystem_read_only = false;

    auto argv = backend.buildRunCommand(request, "atdd-0002");
    EXPECT_FALSE(has(argv, "--network"));
    EXPECT_FALSE(has(argv, "--read-only"));
}

TEST(SandboxTest, DockerContainerNames) {
    DockerBackend backend;
    std::string a = backend.makeContainerName();
    std::string b = backend.makeContainerName();
    EXPECT_EQ(a.rfind("atdd-", 0), 0u);
    EXPECT_EQ(a.size(), 5u + 16u);
    EXPECT_NE(a, b);
}

TEST(SandboxTest, DockerDaemonUnreachableDetection) {
    EXPECT_TRUE(DockerBackend::isDaemonUnreachable(
        125, "Cannot connect to the Docker daemon at unix:///var/run/docker.sock."));
    EXPECT_TRUE(DockerBackend::isDaemonUnreachable(1, "error during connect: Get ..."));
    EXPECT_FALSE(DockerBackend::isDaemonUnreachable(1, "AssertionError"));
    EXPECT_FALSE(DockerBackend::isDaemonUnreachable(2, "Cannot connect to the Docker daemon"));
}

TEST(SandboxTest, DockerEnsureAvailable) {
    Workspace bin;
    DockerOptions options;
    options.docker_binary = makeFakeDocker(bin, "true");
    EXPECT_NO_THROW(DockerBackend(options).ensureAvailable());

    Workspace broken;
    options.docker_binary = makeFakeDocker(broken, "true", "echo 'daemon down' >&2; exit 1");
    EXPECT_THROW(DockerBackend(options).ensureAvailable(), InfrastructureError);

    options.docker_binary = "/nonexistent/docker";
    EXPECT_THROW(DockerBackend(options).ensureAvailable(), InfrastructureError);
}

TEST(SandboxTest, DockerRunRemovesContainer) {
    Workspace bin;
    DockerOptions options;
    options.docker_binary = makeFakeDocker(bin, "shift; echo \"$@\"; echo '==== 2 passed in 0.01s ===='");
    DockerBackend backend(options);

    BackendResult r = backend.run(sampleRequest(bin.path()), nullptr);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_FALSE(r.timed_out);
    EXPECT_NE(r.stdout_text.find("--network none"), std::string::npos);
    EXPECT_NE(r.stdout_text.find("2 passed"), std::string::npos);

    std::string removed = readFile(bin.path() + "/removed.log");
    EXPECT_EQ(removed.rfind("atdd-", 0), 0u);
}

TEST(SandboxTest, DockerRunTimeoutKillsContainer) {
    Workspace bin;
    DockerOptions options;
    options.docker_binary = makeFakeDocker(bin, "exec sleep 5");
    DockerBackend backend(options);

    BackendRequest request = sampleRequest(bin.path());
    request.timeout_seconds = 0.3;
    BackendResult r = backend.run(request, nullptr);

    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, kTimeoutExitCode);
    EXPECT_FALSE(readFile(bin.path() + "/killed.log").empty());
    EXPECT_FALSE(readFile(bin.path() + "/removed.log").empty());
}

TEST(SandboxTest, DockerRunUnreachableThrows) {
    Workspace bin;
    DockerOptions options;
    options.docker_binary = makeFakeDocker(
        bin, "echo 'Cannot connect to the Docker daemon at unix:///var/run/docker.sock.' >&2; exit 125");
    DockerBackend backend(options);

    EXPECT_THROW(backend.run(sampleRequest(bin.path()), nullptr), InfrastructureError);
    EXPECT_FALSE(readFile(bin.path() + "/removed.log").empty());  // guard still ran
}

TEST(SandboxTest, DockerCollectGarbage) {
    Workspace bin;
    DockerOptions options;
    options.docker_binary = makeFakeDocker(bin, "true");
    DockerBackend backend(options);

    EXPECT_EQ(backend.collectGarbage(), 2);
    EXPECT_EQ(readFile(bin.path() + "/removed.log"), "c1\nc2\n");
}

// ─── Sandbox Engine ────────────────────────────────────────────

TEST(SandboxTest, EngineWritesWorkspaceAndRequest) {
    auto backend = std::make_unique<ScriptedBackend>();
    ScriptedBackend* fake = backend.get();
    fake->script = {pytestRun(2, 0)};

    SandboxConfig config;
    config.memory_limit = "64m";
    SandboxEngine engine(config, std::move(backend));

    RawExecution raw = engine.execute("def f():\n    return 1\n", "from impl import f\n", 7.5);
    EXPECT_EQ(raw.exit_code, 0);
    EXPECT_NE(raw.stdout_text.find("2 passed"), std::string::npos);

    ASSERT_EQ(fake->runs(), 1u);
    EXPECT_EQ(fake->candidates[0], "def f():\n    return 1\n");
    EXPECT_EQ(fake->oracles[0], "from impl import f\n");

    const BackendRequest& request = fake->requests[0];
    std::vector<std::string> command{"pytest", "test_impl.py", "-v", "--tb=short", "--no-header"};
    EXPECT_EQ(request.command, command);
    EXPECT_DOUBLE_EQ(request.timeout_seconds, 7.5);
    EXPECT_EQ(request.limits.memory_limit, "64m");
    EXPECT_TRUE(request.limits.network_disabled);
    EXPECT_TRUE(request.limits.filesystem_read_only);
    auto env = request.environment;
    EXPECT_NE(std::find(env.begin(), env.end(), std::make_pair(std::string("PYTHONDONTWRITEBYTECODE"),
                                                               std::string("1"))),
              env.end());

    EXPECT_FALSE(fs::exists(request.workspace));  // workspace is gone after the run
}

TEST(SandboxTest, EngineDefaultsToConfiguredTimeout) {
    auto backend = std::make_unique<ScriptedBackend>();
    ScriptedBackend* fake = backend.get();

    SandboxConfig config;
    config.execution_timeout = 12.0;
    SandboxEngine engine(config, std::move(backend));

    engine.execute("a = 1\n", "", 0.0);
    engine.execute("a = 1\n", "", 3.0);
    ASSERT_EQ(fake->runs(), 2u);
    EXPECT_DOUBLE_EQ(fake->requests[0].timeout_seconds, 12.0);
    EXPECT_DOUBLE_EQ(fake->requests[1].timeout_seconds, 3.0);
}

TEST(SandboxTest, EngineIsolatesRuns) {
    auto backend = std::make_unique<ScriptedBackend>();
    ScriptedBackend* fake = backend.get();
    SandboxEngine engine({}, std::move(backend));

    engine.execute("a = 1\n", "", 1.0);
    engine.execute("b = 2\n", "", 1.0);
    ASSERT_EQ(fake->runs(), 2u);
    EXPECT_NE(fake->requests[0].workspace, fake->requests[1].workspace);
    EXPECT_EQ(fake->candidates[1], "b = 2\n");
}

TEST(SandboxTest, EngineInfrastructureErrorPropagates) {
    auto backend = std::make_unique<ScriptedBackend>();
    backend->unreachable = true;
    SandboxEngine engine({}, std::move(backend));
    EXPECT_THROW(engine.execute("x = 1\n", "", 1.0), InfrastructureError);
}

TEST(SandboxTest, EnginePreCancelledSkipsBackend) {
    auto backend = std::make_unique<ScriptedBackend>();
    ScriptedBackend* fake = backend.get();
    SandboxEngine engine({}, std::move(backend));

    CancellationToken token;
    token.cancel();
    RawExecution raw = engine.execute("x = 1\n", "", 1.0, &token);
    EXPECT_TRUE(raw.cancelled);
    EXPECT_EQ(fake->runs(), 0u);
}

TEST(SandboxTest, EngineInitialize) {
    auto backend = std::make_unique<ScriptedBackend>();
    backend->leaked = 3;
    ScriptedBackend* fake = backend.get();
    SandboxEngine engine({}, std::move(backend));
    EXPECT_NO_THROW(engine.initialize());
    EXPECT_EQ(fake->leaked, 0);

    auto down = std::make_unique<ScriptedBackend>();
    down->unavailable = true;
    SandboxEngine unavailable({}, std::move(down));
    EXPECT_THROW(unavailable.initialize(), InfrastructureError);

    EXPECT_THROW(SandboxEngine({}, nullptr), InfrastructureError);
}

TEST(SandboxTest, DockerSandboxFactory) {
    Workspace bin;
    SandboxConfig config;
    config.docker_binary = makeFakeDocker(bin, "true");
    auto engine = makeDockerSandbox(config);
    EXPECT_EQ(engine->backend().name(), "docker");
    EXPECT_NO_THROW(engine->initialize());
}
