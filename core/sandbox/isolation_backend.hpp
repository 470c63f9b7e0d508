#pragma once

#include "common/cancellation.hpp"
#include "outcome/test_outcome.hpp"
#include <string>
#include <utility>
#include <vector>

namespace atdd {

// ─── Resource Limits ───────────────────────────────────────────

struct ResourceLimits {
    std::string memory_limit = "50m";   // docker size syntax; swap is capped to the same value
    int cpu_quota = 50000;              // microseconds per period
    int cpu_period = 100000;
    int pids_limit = 64;
    bool network_disabled = true;
    bool filesystem_read_only = true;
};

// ─── Backend Request ───────────────────────────────────────────

struct BackendRequest {
    std::string workspace;              // host directory, mounted read-only
    ResourceLimits limits;
    double timeout_seconds = 30.0;
    std::vector<std::string> command;
    std::vector<std::pair<std::string, std::string>> environment;
};

/// Raw streams and status of one isolated run.
using BackendResult = RawExecution;

// ─── Isolation Backend ─────────────────────────────────────────
// Abstract base class for the isolation primitive supplied by the host.

class IsolationBackend {
public:
    virtual ~IsolationBackend() = default;

    /// Throws InfrastructureError when the backend cannot be used.
    virtual void ensureAvailable() = 0;

    /// Runs one request to completion, timeout or cancellation.
    /// A timed-out run reports kTimeoutExitCode. Throws InfrastructureError
    /// only when the backend itself is unreachable.
    virtual BackendResult run(const BackendRequest& request, const CancellationToken* cancel) = 0;

    /// Removes environments leaked by earlier runs. Returns how many were removed.
    virtual int collectGarbage() = 0;

    virtual std::string name() const = 0;
};

} // namespace atdd
