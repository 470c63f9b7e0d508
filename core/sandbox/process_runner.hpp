#pragma once

#include "common/cancellation.hpp"
#include "logging/logger.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace atdd {

struct ProcessOptions {
    double timeout_seconds = 0.0;             // 0 = no deadline
    size_t max_output_bytes = 4 * 1024 * 1024; // per stream; the rest is drained and dropped
};

struct ProcessResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = -1;          // 128 + signal when killed by a signal
    bool timed_out = false;
    bool cancelled = false;
    bool truncated = false;
    double duration_seconds = 0.0;
};

/// Process Runner: spawns a child with captured stdout/stderr and waits
/// for it under a deadline. On deadline or cancellation the child is
/// killed with SIGKILL and whatever it wrote so far is returned.
class ProcessRunner {
public:
    explicit ProcessRunner(LoggerPtr logger = nullptr);

    /// Throws InfrastructureError when the executable cannot be spawned.
    ProcessResult run(const std::vector<std::string>& argv,
                      const ProcessOptions& options = {},
                      const CancellationToken* cancel = nullptr) const;

private:
    LoggerPtr logger_;
};

} // namespace atdd
