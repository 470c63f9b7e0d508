#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace atdd {

/// Iteration and wall-clock limits of one refinement run. The clock starts
/// at construction.
class RunBudget {
public:
    /// `max_seconds` ≤ 0 disables the wall-clock limit.
    RunBudget(int max_iterations, double max_seconds)
        : max_iterations_(max_iterations),
          max_seconds_(max_seconds),
          start_time_(std::chrono::steady_clock::now()) {}

    void recordIteration() { executed_++; }

    /// Why no further iteration may start, or nullopt while one may.
    std::optional<std::string> exhaustedReason() const {
        if (executed_ >= max_iterations_) {
            return "reached max iterations (" + std::to_string(max_iterations_) + ")";
        }
        if (max_seconds_ > 0.0 && elapsedSeconds() >= max_seconds_) {
            return "run wall-clock budget spent";
        }
        return std::nullopt;
    }

    double elapsedSeconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_).count();
    }

private:
    int max_iterations_;
    double max_seconds_;
    int executed_ = 0;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace atdd
