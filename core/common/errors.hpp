#pragma once

#include <stdexcept>
#include <string>

namespace atdd {

// ─── Error Taxonomy ────────────────────────────────────────────
// Only infrastructure-class failures escape a component. Candidate
// failures (syntax, runtime, timeout) travel as data instead.

/// Isolation backend unreachable or unusable. Fatal, never retried.
class InfrastructureError : public std::runtime_error {
public:
    explicit InfrastructureError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Candidate generator failed to produce source text.
class GenerationError : public std::runtime_error {
public:
    explicit GenerationError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Unreadable configuration or out-of-range configuration value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what)
        : std::runtime_error(what) {}
};

/// Ephemeral workspace could not be created or written.
class WorkspaceError : public std::runtime_error {
public:
    explicit WorkspaceError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace atdd
