#pragma once

#include <string>

namespace atdd {

/// Private temporary directory, removed with everything in it when the
/// object is destroyed. Throws WorkspaceError on creation or write failure.
class Workspace {
public:
    explicit Workspace(const std::string& prefix = "atdd-");
    ~Workspace();

    Workspace(const Workspace&) = delete;
    Workspace& operator=(const Workspace&) = delete;

    /// Write `contents` to `filename` inside the workspace, world-readable
    /// so an unprivileged container user can import it.
    void write(const std::string& filename, const std::string& contents);

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace atdd
