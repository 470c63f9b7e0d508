#include "sandbox/workspace.hpp"
#include "common/errors.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <vector>

#include <stdlib.h>

namespace fs = std::filesystem;

namespace atdd {

Workspace::Workspace(const std::string& prefix) {
    std::string tmpl = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (::mkdtemp(buf.data()) == nullptr) {
        throw WorkspaceError("cannot create workspace " + tmpl + ": " + std::strerror(errno));
    }
    path_ = buf.data();

    std::error_code ec;
    fs::permissions(path_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                               fs::perms::others_read | fs::perms::others_exec, ec);
}

Workspace::~Workspace() {
    std::error_code ec;
    fs::remove_all(path_, ec);
}

void Workspace::write(const std::string& filename, const std::string& contents) {
    if (filename.empty() || filename.find('/') != std::string::npos) {
        throw WorkspaceError("invalid workspace file name: " + filename);
    }
    fs::path target = fs::path(path_) / filename;
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.close();
    if (!out) {
        throw WorkspaceError("cannot write " + target.string());
    }

    std::error_code ec;
    fs::permissions(target, fs::perms::owner_read | fs::perms::owner_write |
                                fs::perms::group_read | fs::perms::others_read, ec);
}

} // namespace atdd
