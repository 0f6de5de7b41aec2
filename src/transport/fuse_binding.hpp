#pragma once

#include "core/types.hpp"

#include <string>

namespace nbfs::vfs {
class FilesystemOperations;
}

namespace nbfs::transport {

struct MountOptions {
    fs::path mount_point;
    bool single_threaded = false; ///< libfuse -s
    bool debug = false;           ///< libfuse -d
    std::string fs_name = "fusebook";
};

/// Mount `ops` with libfuse 3 and serve requests in the foreground until
/// unmounted. Returns libfuse's exit status (non-zero if the mount point is
/// invalid or already in use).
int run_fuse(vfs::FilesystemOperations& ops, const MountOptions& options,
             const char* program_name);

} // namespace nbfs::transport
