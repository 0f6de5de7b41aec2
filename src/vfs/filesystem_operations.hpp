#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "vfs/virtual_entity.hpp"

#include <chrono>
#include <string>
#include <string_view>
#include <vector>

namespace nbfs::vfs {

struct FileAttributes {
    EntryKind kind = EntryKind::File;
    u64 size = 0;
    u32 mode = 0; ///< POSIX type and permission bits (st_mode)
    u32 nlink = 1;
    std::chrono::system_clock::time_point mtime{};
};

/// Path-based filesystem callbacks, independent of any transport library.
/// A transport binding translates its native requests into these calls.
class FilesystemOperations {
public:
    virtual ~FilesystemOperations() = default;

    virtual Result<FileAttributes> get_attributes(std::string_view path) = 0;

    /// Entry names including "." and "..".
    virtual Result<std::vector<std::string>> read_directory(
        std::string_view path) = 0;

    /// Validate a file for reading and return an opaque handle.
    virtual Result<u64> open(std::string_view path) = 0;

    /// Bytes [offset, offset+length) clipped to the content; empty past EOF.
    virtual Result<std::string> read(std::string_view path, u64 offset,
                                     u64 length) = 0;

    // Mutating callbacks.
    virtual Result<void> write(std::string_view path, std::string_view data,
                               u64 offset) = 0;
    virtual Result<void> create(std::string_view path, u32 mode) = 0;
    virtual Result<void> unlink(std::string_view path) = 0;
    virtual Result<void> mkdir(std::string_view path, u32 mode) = 0;
    virtual Result<void> rmdir(std::string_view path) = 0;
    virtual Result<void> rename(std::string_view from,
                                std::string_view to) = 0;
    virtual Result<void> truncate(std::string_view path, u64 size) = 0;
    virtual Result<void> chmod(std::string_view path, u32 mode) = 0;
};

} // namespace nbfs::vfs
