#pragma once

#include "notebook/notebook_repository.hpp"
#include "vfs/content_cache.hpp"
#include "vfs/filesystem_operations.hpp"
#include "vfs/path_resolver.hpp"

#include <atomic>

namespace nbfs::vfs {

/// Read-only notebook filesystem. Every callback resolves its path afresh;
/// the only shared state is the repository and the content cache.
class FilesystemAdapter : public FilesystemOperations {
public:
    static constexpr u32 DIRECTORY_PERMISSIONS = 0555;
    static constexpr u32 FILE_PERMISSIONS = 0444;

    explicit FilesystemAdapter(
        notebook::NotebookRepository& repository,
        size_t cache_entries = ContentCache::DEFAULT_MAX_ENTRIES,
        u64 cache_bytes = ContentCache::DEFAULT_MAX_BYTES);

    Result<FileAttributes> get_attributes(std::string_view path) override;
    Result<std::vector<std::string>> read_directory(
        std::string_view path) override;
    Result<u64> open(std::string_view path) override;
    Result<std::string> read(std::string_view path, u64 offset,
                             u64 length) override;

    Result<void> write(std::string_view path, std::string_view data,
                       u64 offset) override;
    Result<void> create(std::string_view path, u32 mode) override;
    Result<void> unlink(std::string_view path) override;
    Result<void> mkdir(std::string_view path, u32 mode) override;
    Result<void> rmdir(std::string_view path) override;
    Result<void> rename(std::string_view from, std::string_view to) override;
    Result<void> truncate(std::string_view path, u64 size) override;
    Result<void> chmod(std::string_view path, u32 mode) override;

    ContentCache& content_cache() { return cache_; }

private:
    /// Full byte content of a file entity, through the content cache.
    Result<ContentCache::Content> render(const VirtualEntity& entity);

    Result<void> refuse(const char* operation, std::string_view path) const;

    notebook::NotebookRepository& repository_;
    PathResolver resolver_;
    ContentCache cache_;
    std::atomic<u64> next_handle_{1};
};

} // namespace nbfs::vfs
