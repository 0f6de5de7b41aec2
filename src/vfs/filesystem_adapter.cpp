#include "vfs/filesystem_adapter.hpp"

#include <algorithm>
#include <spdlog/spdlog.h>
#include <sys/stat.h>

namespace nbfs::vfs {

namespace {

std::chrono::system_clock::time_point to_system_time(fs::file_time_type t) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(t));
}

FileAttributes directory_attributes(std::chrono::system_clock::time_point mtime) {
    FileAttributes attr;
    attr.kind = EntryKind::Directory;
    attr.mode = S_IFDIR | FilesystemAdapter::DIRECTORY_PERMISSIONS;
    attr.nlink = 2;
    attr.mtime = mtime;
    return attr;
}

} // namespace

FilesystemAdapter::FilesystemAdapter(notebook::NotebookRepository& repository,
                                     size_t cache_entries, u64 cache_bytes)
    : repository_(repository),
      resolver_(repository),
      cache_(cache_entries, cache_bytes) {}

Result<ContentCache::Content> FilesystemAdapter::render(
    const VirtualEntity& entity) {
    if (entity_kind(entity) == EntryKind::Directory) {
        return Error(ErrorKind::IsADirectory,
                     PathResolver::entity_path(entity) + " is a directory");
    }

    const auto& snapshot = *entity_snapshot(entity);

    auto path = PathResolver::entity_path(entity);
    auto key = ContentCache::make_key(path, snapshot->last_loaded_mod_time);
    if (auto cached = cache_.find(key)) {
        return cached;
    }

    std::string bytes;
    if (const auto* cell_file = std::get_if<CellFileEntity>(&entity)) {
        bytes = snapshot->cells[cell_file->cell].source;
    } else {
        const auto& out = std::get<OutputFileEntity>(entity);
        bytes = snapshot->cells[out.cell]
                    .outputs[out.output]
                    .bundle[out.mime]
                    .payload;
    }

    auto content = std::make_shared<const std::string>(std::move(bytes));
    cache_.insert(key, content);
    return ContentCache::Content(content);
}

Result<FileAttributes> FilesystemAdapter::get_attributes(
    std::string_view path) {
    auto entity = resolver_.resolve(path);
    if (!entity) {
        return entity.error();
    }

    if (std::holds_alternative<RootEntity>(entity.value())) {
        std::error_code ec;
        auto mtime = fs::last_write_time(repository_.root(), ec);
        return directory_attributes(
            ec ? std::chrono::system_clock::now() : to_system_time(mtime));
    }
    if (const auto* dir = std::get_if<NotebookDirEntity>(&entity.value())) {
        return directory_attributes(
            to_system_time(dir->snapshot->last_loaded_mod_time));
    }

    auto content = render(entity.value());
    if (!content) {
        return content.error();
    }

    const auto& snapshot = *entity_snapshot(entity.value());

    FileAttributes attr;
    attr.kind = EntryKind::File;
    attr.size = content.value()->size();
    attr.mode = S_IFREG | FILE_PERMISSIONS;
    attr.nlink = 1;
    attr.mtime = to_system_time(snapshot->last_loaded_mod_time);
    return attr;
}

Result<std::vector<std::string>> FilesystemAdapter::read_directory(
    std::string_view path) {
    auto entity = resolver_.resolve(path);
    if (!entity) {
        return entity.error();
    }

    auto children = resolver_.list_children(entity.value());
    if (!children) {
        return children.error();
    }

    std::vector<std::string> names;
    names.reserve(children.value().size() + 2);
    names.emplace_back(".");
    names.emplace_back("..");
    for (auto& child : children.value()) {
        names.push_back(std::move(child.name));
    }
    return names;
}

Result<u64> FilesystemAdapter::open(std::string_view path) {
    auto entity = resolver_.resolve(path);
    if (!entity) {
        return entity.error();
    }

    auto content = render(entity.value());
    if (!content) {
        return content.error();
    }

    u64 handle = next_handle_.fetch_add(1);
    spdlog::trace("open {} -> handle {}", path, handle);
    return handle;
}

Result<std::string> FilesystemAdapter::read(std::string_view path,
                                            u64 offset, u64 length) {
    auto entity = resolver_.resolve(path);
    if (!entity) {
        return entity.error();
    }

    auto content = render(entity.value());
    if (!content) {
        return content.error();
    }

    const auto& bytes = *content.value();
    if (offset >= bytes.size()) {
        return std::string();
    }
    auto count = std::min<u64>(length, bytes.size() - offset);
    return bytes.substr(static_cast<size_t>(offset),
                        static_cast<size_t>(count));
}

Result<void> FilesystemAdapter::refuse(const char* operation,
                                       std::string_view path) const {
    spdlog::debug("{} {}: refused, filesystem is read-only", operation, path);
    return Error(ErrorKind::ReadOnly,
                 std::string(operation) + " " + std::string(path) +
                     ": read-only filesystem");
}

Result<void> FilesystemAdapter::write(std::string_view path, std::string_view,
                                      u64) {
    return refuse("write", path);
}

Result<void> FilesystemAdapter::create(std::string_view path, u32) {
    return refuse("create", path);
}

Result<void> FilesystemAdapter::unlink(std::string_view path) {
    return refuse("unlink", path);
}

Result<void> FilesystemAdapter::mkdir(std::string_view path, u32) {
    return refuse("mkdir", path);
}

Result<void> FilesystemAdapter::rmdir(std::string_view path) {
    return refuse("rmdir", path);
}

Result<void> FilesystemAdapter::rename(std::string_view from,
                                       std::string_view) {
    return refuse("rename", from);
}

Result<void> FilesystemAdapter::truncate(std::string_view path, u64) {
    return refuse("truncate", path);
}

Result<void> FilesystemAdapter::chmod(std::string_view path, u32) {
    return refuse("chmod", path);
}

} // namespace nbfs::vfs
