#define FUSE_USE_VERSION 35

#include "transport/fuse_binding.hpp"
#include "transport/errno_map.hpp"
#include "vfs/filesystem_operations.hpp"

#include <fuse3/fuse.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <vector>

namespace nbfs::transport {

namespace {

vfs::FilesystemOperations& operations() {
    return *static_cast<vfs::FilesystemOperations*>(
        fuse_get_context()->private_data);
}

int fail(const Error& err, const char* op, const char* path) {
    spdlog::debug("{} {}: {} ({})", op, path, err.message,
                  error_kind_name(err.kind));
    return -errno_for(err.kind);
}

void* nb_init(struct fuse_conn_info*, struct fuse_config* cfg) {
    // Content can change when a notebook is rewritten on the host
    cfg->kernel_cache = 0;
    cfg->attr_timeout = 1.0;
    cfg->entry_timeout = 1.0;
    return fuse_get_context()->private_data;
}

int nb_getattr(const char* path, struct stat* st, struct fuse_file_info*) {
    auto attr = operations().get_attributes(path);
    if (!attr) return fail(attr.error(), "getattr", path);

    std::memset(st, 0, sizeof(*st));
    const auto& a = attr.value();
    st->st_mode = static_cast<mode_t>(a.mode);
    st->st_nlink = a.nlink;
    st->st_size = static_cast<off_t>(a.size);
    st->st_uid = getuid();
    st->st_gid = getgid();

    auto since_epoch = a.mtime.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos =
        std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs);
    st->st_mtim.tv_sec = static_cast<time_t>(secs.count());
    st->st_mtim.tv_nsec = static_cast<long>(nanos.count());
    st->st_atim = st->st_mtim;
    st->st_ctim = st->st_mtim;
    return 0;
}

int nb_readdir(const char* path, void* buf, fuse_fill_dir_t filler, off_t,
               struct fuse_file_info*, enum fuse_readdir_flags) {
    auto names = operations().read_directory(path);
    if (!names) return fail(names.error(), "readdir", path);

    for (const auto& name : names.value()) {
        if (filler(buf, name.c_str(), nullptr, 0,
                   static_cast<fuse_fill_dir_flags>(0)) != 0) {
            break;
        }
    }
    return 0;
}

int nb_open(const char* path, struct fuse_file_info* fi) {
    if ((fi->flags & O_ACCMODE) != O_RDONLY) {
        return -EROFS;
    }
    auto handle = operations().open(path);
    if (!handle) return fail(handle.error(), "open", path);
    fi->fh = handle.value();
    return 0;
}

int nb_read(const char* path, char* buf, size_t size, off_t offset,
            struct fuse_file_info*) {
    if (offset < 0) return -EINVAL;

    auto bytes = operations().read(path, static_cast<u64>(offset), size);
    if (!bytes) return fail(bytes.error(), "read", path);

    std::memcpy(buf, bytes.value().data(), bytes.value().size());
    return static_cast<int>(bytes.value().size());
}

int nb_write(const char* path, const char* buf, size_t size, off_t offset,
             struct fuse_file_info*) {
    auto res = operations().write(path, std::string_view(buf, size),
                                  static_cast<u64>(offset));
    if (!res) return fail(res.error(), "write", path);
    return static_cast<int>(size);
}

int nb_create(const char* path, mode_t mode, struct fuse_file_info*) {
    auto res = operations().create(path, mode);
    return res ? 0 : fail(res.error(), "create", path);
}

int nb_unlink(const char* path) {
    auto res = operations().unlink(path);
    return res ? 0 : fail(res.error(), "unlink", path);
}

int nb_mkdir(const char* path, mode_t mode) {
    auto res = operations().mkdir(path, mode);
    return res ? 0 : fail(res.error(), "mkdir", path);
}

int nb_rmdir(const char* path) {
    auto res = operations().rmdir(path);
    return res ? 0 : fail(res.error(), "rmdir", path);
}

int nb_rename(const char* from, const char* to, unsigned int) {
    auto res = operations().rename(from, to);
    return res ? 0 : fail(res.error(), "rename", from);
}

int nb_truncate(const char* path, off_t size, struct fuse_file_info*) {
    auto res = operations().truncate(path, static_cast<u64>(size));
    return res ? 0 : fail(res.error(), "truncate", path);
}

int nb_chmod(const char* path, mode_t mode, struct fuse_file_info*) {
    auto res = operations().chmod(path, mode);
    return res ? 0 : fail(res.error(), "chmod", path);
}

} // namespace

int run_fuse(vfs::FilesystemOperations& ops, const MountOptions& options,
             const char* program_name) {
    struct fuse_operations fops;
    std::memset(&fops, 0, sizeof(fops));
    fops.init = nb_init;
    fops.getattr = nb_getattr;
    fops.readdir = nb_readdir;
    fops.open = nb_open;
    fops.read = nb_read;
    fops.write = nb_write;
    fops.create = nb_create;
    fops.unlink = nb_unlink;
    fops.mkdir = nb_mkdir;
    fops.rmdir = nb_rmdir;
    fops.rename = nb_rename;
    fops.truncate = nb_truncate;
    fops.chmod = nb_chmod;

    std::vector<std::string> args = {
        program_name,
        options.mount_point.string(),
        "-f",
        "-o",
        "ro,fsname=" + options.fs_name + ",subtype=fusebook",
    };
    if (options.single_threaded) args.emplace_back("-s");
    if (options.debug) args.emplace_back("-d");

    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    spdlog::info("Mounting at {} ({})", options.mount_point.string(),
                 options.single_threaded ? "single-threaded"
                                         : "multi-threaded");
    return fuse_main(static_cast<int>(args.size()), argv.data(), &fops, &ops);
}

} // namespace nbfs::transport
