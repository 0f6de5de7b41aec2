#include "core/log.hpp"
#include "core/types.hpp"
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "notebook/notebook_repository.hpp"
#include "transport/fuse_binding.hpp"
#include "vfs/filesystem_adapter.hpp"

#include <cstring>
#include <iostream>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace {

struct CommandLine {
    std::vector<std::string> positional;
    std::optional<nbfs::fs::path> config_file;
    std::optional<nbfs::fs::path> log_file;
    std::optional<std::string> log_level;
    bool single_threaded = false;
    bool debug = false;
    bool write_mode = false;
    bool help = false;
};

void print_usage() {
    std::cout << "fusebook v0.1.0\n"
              << "Browse Jupyter notebooks as directories of cells and outputs\n\n"
              << "Usage:\n"
              << "  fusebook [options] <source-dir> <mount-point>\n\n"
              << "Options:\n"
              << "  --config <file>     Lua configuration script\n"
              << "  --single-threaded   Serve one request at a time\n"
              << "  --debug             Debug logging and libfuse request tracing\n"
              << "  --log-level <lvl>   trace, debug, info, warn, error\n"
              << "  --log-file <file>   Also append log output to a file\n"
              << "  --rw                Accepted for compatibility; the mount is read-only\n"
              << "  --help              Show this help message\n";
}

std::optional<CommandLine> parse_args(int argc, char* argv[]) {
    CommandLine cli;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            cli.config_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log-file") == 0 && i + 1 < argc) {
            cli.log_file = argv[++i];
        } else if (std::strcmp(argv[i], "--log-level") == 0 && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (std::strcmp(argv[i], "--single-threaded") == 0 ||
                   std::strcmp(argv[i], "-s") == 0) {
            cli.single_threaded = true;
        } else if (std::strcmp(argv[i], "--debug") == 0 ||
                   std::strcmp(argv[i], "-d") == 0) {
            cli.debug = true;
        } else if (std::strcmp(argv[i], "--rw") == 0) {
            cli.write_mode = true;
        } else if (std::strcmp(argv[i], "--help") == 0 ||
                   std::strcmp(argv[i], "-h") == 0) {
            cli.help = true;
        } else if (argv[i][0] == '-') {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            return std::nullopt;
        } else {
            cli.positional.emplace_back(argv[i]);
        }
    }

    return cli;
}

} // namespace

int main(int argc, char* argv[]) {
    auto cli = parse_args(argc, argv);
    if (!cli) {
        print_usage();
        return 1;
    }
    if (cli->help) {
        print_usage();
        return 0;
    }
    if (cli->positional.size() != 2) {
        print_usage();
        return 1;
    }

    nbfs::lua::MountConfig config;
    config.source_dir = cli->positional[0];
    config.mount_point = cli->positional[1];

    if (cli->config_file) {
        nbfs::lua::LuaState state;
        nbfs::lua::ConfigLoader loader;
        auto loaded = loader.load_file(state, *cli->config_file, config);
        if (!loaded) {
            spdlog::error("{}", loaded.error().message);
            return 1;
        }
    }

    // Explicit command-line flags win over the config script
    if (cli->single_threaded) config.single_threaded = true;
    if (cli->write_mode) config.write_mode = true;
    if (cli->log_file) config.log_file = *cli->log_file;
    if (cli->log_level) config.log_level = *cli->log_level;
    if (cli->debug) {
        config.debug = true;
        config.log_level = "debug";
    }

    auto level = nbfs::log::parse_level(config.log_level);
    if (!level) {
        spdlog::error("Unknown log level: {}", config.log_level);
        return 1;
    }
    nbfs::log::init(*level, config.log_file);

    std::error_code ec;
    if (!nbfs::fs::is_directory(config.source_dir, ec)) {
        spdlog::error("Source directory not found: {}",
                      config.source_dir.string());
        return 1;
    }
    if (!nbfs::fs::is_directory(config.mount_point, ec)) {
        spdlog::error("Mount point is not a directory: {}",
                      config.mount_point.string());
        return 1;
    }
    if (config.write_mode) {
        spdlog::warn("Write mode is not supported; mounting read-only");
    }

    auto source = nbfs::fs::canonical(config.source_dir, ec);
    if (ec) {
        spdlog::error("Cannot resolve {}: {}", config.source_dir.string(),
                      ec.message());
        return 1;
    }

    nbfs::notebook::NotebookRepository repository(source,
                                                  config.notebook_extension);
    nbfs::vfs::FilesystemAdapter adapter(repository,
                                         config.content_cache_entries,
                                         config.content_cache_bytes);

    spdlog::info("Source:  {} ({} notebooks)", source.string(),
                 repository.list_names().size());

    nbfs::transport::MountOptions options;
    options.mount_point = config.mount_point;
    options.single_threaded = config.single_threaded;
    options.debug = config.debug;

    int status = nbfs::transport::run_fuse(adapter, options, argv[0]);
    if (status != 0) {
        spdlog::error("Mount at {} failed or ended abnormally (status {})",
                      config.mount_point.string(), status);
    }

    nbfs::log::shutdown();
    return status == 0 ? 0 : 1;
}
