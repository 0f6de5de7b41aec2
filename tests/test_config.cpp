#include <catch2/catch_test_macros.hpp>

#include "core/log.hpp"
#include "lua/config_loader.hpp"
#include "lua/lua_state.hpp"
#include "test_support.hpp"
#include "transport/errno_map.hpp"

#include <cerrno>

using namespace nbfs;
using namespace nbfs::lua;

TEST_CASE("Config script overrides defaults", "[config]") {
    LuaState state;
    ConfigLoader loader;
    MountConfig config;

    auto result = loader.load_string(state,
        "notebook_extension = '.nb'\n"
        "content_cache_entries = 8\n"
        "content_cache_bytes = 4096\n"
        "log_level = 'debug'\n"
        "log_file = '/tmp/fusebook.log'\n"
        "single_threaded = true\n",
        config);
    REQUIRE(result.ok());

    CHECK(config.notebook_extension == ".nb");
    CHECK(config.content_cache_entries == 8);
    CHECK(config.content_cache_bytes == 4096);
    CHECK(config.log_level == "debug");
    CHECK(config.log_file == "/tmp/fusebook.log");
    CHECK(config.single_threaded);
}

TEST_CASE("Unset globals keep their values", "[config]") {
    LuaState state;
    ConfigLoader loader;
    MountConfig config;
    config.content_cache_entries = 3;

    REQUIRE(loader.load_string(state, "LOG('configured')", config).ok());
    CHECK(config.notebook_extension == ".ipynb");
    CHECK(config.content_cache_entries == 3);
    CHECK_FALSE(config.single_threaded);
}

TEST_CASE("Config script sees the mount paths", "[config]") {
    LuaState state;
    ConfigLoader loader;
    MountConfig config;
    config.source_dir = "/data/notebooks";
    config.mount_point = "/mnt/nb";

    REQUIRE(loader.load_string(state,
        "if SourceDir == '/data/notebooks' and MountPoint == '/mnt/nb' then\n"
        "  content_cache_entries = 1\n"
        "end\n",
        config).ok());
    CHECK(config.content_cache_entries == 1);
}

TEST_CASE("Bad config scripts are rejected", "[config]") {
    LuaState state;
    ConfigLoader loader;
    MountConfig config;

    SECTION("syntax error") {
        auto r = loader.load_string(state, "this is not lua", config);
        REQUIRE_FALSE(r.ok());
        CHECK(r.error().kind == ErrorKind::Config);
    }
    SECTION("runtime error") {
        CHECK_FALSE(loader.load_string(state, "error('boom')", config).ok());
    }
    SECTION("wrong type") {
        CHECK_FALSE(loader.load_string(state, "single_threaded = 'yes'", config).ok());
        CHECK_FALSE(loader.load_string(state, "content_cache_entries = 'x'", config).ok());
    }
    SECTION("negative or fractional count") {
        CHECK_FALSE(loader.load_string(state, "content_cache_bytes = -1", config).ok());
        CHECK_FALSE(loader.load_string(state, "content_cache_entries = 1.5", config).ok());
    }
    SECTION("count outside the 64-bit range") {
        CHECK_FALSE(loader.load_string(state, "content_cache_bytes = 1/0", config).ok());
        CHECK_FALSE(loader.load_string(state, "content_cache_bytes = 2^64", config).ok());
        CHECK_FALSE(loader.load_string(state, "content_cache_bytes = 0/0", config).ok());
    }
    SECTION("unknown log level") {
        CHECK_FALSE(loader.load_string(state, "log_level = 'loud'", config).ok());
    }
    SECTION("empty extension") {
        CHECK_FALSE(loader.load_string(state, "notebook_extension = ''", config).ok());
    }

    // A rejected script leaves the config untouched
    CHECK(config.notebook_extension == ".ipynb");
    CHECK(config.content_cache_entries == 64);
    CHECK_FALSE(config.single_threaded);
}

TEST_CASE("Config file is loaded from disk", "[config]") {
    test::TempDir dir;
    auto script = dir.write("fusebook.lua", "content_cache_entries = 2\n");

    LuaState state;
    ConfigLoader loader;
    MountConfig config;
    REQUIRE(loader.load_file(state, script, config).ok());
    CHECK(config.content_cache_entries == 2);

    CHECK_FALSE(loader.load_file(state, dir.path() / "missing.lua", config).ok());
}

TEST_CASE("Log level names", "[config]") {
    CHECK(nbfs::log::parse_level("info") == spdlog::level::info);
    CHECK(nbfs::log::parse_level("warn") == spdlog::level::warn);
    CHECK(nbfs::log::parse_level("error") == spdlog::level::err);
    CHECK_FALSE(nbfs::log::parse_level("verbose").has_value());
}

TEST_CASE("Error kinds map to errno values", "[config]") {
    using transport::errno_for;
    CHECK(errno_for(ErrorKind::NotFound) == ENOENT);
    CHECK(errno_for(ErrorKind::ParseError) == ENOENT);
    CHECK(errno_for(ErrorKind::IsADirectory) == EISDIR);
    CHECK(errno_for(ErrorKind::NotADirectory) == ENOTDIR);
    CHECK(errno_for(ErrorKind::ReadOnly) == EROFS);
    CHECK(errno_for(ErrorKind::Io) == EIO);
    CHECK(errno_for(ErrorKind::Config) == EINVAL);
}

TEST_CASE("Lua state runs chunks and reports errors", "[lua]") {
    LuaState state;
    REQUIRE(state.raw() != nullptr);
    CHECK(state.do_string("x = string.len('abc') + math.floor(1.5)").ok());

    auto bad = state.do_string("local t = nil; t.field = 1");
    REQUIRE_FALSE(bad.ok());
    CHECK(bad.error().kind == ErrorKind::Config);

    // io and os are not opened for configuration scripts
    CHECK_FALSE(state.do_string("io.write('x')").ok());
    CHECK_FALSE(state.do_string("os.exit(1)").ok());
}

TEST_CASE("Lua state skips a UTF-8 byte order mark", "[lua]") {
    LuaState state;
    std::string code = "\xEF\xBB\xBF" "y = 1";
    CHECK(state.do_buffer(code.data(), code.size(), "=bom").ok());
}
