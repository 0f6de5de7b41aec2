#include "lua/config_loader.hpp"
#include "core/log.hpp"
#include "lua/lua_state.hpp"

#include <cmath>
#include <spdlog/spdlog.h>

extern "C" {
#include <lua.h>
#include <lauxlib.h>
}

namespace nbfs::lua {

namespace {

/// Concatenate all Lua arguments into a single string.
std::string lua_concat_args(lua_State* L) {
    int n = lua_gettop(L);
    std::string result;
    for (int i = 1; i <= n; i++) {
        if (lua_isstring(L, i)) {
            result += lua_tostring(L, i);
        } else if (lua_isnil(L, i)) {
            result += "nil";
        } else if (lua_isboolean(L, i)) {
            result += lua_toboolean(L, i) ? "true" : "false";
        } else {
            result += lua_typename(L, lua_type(L, i));
        }
    }
    return result;
}

int l_LOG(lua_State* L) {
    spdlog::info("config: {}", lua_concat_args(L));
    return 0;
}

int l_WARN(lua_State* L) {
    spdlog::warn("config: {}", lua_concat_args(L));
    return 0;
}

Error type_error(const char* name, const char* expected) {
    return Error(ErrorKind::Config,
                 std::string("'") + name + "' must be a " + expected);
}

/// Pushes global `name`; the caller pops it.
int push_global(lua_State* L, const char* name) {
    lua_getglobal(L, name);
    return lua_type(L, -1);
}

Result<void> read_string(lua_State* L, const char* name, std::string& out) {
    int type = push_global(L, name);
    if (type == LUA_TNIL) {
        lua_pop(L, 1);
        return {};
    }
    if (type != LUA_TSTRING) {
        lua_pop(L, 1);
        return type_error(name, "string");
    }
    out = lua_tostring(L, -1);
    lua_pop(L, 1);
    return {};
}

Result<void> read_count(lua_State* L, const char* name, u64& out) {
    int type = push_global(L, name);
    if (type == LUA_TNIL) {
        lua_pop(L, 1);
        return {};
    }
    if (type != LUA_TNUMBER) {
        lua_pop(L, 1);
        return type_error(name, "number");
    }
    double value = lua_tonumber(L, -1);
    lua_pop(L, 1);
    // 2^64: the first double past the u64 range
    if (!std::isfinite(value) || value < 0 || value >= 18446744073709551616.0 ||
        std::floor(value) != value) {
        return type_error(name, "non-negative integer");
    }
    out = static_cast<u64>(value);
    return {};
}

Result<void> read_bool(lua_State* L, const char* name, bool& out) {
    int type = push_global(L, name);
    if (type == LUA_TNIL) {
        lua_pop(L, 1);
        return {};
    }
    if (type != LUA_TBOOLEAN) {
        lua_pop(L, 1);
        return type_error(name, "boolean");
    }
    out = lua_toboolean(L, -1) != 0;
    lua_pop(L, 1);
    return {};
}

} // namespace

void ConfigLoader::prepare(LuaState& state, const MountConfig& config) {
    state.register_function("LOG", l_LOG);
    state.register_function("WARN", l_WARN);
    state.set_global_string("SourceDir", config.source_dir.string().c_str());
    state.set_global_string("MountPoint", config.mount_point.string().c_str());
}

Result<void> ConfigLoader::load_file(LuaState& state, const fs::path& script,
                                     MountConfig& config) {
    prepare(state, config);

    spdlog::info("Executing config file: {}", script.string());
    auto result = state.do_file(script);
    if (!result) {
        return Error(ErrorKind::Config,
                     "Failed to execute config file: " + result.error().message);
    }
    return read_globals(state.raw(), config);
}

Result<void> ConfigLoader::load_string(LuaState& state, std::string_view code,
                                       MountConfig& config) {
    prepare(state, config);

    auto result = state.do_string(code);
    if (!result) {
        return Error(ErrorKind::Config,
                     "Failed to execute config: " + result.error().message);
    }
    return read_globals(state.raw(), config);
}

Result<void> ConfigLoader::read_globals(lua_State* L, MountConfig& config) {
    // Read into a copy so a bad script leaves the caller's config untouched
    MountConfig next = config;

    std::string log_file = next.log_file.string();
    u64 entries = next.content_cache_entries;

    if (auto r = read_string(L, "notebook_extension", next.notebook_extension); !r)
        return r;
    if (auto r = read_count(L, "content_cache_entries", entries); !r)
        return r;
    if (auto r = read_count(L, "content_cache_bytes", next.content_cache_bytes); !r)
        return r;
    if (auto r = read_string(L, "log_level", next.log_level); !r)
        return r;
    if (auto r = read_string(L, "log_file", log_file); !r)
        return r;
    if (auto r = read_bool(L, "single_threaded", next.single_threaded); !r)
        return r;

    if (next.notebook_extension.empty() ||
        next.notebook_extension.find('/') != std::string::npos) {
        return Error(ErrorKind::Config,
                     "'notebook_extension' must be a non-empty filename suffix");
    }
    if (!log::parse_level(next.log_level)) {
        return Error(ErrorKind::Config,
                     "unknown log_level '" + next.log_level + "'");
    }

    next.content_cache_entries = static_cast<size_t>(entries);
    next.log_file = log_file;
    config = std::move(next);
    return {};
}

} // namespace nbfs::lua
