#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

struct lua_State;

namespace nbfs::lua {

class LuaState;

/// Everything needed to serve one source directory at one mount point.
struct MountConfig {
    fs::path source_dir;  ///< Host directory holding the notebooks
    fs::path mount_point; ///< Where the synthetic tree appears
    bool write_mode = false; ///< Accepted for compatibility; has no effect
    bool single_threaded = false;
    bool debug = false;
    std::string notebook_extension = ".ipynb";
    size_t content_cache_entries = 64;
    u64 content_cache_bytes = 64ull * 1024 * 1024;
    std::string log_level = "info";
    fs::path log_file;
};

/// Runs a Lua configuration script and copies the globals it sets into a
/// MountConfig. Globals the script leaves unset keep their current value.
///
/// Recognized globals: notebook_extension, content_cache_entries,
/// content_cache_bytes, log_level, log_file, single_threaded.
/// The script sees SourceDir and MountPoint, and may call LOG/WARN.
class ConfigLoader {
public:
    Result<void> load_file(LuaState& state, const fs::path& script,
                           MountConfig& config);

    /// Same as load_file, for an in-memory script.
    Result<void> load_string(LuaState& state, std::string_view code,
                             MountConfig& config);

private:
    void prepare(LuaState& state, const MountConfig& config);
    Result<void> read_globals(lua_State* L, MountConfig& config);
};

} // namespace nbfs::lua
