#pragma once

#include <filesystem>
#include <optional>
#include <spdlog/spdlog.h>
#include <string_view>

namespace nbfs::log {

/// Initialize logging with a stderr sink and, if log_file is non-empty,
/// an appending file sink.
void init(spdlog::level::level_enum level,
          const std::filesystem::path& log_file = {});

/// Parse "trace", "debug", "info", "warn", "error" (or "off").
std::optional<spdlog::level::level_enum> parse_level(std::string_view name);

/// Flush and shutdown logging.
void shutdown();

} // namespace nbfs::log
