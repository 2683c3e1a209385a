#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rangeio::logging {

/// Shared logger that discards everything. Used wherever no logger was injected.
std::shared_ptr<spdlog::logger> nullLogger();

/// Returns `logger` when set, otherwise nullLogger().
std::shared_ptr<spdlog::logger> orNull(std::shared_ptr<spdlog::logger> logger);

/// Colored stderr logger for command line tools.
std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name,
                                                  spdlog::level::level_enum level);

/// "trace" | "debug" | "info" | "warn" | "error" | "off"
std::optional<spdlog::level::level_enum> parseLevel(std::string_view name);

} // namespace rangeio::logging
