#pragma once

#include <rangeio/core/types.h>
#include <rangeio/http/http_client.hpp>
#include <rangeio/stream/retry.hpp>

#include <spdlog/common.h>

#include <filesystem>

namespace rangeio::config {

struct StreamSettings {
    int attempts{stream::kDefaultAttempts};
    stream::BackoffPolicy backoff{};
};

/**
 * Everything a config file can set. Defaults match the library defaults, so an absent file
 * changes nothing.
 */
struct RangeioConfig {
    http::ClientConfig http{};
    StreamSettings stream{};
    spdlog::level::level_enum logLevel{spdlog::level::warn};
};

/**
 * Loads `path` over the defaults. A file that does not exist yields the defaults; one that
 * exists but cannot be read is an IoError; a malformed value is an InvalidArgument naming
 * its "section.key".
 */
Expected<RangeioConfig> loadConfig(const std::filesystem::path& path);

} // namespace rangeio::config
