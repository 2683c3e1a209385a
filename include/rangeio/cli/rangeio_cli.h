#pragma once

#include <rangeio/config/config.h>

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rangeio::cli {

struct GetOptions {
    std::string url;
    std::optional<std::string> output; // stdout when unset
    std::vector<std::string> headers;  // "Name: value"
    std::optional<int> attempts;
    std::int64_t offset{0};
    bool verify{false};
    std::string configPath;
    std::optional<std::string> logLevel;
    bool emitJson{false};
};

/**
 * Main CLI application class
 */
class RangeioCLI {
public:
    /**
     * Run the CLI with given arguments. Returns the process exit code.
     */
    int run(int argc, char* argv[]);

private:
    int execute(const GetOptions& opts, const config::RangeioConfig& cfg);

    std::shared_ptr<spdlog::logger> _logger;
};

} // namespace rangeio::cli
