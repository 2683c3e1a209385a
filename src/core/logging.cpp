#include <rangeio/core/logging.h>

#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace rangeio::logging {

std::shared_ptr<spdlog::logger> nullLogger() {
    static const auto logger = std::make_shared<spdlog::logger>(
        "rangeio-null", std::make_shared<spdlog::sinks::null_sink_mt>());
    return logger;
}

std::shared_ptr<spdlog::logger> orNull(std::shared_ptr<spdlog::logger> logger) {
    return logger ? std::move(logger) : nullLogger();
}

std::shared_ptr<spdlog::logger> makeConsoleLogger(const std::string& name,
                                                  spdlog::level::level_enum level) {
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>(name, std::move(sink));
    logger->set_level(level);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return logger;
}

std::optional<spdlog::level::level_enum> parseLevel(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace")
        return spdlog::level::trace;
    if (lower == "debug")
        return spdlog::level::debug;
    if (lower == "info")
        return spdlog::level::info;
    if (lower == "warn" || lower == "warning")
        return spdlog::level::warn;
    if (lower == "error" || lower == "err")
        return spdlog::level::err;
    if (lower == "off")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace rangeio::logging
