#include <rangeio/config/config.h>
#include <rangeio/config/config_helpers.h>
#include <rangeio/core/logging.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <map>
#include <string>
#include <system_error>

namespace rangeio::config {

namespace {

using Values = std::map<std::string, std::string>;

Error badValue(const std::string& key, const std::string& value, const char* expected) {
    return Error{ErrorCode::InvalidArgument,
                 "config key " + key + ": expected " + expected + ", got '" + value + "'"};
}

Expected<void> readInt(const Values& values, const std::string& key, int& out) {
    auto it = values.find(key);
    if (it == values.end())
        return {};
    const auto& v = it->second;
    int parsed = 0;
    auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), parsed);
    if (v.empty() || ec != std::errc() || ptr != v.data() + v.size() || parsed < 0)
        return badValue(key, v, "a non-negative integer");
    out = parsed;
    return {};
}

Expected<void> readMs(const Values& values, const std::string& key,
                      std::chrono::milliseconds& out) {
    auto it = values.find(key);
    if (it == values.end())
        return {};
    auto parsed = parse_ms(it->second);
    if (!parsed)
        return badValue(key, it->second, "milliseconds");
    out = *parsed;
    return {};
}

Expected<void> readDouble(const Values& values, const std::string& key, double& out) {
    auto it = values.find(key);
    if (it == values.end())
        return {};
    const auto& v = it->second;
    try {
        std::size_t used = 0;
        double parsed = std::stod(v, &used);
        if (used != v.size() || parsed < 1.0)
            return badValue(key, v, "a number >= 1");
        out = parsed;
    } catch (const std::exception&) {
        return badValue(key, v, "a number >= 1");
    }
    return {};
}

Expected<void> readBool(const Values& values, const std::string& key, bool& out) {
    auto it = values.find(key);
    if (it == values.end())
        return {};
    std::string v = it->second;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        out = true;
    } else if (v == "false" || v == "0" || v == "no" || v == "off") {
        out = false;
    } else {
        return badValue(key, it->second, "true or false");
    }
    return {};
}

void readString(const Values& values, const std::string& key, std::string& out) {
    if (auto it = values.find(key); it != values.end())
        out = it->second;
}

} // namespace

Expected<RangeioConfig> loadConfig(const std::filesystem::path& path) {
    RangeioConfig cfg;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
        return cfg;
    if (!std::filesystem::is_regular_file(path, ec))
        return Error{ErrorCode::IoError, "config path is not a regular file: " + path.string()};

    auto parsed = parse_config_file(path);
    if (!parsed)
        return Error{ErrorCode::IoError, "cannot read config file " + path.string()};
    const Values& values = *parsed;

    if (auto r = readInt(values, "stream.attempts", cfg.stream.attempts); !r.ok())
        return r.error();
    if (auto r = readMs(values, "stream.backoff_ms", cfg.stream.backoff.initial); !r.ok())
        return r.error();
    if (auto r = readDouble(values, "stream.backoff_multiplier", cfg.stream.backoff.multiplier); !r.ok())
        return r.error();
    if (auto r = readMs(values, "stream.max_backoff_ms", cfg.stream.backoff.maxBackoff); !r.ok())
        return r.error();
    if (auto r = readMs(values, "http.connect_timeout_ms", cfg.http.connectTimeout); !r.ok())
        return r.error();
    if (auto r = readMs(values, "http.idle_timeout_ms", cfg.http.idleTimeout); !r.ok())
        return r.error();
    if (auto r = readMs(values, "http.timeout_ms", cfg.http.totalTimeout); !r.ok())
        return r.error();
    if (auto r = readBool(values, "http.follow_redirects", cfg.http.redirects.follow); !r.ok())
        return r.error();
    if (auto r = readInt(values, "http.max_redirects", cfg.http.redirects.maxRedirects); !r.ok())
        return r.error();
    if (auto r = readBool(values, "http.preserve_headers", cfg.http.redirects.preserveHeaders); !r.ok())
        return r.error();
    if (auto r = readBool(values, "http.tls_insecure", cfg.http.tls.insecure); !r.ok())
        return r.error();

    readString(values, "http.user_agent", cfg.http.userAgent);
    readString(values, "http.ca_path", cfg.http.tls.caPath);
    if (auto it = values.find("http.proxy"); it != values.end() && !it->second.empty())
        cfg.http.proxy = it->second;
    if (!cfg.http.tls.caPath.empty())
        cfg.http.tls.caPath = expand_tilde(cfg.http.tls.caPath).string();

    if (auto it = values.find("log.level"); it != values.end()) {
        auto level = logging::parseLevel(it->second);
        if (!level)
            return badValue("log.level", it->second, "trace|debug|info|warn|error|off");
        cfg.logLevel = *level;
    }

    return cfg;
}

} // namespace rangeio::config
