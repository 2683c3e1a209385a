/*
 * rangeio_cli.cpp
 *
 * `rangeio <url>`: copies one remote object to a file or stdout through a ResumableStream.
 * - Defaults come from the config file ([stream], [http], [log]); flags override them.
 * - Logs go to stderr. --json prints a result summary to stdout and requires -o.
 */

#include <rangeio/cli/rangeio_cli.h>
#include <rangeio/config/config_helpers.h>
#include <rangeio/core/logging.h>
#include <rangeio/stream/resumable_stream.hpp>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace rangeio::cli {

namespace {

// "Name: value" -> header
std::optional<http::Header> parse_header(const std::string& raw) {
    auto colon = raw.find(':');
    if (colon == std::string::npos || colon == 0)
        return std::nullopt;
    std::string name = raw.substr(0, colon);
    std::string value = raw.substr(colon + 1);
    config::trim(name);
    config::trim(value);
    if (name.empty())
        return std::nullopt;
    return http::Header{std::move(name), std::move(value)};
}

json error_json(const Error& e) {
    json j = {{"code", errorToString(e.code)}, {"message", e.describe()}};
    const Error& root = rootCause(e);
    if (root.response) {
        j["status"] = root.response->statusCode;
        j["provider_code"] = root.response->code;
        if (!root.response->requestId.empty())
            j["request_id"] = root.response->requestId;
    }
    return j;
}

} // namespace

int RangeioCLI::run(int argc, char* argv[]) {
    CLI::App app{"Stream a remote object over resumable HTTP range requests", "rangeio"};
    GetOptions opts;

    app.add_option("url", opts.url, "Object URL")->required()->check(CLI::NonEmpty());
    auto* outputOpt =
        app.add_option("-o,--output", opts.output, "Write to FILE instead of stdout");
    app.add_option("-H,--header", opts.headers,
                   "Request header sent on every request (repeatable), e.g. 'Authorization: ...'");
    app.add_option("--attempts", opts.attempts,
                   "Attempt budget per request and per read (0 = default 5)")
        ->check(CLI::Range(0, 100));
    app.add_option("--offset", opts.offset, "Start copying at this byte offset")
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--verify", opts.verify, "Check the copied bytes against the object's ETag");
    app.add_option("--config", opts.configPath, "Config file (default: ~/.config/rangeio/config.toml)");
    app.add_option("--log-level", opts.logLevel, "trace|debug|info|warn|error|off")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "err", "off"}));
    app.add_flag("--json", opts.emitJson, "Print a JSON result summary to stdout")
        ->needs(outputOpt);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    auto cfgPath = config::get_config_path(opts.configPath);
    auto cfg = config::loadConfig(cfgPath);

    auto level = cfg.ok() ? cfg.value().logLevel : spdlog::level::warn;
    if (opts.logLevel) {
        if (auto parsed = logging::parseLevel(*opts.logLevel))
            level = *parsed;
    }
    _logger = logging::makeConsoleLogger("rangeio", level);

    if (!cfg.ok()) {
        _logger->error("config {}: {}", cfgPath.string(), cfg.error().describe());
        return 1;
    }
    _logger->debug("using config {}", cfgPath.string());
    return execute(opts, cfg.value());
}

int RangeioCLI::execute(const GetOptions& opts, const config::RangeioConfig& cfg) {
    stream::OpenOptions open;
    open.attempts = opts.attempts.value_or(cfg.stream.attempts);
    open.backoff = cfg.stream.backoff;
    open.logger = _logger;
    open.transport = http::makeCurlTransport(cfg.http, _logger);
    for (const auto& raw : opts.headers) {
        auto header = parse_header(raw);
        if (!header) {
            _logger->error("invalid header '{}': expected 'Name: value'", raw);
            return 1;
        }
        open.headers.add(header->name, header->value);
    }

    auto report = [&](const Error& e) {
        _logger->error("{}: {}", opts.url, e.describe());
        if (opts.emitJson) {
            json result = {{"url", opts.url}, {"success", false}, {"error", error_json(e)}};
            std::cout << result.dump(2) << std::endl;
        }
        return 1;
    };

    auto opened = stream::ResumableStream::open(opts.url, std::move(open));
    if (!opened.ok())
        return report(opened.error());
    auto& s = opened.value();

    if (opts.offset != 0) {
        auto pos = s->seek(opts.offset);
        if (!pos.ok())
            return report(pos.error());
    }

    std::ofstream file;
    std::ostream* out = &std::cout;
    if (opts.output) {
        file.open(*opts.output, std::ios::binary | std::ios::trunc);
        if (!file)
            return report(Error{ErrorCode::IoError, "cannot open " + *opts.output + " for writing"});
        out = &file;
    }

    auto copied = s->copyTo([out](ByteSpan chunk) -> Expected<void> {
        out->write(reinterpret_cast<const char*>(chunk.data()),
                   static_cast<std::streamsize>(chunk.size()));
        if (!*out)
            return Error{ErrorCode::IoError, "write failed"};
        return {};
    });
    if (!copied.ok())
        return report(copied.error());
    out->flush();
    if (!*out)
        return report(Error{ErrorCode::IoError, "flush failed"});

    std::optional<bool> verified;
    if (opts.verify) {
        auto v = s->verify();
        if (!v.ok())
            return report(v.error());
        verified = s->etag().has_value();
        if (!s->etag())
            _logger->warn("{}: no usable ETag, nothing to verify against", opts.url);
    }

    _logger->info("copied {} of {} bytes from {}", copied.value(), s->length(), s->url());
    if (opts.emitJson) {
        auto digest = s->seeked() ? Expected<std::string>{} : s->digestHex();
        json result = {{"url", s->url()},
                       {"success", true},
                       {"bytes", copied.value()},
                       {"length", s->length()},
                       {"offset", opts.offset},
                       {"etag", s->etag() ? json(*s->etag()) : json(nullptr)},
                       {"digest", digest.ok() ? json(digest.value()) : json(nullptr)},
                       {"verified", verified ? json(*verified) : json(nullptr)}};
        std::cout << result.dump(2) << std::endl;
    }

    auto closed = s->close();
    if (!closed.ok())
        return report(closed.error());
    return 0;
}

} // namespace rangeio::cli
