#pragma once

/*
 * rangeio HTTP transport - public types and interfaces
 *
 * The stream core only talks to IHttpTransport. The libcurl implementation lives in
 * src/http/curl_transport.cpp and is obtained through makeCurlTransport().
 *
 * - send() blocks until the final response's headers have arrived (redirects already walked)
 * - the body is pulled incrementally through IBodyStream::read()
 */

#include <rangeio/core/types.h>

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangeio::http {

/**
 * HTTP header key/value pair.
 */
struct Header {
    std::string name;
    std::string value;
};

/**
 * Ordered header list with case-insensitive lookup.
 */
class HeaderMap {
public:
    HeaderMap() = default;
    HeaderMap(std::initializer_list<Header> init) : _headers(init) {}

    /// First value for `name`, if any.
    [[nodiscard]] std::optional<std::string> get(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;

    /// Replaces every value of `name` with a single one.
    void set(std::string name, std::string value);
    void add(std::string name, std::string value);
    void remove(std::string_view name);

    [[nodiscard]] bool empty() const noexcept { return _headers.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return _headers.size(); }
    [[nodiscard]] auto begin() const noexcept { return _headers.begin(); }
    [[nodiscard]] auto end() const noexcept { return _headers.end(); }

private:
    std::vector<Header> _headers;
};

/// Case-insensitive ASCII comparison of header names.
[[nodiscard]] bool iequals(std::string_view a, std::string_view b);

/**
 * Parsed "Content-Range: bytes <first>-<last>/<total|*>".
 */
struct ContentRange {
    std::int64_t first{0};
    std::int64_t last{0};
    std::optional<std::int64_t> total{};
};

[[nodiscard]] std::optional<ContentRange> parseContentRange(std::string_view value);

struct HttpRequest {
    std::string method{"GET"};
    std::string url;
    HeaderMap headers;
};

/**
 * Pull-based response body.
 */
class IBodyStream {
public:
    virtual ~IBodyStream() = default;

    /**
     * Reads up to buffer.size() bytes. Returns 0 at the end of the body; a connection that
     * drops before the declared length is reported as an error.
     */
    virtual Expected<std::size_t> read(MutableByteSpan buffer) = 0;

    /// Releases the underlying connection. Safe to call more than once.
    virtual void close() noexcept = 0;
};

struct HttpResponse {
    int statusCode{0};
    std::string reason;
    HeaderMap headers;
    std::string effectiveUrl;                     // final URL after redirects
    std::optional<std::int64_t> contentLength{}; // unset for chunked / close-delimited bodies
    std::optional<ContentRange> contentRange{};
    std::unique_ptr<IBodyStream> body;

    /// "404 Not Found"
    [[nodiscard]] std::string statusLine() const;
};

/**
 * TLS configuration.
 */
struct TlsConfig {
    bool insecure{false};
    std::string caPath; // empty = system default
};

/**
 * Redirect handling. The transport consults nextHop() for every 3xx response that carries a
 * Location, so the chain length and header forwarding are decided here rather than by curl.
 */
struct RedirectPolicy {
    bool follow{true};
    int maxRedirects{10};
    bool preserveHeaders{true}; // forward every original header on each hop

    /**
     * Headers for hop number `hop` (1-based) from `fromUrl` to `toUrl`, or a PolicyViolation.
     * Requests other than GET are never redirected.
     */
    [[nodiscard]] Expected<HeaderMap> nextHop(const HttpRequest& original, int hop,
                                              std::string_view fromUrl,
                                              std::string_view toUrl) const;
};

/**
 * Transport configuration.
 */
struct ClientConfig {
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds idleTimeout{10000}; // abort when no byte arrives for this long
    std::chrono::milliseconds totalTimeout{0};    // 0 = unlimited
    std::optional<std::string> proxy;
    std::string userAgent{"rangeio/1.0"};
    TlsConfig tls{};
    RedirectPolicy redirects{};
};

/**
 * HTTP request executor collaborator.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    /**
     * Sends `request`, following redirects through the configured policy, and returns once the
     * final response headers are available. Non-2xx responses are returned, not reported as
     * errors; only transport level failures produce an Error.
     */
    virtual Expected<HttpResponse> send(const HttpRequest& request) = 0;
};

/**
 * libcurl-backed transport.
 */
std::unique_ptr<IHttpTransport> makeCurlTransport(ClientConfig config = {},
                                                  std::shared_ptr<spdlog::logger> logger = {});

} // namespace rangeio::http
