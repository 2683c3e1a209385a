#pragma once

/*
 * rangeio retry layer
 *
 * - BackoffPolicy: attempt index -> delay
 * - validateResponse(): classifies a received response as usable or a structured failure
 * - RequestExecutor: one logical request, retried up to an attempt budget, optionally ranged
 */

#include <rangeio/core/types.h>
#include <rangeio/http/http_client.hpp>

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rangeio::stream {

/// Attempts used when a caller passes 0.
inline constexpr int kDefaultAttempts = 5;

/// Upper bound on how much of an error body is read for parsing.
inline constexpr std::size_t kMaxErrorBodyBytes = 64 * 1024;

/**
 * Exponential backoff: delay(i) = min(initial * multiplier^i, maxBackoff).
 */
struct BackoffPolicy {
    std::chrono::milliseconds initial{600};
    double multiplier{2.0};
    std::chrono::milliseconds maxBackoff{60000};

    [[nodiscard]] std::chrono::milliseconds delay(int attemptIndex) const;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// std::this_thread::sleep_for
Sleeper defaultSleeper();

/**
 * The logical request a stream keeps re-issuing. `resolvedUrl` caches the final location of
 * the first, un-ranged request so later range requests skip the redirect chain.
 */
struct RequestTemplate {
    std::string method{"GET"};
    std::string url;
    http::HeaderMap headers;
    std::optional<std::string> resolvedUrl{};

    [[nodiscard]] const std::string& target() const { return resolvedUrl ? *resolvedUrl : url; }
};

/**
 * Parses an S3-style <Error> document. Missing elements stay empty; returns nullopt when the
 * document is not XML or has no <Error> root.
 */
std::optional<ResponseError> parseXmlError(std::string_view body, int statusCode);

/**
 * Ok for status < 300 with a declared length. Status >= 300 yields ServerError carrying a
 * ResponseError (body consumed and closed); a missing length yields MissingContentLength.
 */
Expected<void> validateResponse(http::HttpResponse& response);

struct ExecutorOptions {
    int attempts{kDefaultAttempts};
    BackoffPolicy backoff{};
    Sleeper sleeper{};
};

/**
 * Issues a RequestTemplate, retrying transport and validation failures.
 */
class RequestExecutor {
public:
    RequestExecutor(std::shared_ptr<http::IHttpTransport> transport, ExecutorOptions options,
                    std::shared_ptr<spdlog::logger> logger = {});

    /**
     * Sends the template (with "Range: bytes=<offset>-" when `startOffset` is set).
     *
     * Fails with RetriesExhausted wrapping the last cause once every attempt failed. With a
     * non-zero offset the response must carry a Content-Range starting at that offset; a
     * response that does not is a ProtocolViolation and is not retried.
     */
    Expected<http::HttpResponse> execute(RequestTemplate& request,
                                         std::optional<std::int64_t> startOffset = std::nullopt);

    [[nodiscard]] int attempts() const noexcept { return _options.attempts; }
    [[nodiscard]] const BackoffPolicy& backoff() const noexcept { return _options.backoff; }

    /// Sleeps for backoff().delay(attemptIndex) through the configured sleeper.
    void pause(int attemptIndex) const;

private:
    std::shared_ptr<http::IHttpTransport> _transport;
    ExecutorOptions _options;
    std::shared_ptr<spdlog::logger> _logger;
};

} // namespace rangeio::stream
