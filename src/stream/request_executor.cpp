#include <rangeio/core/logging.h>
#include <rangeio/stream/retry.hpp>

#include <spdlog/spdlog.h>

namespace rangeio::stream {

RequestExecutor::RequestExecutor(std::shared_ptr<http::IHttpTransport> transport,
                                 ExecutorOptions options, std::shared_ptr<spdlog::logger> logger)
    : _transport(std::move(transport)), _options(std::move(options)),
      _logger(logging::orNull(std::move(logger))) {
    if (_options.attempts <= 0)
        _options.attempts = kDefaultAttempts;
    if (!_options.sleeper)
        _options.sleeper = defaultSleeper();
}

void RequestExecutor::pause(int attemptIndex) const {
    _options.sleeper(_options.backoff.delay(attemptIndex));
}

Expected<http::HttpResponse> RequestExecutor::execute(RequestTemplate& request,
                                                      std::optional<std::int64_t> startOffset) {
    http::HttpRequest req;
    req.method = request.method;
    req.url = request.target();
    req.headers = request.headers;
    if (startOffset) {
        req.headers.set("Range", "bytes=" + std::to_string(*startOffset) + "-");
    } else {
        req.headers.remove("Range");
    }

    Error last{ErrorCode::Unknown, "no attempt was made"};
    for (int attempt = 0; attempt < _options.attempts; ++attempt) {
        if (attempt > 0)
            pause(attempt);

        auto sent = _transport->send(req);
        if (!sent.ok()) {
            last = sent.error();
            if (last.code == ErrorCode::InvalidArgument)
                return last;
            _logger->warn("http attempt {}: {}", attempt, last.describe());
            continue;
        }

        http::HttpResponse response = std::move(sent).value();
        if (auto valid = validateResponse(response); !valid.ok()) {
            last = valid.error();
            _logger->warn("http attempt {}: {}", attempt, last.describe());
            continue;
        }

        if (startOffset && *startOffset > 0) {
            if (!response.contentRange) {
                if (response.body)
                    response.body->close();
                return Error{ErrorCode::ProtocolViolation,
                             "missing Content-Range header in response"};
            }
            if (response.contentRange->first != *startOffset) {
                if (response.body)
                    response.body->close();
                return Error{ErrorCode::ProtocolViolation,
                             "server answered range request for offset " +
                                 std::to_string(*startOffset) + " with range starting at " +
                                 std::to_string(response.contentRange->first)};
            }
        }

        if (!startOffset && !request.resolvedUrl && !response.effectiveUrl.empty() &&
            response.effectiveUrl != req.url) {
            _logger->debug("caching resolved url {} for {}", response.effectiveUrl, request.url);
            request.resolvedUrl = response.effectiveUrl;
        }
        return response;
    }

    return wrapError(ErrorCode::RetriesExhausted,
                     "request failed after " + std::to_string(_options.attempts) + " attempts",
                     std::move(last));
}

} // namespace rangeio::stream
