/*
 * resumable_stream.cpp
 *
 * State:
 * - _body set: a live connection positioned at _position
 * - _body empty: nothing open; the next read() issues "Range: bytes=<_position>-"
 * - _sticky set: a fatal read failure, returned by read() until a seek or close()
 * - _closed: terminal
 *
 * End of data is exactly _position == _length (half-open [0, _length)).
 */

#include <rangeio/core/logging.h>
#include <rangeio/stream/resumable_stream.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

namespace rangeio::stream {

ResumableStream::ResumableStream(PrivateTag, RequestTemplate request, RequestExecutor executor,
                                 std::shared_ptr<spdlog::logger> logger)
    : _request(std::move(request)), _executor(std::move(executor)), _logger(std::move(logger)) {}

ResumableStream::~ResumableStream() {
    releaseBody();
}

Expected<std::unique_ptr<ResumableStream>> ResumableStream::open(std::string url,
                                                                 OpenOptions options) {
    if (url.empty()) {
        return Error{ErrorCode::InvalidArgument, "empty URL"};
    }
    if (options.attempts < 0) {
        return Error{ErrorCode::InvalidArgument, "attempt budget must not be negative"};
    }

    auto logger = logging::orNull(std::move(options.logger));
    std::shared_ptr<http::IHttpTransport> transport = std::move(options.transport);
    if (!transport)
        transport = http::makeCurlTransport(http::ClientConfig{}, logger);

    RequestTemplate request;
    request.url = std::move(url);
    request.headers = std::move(options.headers);

    ExecutorOptions execOptions;
    execOptions.attempts = options.attempts;
    execOptions.backoff = options.backoff;
    execOptions.sleeper = std::move(options.sleeper);
    RequestExecutor executor(std::move(transport), std::move(execOptions), logger);

    auto response = executor.execute(request);
    if (!response.ok())
        return response.error();
    http::HttpResponse& resp = response.value();

    std::unique_ptr<ResumableStream> stream;
    try {
        stream = std::make_unique<ResumableStream>(PrivateTag{}, std::move(request),
                                                   std::move(executor), logger);
    } catch (const std::runtime_error& e) {
        if (resp.body)
            resp.body->close();
        return Error{ErrorCode::Unknown, e.what()};
    }
    stream->_length = *resp.contentLength;
    stream->_headers = resp.headers;
    if (auto etag = resp.headers.get("ETag")) {
        stream->_etag = parseExpectedDigest(*etag, stream->_accumulator.hexLength());
        if (!stream->_etag)
            logger->debug("ignoring ETag {} for {}: not a single-part digest", *etag,
                          stream->url());
    }
    stream->_body = std::make_unique<TeeBodyStream>(std::move(resp.body), stream->_accumulator);

    logger->debug("opened {} ({} bytes)", stream->url(), stream->_length);
    return stream;
}

void ResumableStream::releaseBody() noexcept {
    if (_body) {
        _body->close();
        _body.reset();
    }
}

Error ResumableStream::fail(Error error) {
    releaseBody();
    _sticky = error;
    return error;
}

Expected<void> ResumableStream::reconnect() {
    releaseBody();

    auto response = _executor.execute(_request, _position);
    if (!response.ok())
        return response.error();
    http::HttpResponse& resp = response.value();

    if (resp.contentRange && resp.contentRange->total && *resp.contentRange->total != _length) {
        if (resp.body)
            resp.body->close();
        return Error{ErrorCode::ProtocolViolation,
                     "object length changed from " + std::to_string(_length) + " to " +
                         std::to_string(*resp.contentRange->total) + " bytes"};
    }

    _logger->debug("reconnected to {} at offset {}", _request.target(), _position);
    _body = std::make_unique<TeeBodyStream>(std::move(resp.body), _accumulator);
    return {};
}

Expected<std::size_t> ResumableStream::read(MutableByteSpan buffer) {
    if (_closed) {
        return Error{ErrorCode::ClosedHandle, "read on closed stream"};
    }
    if (_sticky) {
        return *_sticky;
    }
    if (_position > _length) {
        return Error{ErrorCode::OutOfBounds, "read at position " + std::to_string(_position) +
                                                 " past " + std::to_string(_length) + " boundary"};
    }
    if (_position == _length) {
        releaseBody();
        return std::size_t{0};
    }
    if (buffer.empty()) {
        return std::size_t{0};
    }

    std::size_t delivered = 0;
    int failures = 0; // consecutive failed read/reconnect cycles without progress
    while (delivered < buffer.size() && _position < _length) {
        if (!_body) {
            auto reconnected = reconnect();
            if (!reconnected.ok()) {
                Error err = fail(reconnected.error());
                if (delivered > 0)
                    return delivered;
                return err;
            }
        }

        const auto remaining = static_cast<std::uint64_t>(_length - _position);
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size() - delivered, remaining));
        auto n = _body->read(buffer.subspan(delivered, want));
        if (n.ok() && n.value() > 0) {
            delivered += n.value();
            _position += static_cast<std::int64_t>(n.value());
            failures = 0;
            continue;
        }

        // Either a failed read or the connection ended early; both mean "reconnect here".
        Error cause = n.ok() ? Error{ErrorCode::NetworkError,
                                     "connection closed at offset " + std::to_string(_position) +
                                         " of " + std::to_string(_length)}
                             : n.error();
        _logger->warn("read attempt {}: {}", failures, cause.describe());
        releaseBody();

        if (++failures >= _executor.attempts()) {
            Error err = fail(wrapError(ErrorCode::RetriesExhausted,
                                       "unable to read from response body after " +
                                           std::to_string(_executor.attempts()) + " attempts",
                                       std::move(cause)));
            if (delivered > 0)
                return delivered;
            return err;
        }
        _executor.pause(failures);
    }

    if (_position == _length)
        releaseBody();
    return delivered;
}

Expected<std::int64_t> ResumableStream::seek(std::int64_t offset, SeekOrigin origin) {
    if (_closed) {
        return Error{ErrorCode::ClosedHandle, "seek on closed stream"};
    }

    std::int64_t base = 0;
    switch (origin) {
        case SeekOrigin::Start:
            base = 0;
            break;
        case SeekOrigin::Current:
            base = _position;
            break;
        case SeekOrigin::End:
            base = _length;
            break;
    }

    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    if ((offset > 0 && base > kMax - offset) || (offset < 0 && base < kMin - offset)) {
        return Error{ErrorCode::InvalidSeek, "seek offset overflows"};
    }
    const std::int64_t target = base + offset;

    if (target < 0) {
        return Error{ErrorCode::InvalidSeek, "cannot seek before beginning"};
    }
    if (target == _position) {
        return _position;
    }

    // Nothing is touched until the digest restart has succeeded
    if (target == 0) {
        try {
            _accumulator.reset();
        } catch (const std::runtime_error& e) {
            return Error{ErrorCode::Unknown, e.what()};
        }
    }

    releaseBody();
    _sticky.reset();
    _position = target;
    _seeked = _position != 0;
    return _position;
}

Expected<void> ResumableStream::close() {
    if (_closed) {
        return Error{ErrorCode::ClosedHandle, "stream already closed"};
    }
    _closed = true;
    releaseBody();
    return {};
}

Expected<void> ResumableStream::verify() const {
    if (_closed) {
        return Error{ErrorCode::ClosedHandle, "verify on closed stream"};
    }
    if (!_etag) {
        return {};
    }
    if (_seeked) {
        return Error{ErrorCode::Unverifiable,
                     "cannot verify transfer for streams that have been seeked"};
    }
    auto digest = digestHex();
    if (!digest.ok())
        return digest.error();
    if (digest.value() != *_etag) {
        return Error{ErrorCode::ChecksumMismatch, "ETag: server reported ETag of \"" + *_etag +
                                                      "\" but we calculated a digest of \"" +
                                                      digest.value() + "\""};
    }
    return {};
}

Expected<ByteVector> ResumableStream::digest() const {
    try {
        return _accumulator.digest();
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::Unknown, e.what()};
    }
}

Expected<std::string> ResumableStream::digestHex() const {
    try {
        return _accumulator.hexDigest();
    } catch (const std::runtime_error& e) {
        return Error{ErrorCode::Unknown, e.what()};
    }
}

Expected<std::uint64_t> ResumableStream::copyTo(const ByteSink& sink, std::size_t bufferSize) {
    if (!sink) {
        return Error{ErrorCode::InvalidArgument, "no sink provided"};
    }
    std::vector<std::byte> buffer(bufferSize == 0 ? 32 * 1024 : bufferSize);
    std::uint64_t copied = 0;
    for (;;) {
        auto n = read(MutableByteSpan(buffer.data(), buffer.size()));
        if (!n.ok())
            return n.error();
        if (n.value() == 0)
            return copied;
        auto written = sink(ByteSpan(buffer.data(), n.value()));
        if (!written.ok())
            return written.error();
        copied += n.value();
    }
}

StreamClient::StreamClient(OpenOptions defaults) : _defaults(std::move(defaults)) {
    if (!_defaults.transport)
        _defaults.transport = http::makeCurlTransport(http::ClientConfig{}, _defaults.logger);
}

Expected<std::unique_ptr<ResumableStream>> StreamClient::open(std::string url) const {
    return ResumableStream::open(std::move(url), _defaults);
}

} // namespace rangeio::stream
