#pragma once

/*
 * ResumableStream - one logical, seekable byte stream over a range-addressable HTTP object.
 *
 * The stream survives dropped connections by re-requesting "bytes=<position>-" and carries on
 * where the caller left off. Bytes reach the caller in object order exactly once, and the
 * running MD5 sees exactly those bytes, so a full sequential read can be checked against the
 * object's ETag.
 *
 * Not thread-safe: one instance is meant to be driven by one thread at a time. Independent
 * instances share nothing but the (thread-safe) transport.
 */

#include <rangeio/core/types.h>
#include <rangeio/http/http_client.hpp>
#include <rangeio/stream/integrity.hpp>
#include <rangeio/stream/retry.hpp>

#include <spdlog/logger.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rangeio::stream {

enum class SeekOrigin { Start, Current, End };

/**
 * Everything needed to open a stream.
 */
struct OpenOptions {
    http::HeaderMap headers;
    int attempts{kDefaultAttempts}; // 0 selects kDefaultAttempts
    BackoffPolicy backoff{};
    Sleeper sleeper{};                                // default: std::this_thread::sleep_for
    std::shared_ptr<http::IHttpTransport> transport; // default: curl with ClientConfig{}
    std::shared_ptr<spdlog::logger> logger;           // default: discarding logger
};

using ByteSink = std::function<Expected<void>(ByteSpan)>;

class ResumableStream {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * Requests the whole object once and returns a stream positioned at 0. Fails when the
     * request fails on every attempt or the response does not declare its length.
     */
    static Expected<std::unique_ptr<ResumableStream>> open(std::string url,
                                                           OpenOptions options = {});

    // Only open() can name PrivateTag
    ResumableStream(PrivateTag, RequestTemplate request, RequestExecutor executor,
                    std::shared_ptr<spdlog::logger> logger);
    ~ResumableStream();

    ResumableStream(const ResumableStream&) = delete;
    ResumableStream& operator=(const ResumableStream&) = delete;

    /**
     * Fills `buffer` from the current position, reconnecting as needed. Returns the number of
     * bytes delivered; 0 for a non-empty buffer means end of data.
     *
     * If the stream fails after delivering part of the buffer, the partial count is returned
     * and the failure is reported by the next call. A fatal failure is sticky until a seek
     * that changes the position or close().
     */
    Expected<std::size_t> read(MutableByteSpan buffer);

    /**
     * Moves the position. No request is made: the next read() reconnects at the new offset.
     * Seeking to 0 restarts the running digest; seeking anywhere else makes it unverifiable.
     */
    Expected<std::int64_t> seek(std::int64_t offset, SeekOrigin origin = SeekOrigin::Start);

    /// Releases the connection. A second close() is a ClosedHandle error.
    Expected<void> close();

    /**
     * Compares the running digest with the ETag captured at open. Succeeds trivially when no
     * usable ETag was sent; Unverifiable after a seek away from 0; ChecksumMismatch otherwise
     * when the values differ.
     */
    Expected<void> verify() const;

    /// Reads to end of data, handing each chunk to `sink`. Returns the bytes copied.
    Expected<std::uint64_t> copyTo(const ByteSink& sink, std::size_t bufferSize = 32 * 1024);

    [[nodiscard]] std::int64_t length() const noexcept { return _length; }
    [[nodiscard]] std::int64_t position() const noexcept { return _position; }
    [[nodiscard]] const std::optional<std::string>& etag() const noexcept { return _etag; }
    [[nodiscard]] bool seeked() const noexcept { return _seeked; }
    [[nodiscard]] bool closed() const noexcept { return _closed; }
    [[nodiscard]] bool connected() const noexcept { return _body != nullptr; }
    [[nodiscard]] const std::optional<Error>& stickyError() const noexcept { return _sticky; }
    [[nodiscard]] const http::HeaderMap& headers() const noexcept { return _headers; }
    [[nodiscard]] const std::string& url() const noexcept { return _request.target(); }

    /// MD5 of the bytes delivered since open or the last seek to 0.
    Expected<ByteVector> digest() const;
    Expected<std::string> digestHex() const;

private:
    Expected<void> reconnect();
    void releaseBody() noexcept;
    Error fail(Error error);

    RequestTemplate _request;
    RequestExecutor _executor;
    std::shared_ptr<spdlog::logger> _logger;

    IntegrityAccumulator _accumulator;
    std::unique_ptr<http::IBodyStream> _body;
    http::HeaderMap _headers;
    std::optional<std::string> _etag;

    std::int64_t _position{0};
    std::int64_t _length{0};
    bool _seeked{false};
    bool _closed{false};
    std::optional<Error> _sticky;
};

/**
 * Reusable defaults for opening many streams: one transport, shared headers, one budget.
 * Streams opened from the same client are independent and may be used on different threads.
 */
class StreamClient {
public:
    explicit StreamClient(OpenOptions defaults = {});

    [[nodiscard]] Expected<std::unique_ptr<ResumableStream>> open(std::string url) const;

    http::HeaderMap& headers() noexcept { return _defaults.headers; }
    [[nodiscard]] const OpenOptions& defaults() const noexcept { return _defaults; }

private:
    OpenOptions _defaults;
};

} // namespace rangeio::stream
