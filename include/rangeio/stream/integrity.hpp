#pragma once

#include <rangeio/core/types.h>
#include <rangeio/http/http_client.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace rangeio::stream {

/**
 * Running MD5 over the bytes a stream has delivered (OpenSSL EVP).
 *
 * digest()/hexDigest() do not finalize the running state, so the accumulator keeps hashing
 * after the value has been inspected.
 */
class IntegrityAccumulator {
public:
    IntegrityAccumulator();
    ~IntegrityAccumulator();

    IntegrityAccumulator(const IntegrityAccumulator&) = delete;
    IntegrityAccumulator& operator=(const IntegrityAccumulator&) = delete;

    void reset();
    void update(ByteSpan data);

    [[nodiscard]] ByteVector digest() const;
    /// Lower-case hex of digest().
    [[nodiscard]] std::string hexDigest() const;
    /// Number of hex characters a digest renders to (32).
    [[nodiscard]] std::size_t hexLength() const noexcept;
    [[nodiscard]] std::uint64_t bytesHashed() const noexcept { return _bytes; }

private:
    struct Context;
    std::unique_ptr<Context> _ctx;
    std::uint64_t _bytes{0};
};

/**
 * Accepts a whole-object digest header (an ETag) only when, quotes stripped, it is exactly
 * `hexLength` hex characters. Multi-part upload ETags ("<hex>-<parts>") are rejected.
 */
std::optional<std::string> parseExpectedDigest(std::string_view header, std::size_t hexLength);

/**
 * Body decorator that feeds every delivered byte to an accumulator.
 */
class TeeBodyStream final : public http::IBodyStream {
public:
    TeeBodyStream(std::unique_ptr<http::IBodyStream> inner, IntegrityAccumulator& accumulator)
        : _inner(std::move(inner)), _accumulator(accumulator) {}
    ~TeeBodyStream() override { close(); }

    Expected<std::size_t> read(MutableByteSpan buffer) override;
    void close() noexcept override;

private:
    std::unique_ptr<http::IBodyStream> _inner;
    IntegrityAccumulator& _accumulator;
};

} // namespace rangeio::stream
