/*
 * integrity_accumulator.cpp
 *
 * Running MD5 via OpenSSL EVP. The expected value comes from the object's ETag, which for
 * single-part uploads is the MD5 of the content.
 *
 * Dependencies:
 * - OpenSSL::Crypto
 */

#include <rangeio/stream/integrity.hpp>

#include <openssl/evp.h>

#include <array>
#include <cctype>
#include <stdexcept>

namespace rangeio::stream {

namespace {

inline std::string to_hex_lower(const unsigned char* bytes, std::size_t len) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        unsigned v = bytes[i];
        out[2 * i + 0] = kHex[(v >> 4) & 0xF];
        out[2 * i + 1] = kHex[(v >> 0) & 0xF];
    }
    return out;
}

} // namespace

// RAII wrapper for EVP_MD_CTX
struct IntegrityAccumulator::Context {
    EVP_MD_CTX* ctx{EVP_MD_CTX_new()};
    const EVP_MD* md{EVP_md5()};

    Context() {
        if (ctx == nullptr || EVP_DigestInit_ex(ctx, md, nullptr) != 1) {
            EVP_MD_CTX_free(ctx);
            throw std::runtime_error("failed to initialise MD5 digest context");
        }
    }
    ~Context() { EVP_MD_CTX_free(ctx); }

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    // Digest of everything fed so far, leaving `ctx` untouched.
    std::array<unsigned char, EVP_MAX_MD_SIZE> snapshot(unsigned& len) const {
        std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
        len = 0;
        EVP_MD_CTX* copy = EVP_MD_CTX_new();
        if (copy == nullptr)
            throw std::runtime_error("failed to allocate digest context");
        const bool ok = EVP_MD_CTX_copy_ex(copy, ctx) == 1 &&
                        EVP_DigestFinal_ex(copy, out.data(), &len) == 1;
        EVP_MD_CTX_free(copy);
        if (!ok)
            throw std::runtime_error("failed to finalise digest");
        return out;
    }
};

IntegrityAccumulator::IntegrityAccumulator() : _ctx(std::make_unique<Context>()) {}

IntegrityAccumulator::~IntegrityAccumulator() = default;

void IntegrityAccumulator::reset() {
    _ctx = std::make_unique<Context>();
    _bytes = 0;
}

void IntegrityAccumulator::update(ByteSpan data) {
    if (data.empty())
        return;
    if (EVP_DigestUpdate(_ctx->ctx, data.data(), data.size()) != 1)
        throw std::runtime_error("digest update failed");
    _bytes += data.size();
}

ByteVector IntegrityAccumulator::digest() const {
    unsigned len = 0;
    auto raw = _ctx->snapshot(len);
    ByteVector out(len);
    for (unsigned i = 0; i < len; ++i)
        out[i] = static_cast<std::byte>(raw[i]);
    return out;
}

std::string IntegrityAccumulator::hexDigest() const {
    unsigned len = 0;
    auto raw = _ctx->snapshot(len);
    return to_hex_lower(raw.data(), len);
}

std::size_t IntegrityAccumulator::hexLength() const noexcept {
    return static_cast<std::size_t>(EVP_MD_size(_ctx->md)) * 2;
}

std::optional<std::string> parseExpectedDigest(std::string_view header, std::size_t hexLength) {
    while (!header.empty() && std::isspace(static_cast<unsigned char>(header.front())))
        header.remove_prefix(1);
    while (!header.empty() && std::isspace(static_cast<unsigned char>(header.back())))
        header.remove_suffix(1);
    // Weak validators never describe the exact bytes
    if (header.size() >= 2 && header.substr(0, 2) == "W/")
        return std::nullopt;
    if (header.size() >= 2 && header.front() == '"' && header.back() == '"')
        header = header.substr(1, header.size() - 2);

    if (header.size() != hexLength)
        return std::nullopt;

    std::string out;
    out.reserve(header.size());
    for (unsigned char c : header) {
        if (!std::isxdigit(c))
            return std::nullopt;
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

Expected<std::size_t> TeeBodyStream::read(MutableByteSpan buffer) {
    if (!_inner)
        return Error{ErrorCode::IoError, "read on a released response body"};
    auto n = _inner->read(buffer);
    if (n.ok() && n.value() > 0) {
        try {
            _accumulator.update(ByteSpan(buffer.data(), n.value()));
        } catch (const std::runtime_error& e) {
            return Error{ErrorCode::Unknown, e.what()};
        }
    }
    return n;
}

void TeeBodyStream::close() noexcept {
    if (_inner) {
        _inner->close();
        _inner.reset();
    }
}

} // namespace rangeio::stream
