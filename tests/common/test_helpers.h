// Shared helpers for rangeio tests
#pragma once

#include <rangeio/core/types.h>
#include <rangeio/stream/integrity.hpp>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace rangeio::test {

// Deterministic, non-repeating-looking content of `size` bytes
inline std::string make_object(std::size_t size) {
    std::string out(size, '\0');
    for (std::size_t i = 0; i < size; ++i)
        out[i] = static_cast<char>((i * 31 + 7) % 251);
    return out;
}

inline ByteSpan as_bytes(const std::string& s) {
    return ByteSpan(reinterpret_cast<const std::byte*>(s.data()), s.size());
}

inline MutableByteSpan as_writable(std::string& s) {
    return MutableByteSpan(reinterpret_cast<std::byte*>(s.data()), s.size());
}

inline std::string md5_hex(const std::string& data) {
    stream::IntegrityAccumulator acc;
    acc.update(as_bytes(data));
    return acc.hexDigest();
}

inline std::filesystem::path make_temp_dir(const std::string& prefix = "rangeio_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

} // namespace rangeio::test
