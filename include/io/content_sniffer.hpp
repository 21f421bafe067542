#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace chunkio {

// Bytes inspected by DetectContentType.
inline constexpr std::size_t kSniffLen = 512;

enum class ContentType {
    kGzip,
    kBzip2,
    kXz,
    kZstd,
    kZip,
    kText,
    kOctetStream,
};

// Classifies a stream by its first bytes (at most kSniffLen are considered).
ContentType DetectContentType(std::span<const std::uint8_t> prefix);

const char* ContentTypeName(ContentType type);

// Compressed formats this library recognizes but does not decode.
bool IsUnsupportedCompression(ContentType type);

} // namespace chunkio
