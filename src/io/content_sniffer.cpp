#include "io/content_sniffer.hpp"

#include <algorithm>
#include <array>

namespace chunkio {

namespace {

struct Signature {
    std::span<const std::uint8_t> magic;
    ContentType type;
};

constexpr std::array<std::uint8_t, 3> kGzipMagic{0x1F, 0x8B, 0x08};
constexpr std::array<std::uint8_t, 3> kBzip2Magic{'B', 'Z', 'h'};
constexpr std::array<std::uint8_t, 6> kXzMagic{0xFD, '7', 'z', 'X', 'Z', 0x00};
constexpr std::array<std::uint8_t, 4> kZstdMagic{0x28, 0xB5, 0x2F, 0xFD};
constexpr std::array<std::uint8_t, 4> kZipMagic{'P', 'K', 0x03, 0x04};

constexpr std::array<Signature, 5> kSignatures{{
    {kGzipMagic, ContentType::kGzip},
    {kBzip2Magic, ContentType::kBzip2},
    {kXzMagic, ContentType::kXz},
    {kZstdMagic, ContentType::kZstd},
    {kZipMagic, ContentType::kZip},
}};

bool HasPrefix(std::span<const std::uint8_t> data, std::span<const std::uint8_t> magic) {
    return data.size() >= magic.size() && std::equal(magic.begin(), magic.end(), data.begin());
}

// Control bytes that never show up in text.
bool IsBinaryByte(std::uint8_t b) {
    return b <= 0x08 || b == 0x0B || (b >= 0x0E && b <= 0x1A) || (b >= 0x1C && b <= 0x1F);
}

} // namespace

ContentType DetectContentType(std::span<const std::uint8_t> prefix) {
    if (prefix.size() > kSniffLen) {
        prefix = prefix.first(kSniffLen);
    }

    for (const auto& sig : kSignatures) {
        if (HasPrefix(prefix, sig.magic)) {
            return sig.type;
        }
    }

    if (std::any_of(prefix.begin(), prefix.end(), IsBinaryByte)) {
        return ContentType::kOctetStream;
    }
    return ContentType::kText;
}

const char* ContentTypeName(ContentType type) {
    switch (type) {
        case ContentType::kGzip:        return "application/x-gzip";
        case ContentType::kBzip2:       return "application/x-bzip2";
        case ContentType::kXz:          return "application/x-xz";
        case ContentType::kZstd:        return "application/zstd";
        case ContentType::kZip:         return "application/zip";
        case ContentType::kText:        return "text/plain; charset=utf-8";
        case ContentType::kOctetStream: return "application/octet-stream";
    }
    return "application/octet-stream";
}

bool IsUnsupportedCompression(ContentType type) {
    switch (type) {
        case ContentType::kBzip2:
        case ContentType::kXz:
        case ContentType::kZstd:
        case ContentType::kZip:
            return true;
        default:
            return false;
    }
}

} // namespace chunkio
