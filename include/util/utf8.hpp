#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace chunkio::utf8 {

inline constexpr char32_t kRuneError = 0xFFFD;
inline constexpr std::size_t kMaxBytes = 4;

namespace detail {

// Encoded length announced by a leading byte, 0 if it cannot start a sequence.
inline int SequenceLength(std::uint8_t b) {
    if (b < 0x80) return 1;
    if (b < 0xC2) return 0;
    if (b < 0xE0) return 2;
    if (b < 0xF0) return 3;
    if (b < 0xF5) return 4;
    return 0;
}

inline bool IsContinuation(std::uint8_t b) { return (b & 0xC0) == 0x80; }

// The second byte range is narrower after E0, ED, F0 and F4 (overlong forms,
// surrogates, values past U+10FFFF).
inline bool SecondByteValid(std::uint8_t lead, std::uint8_t b) {
    switch (lead) {
        case 0xE0: return b >= 0xA0 && b <= 0xBF;
        case 0xED: return b >= 0x80 && b <= 0x9F;
        case 0xF0: return b >= 0x90 && b <= 0xBF;
        case 0xF4: return b >= 0x80 && b <= 0x8F;
        default:   return IsContinuation(b);
    }
}

} // namespace detail

// True when p holds enough bytes to decode its first character. An invalid
// prefix counts as complete: it decodes to kRuneError with width 1.
inline bool FullRune(std::span<const std::uint8_t> p) {
    if (p.empty()) return false;
    const int len = detail::SequenceLength(p[0]);
    if (len <= 1) return true;
    if (p.size() >= static_cast<std::size_t>(len)) return true;
    if (p.size() > 1 && !detail::SecondByteValid(p[0], p[1])) return true;
    if (p.size() > 2 && !detail::IsContinuation(p[2])) return true;
    return false;
}

inline char32_t DecodeRune(std::span<const std::uint8_t> p, int& width) {
    if (p.empty()) {
        width = 0;
        return kRuneError;
    }
    const std::uint8_t b0 = p[0];
    const int len = detail::SequenceLength(b0);
    width = 1;
    if (len == 1) return b0;
    if (len == 0 || p.size() < static_cast<std::size_t>(len)) return kRuneError;
    if (!detail::SecondByteValid(b0, p[1])) return kRuneError;
    for (int i = 2; i < len; ++i) {
        if (!detail::IsContinuation(p[i])) return kRuneError;
    }

    char32_t cp = 0;
    switch (len) {
        case 2: cp = b0 & 0x1F; break;
        case 3: cp = b0 & 0x0F; break;
        default: cp = b0 & 0x07; break;
    }
    for (int i = 1; i < len; ++i) {
        cp = (cp << 6) | (p[i] & 0x3F);
    }
    width = len;
    return cp;
}

} // namespace chunkio::utf8
