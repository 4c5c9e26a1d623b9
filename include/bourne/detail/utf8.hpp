#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers for the escape decoder and string length.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bourne::detail::utf8 {

inline constexpr uint32_t kMaxCodePoint = 0x10FFFF;

/// @brief True for code points reserved as UTF-16 surrogates.
constexpr bool is_surrogate(uint32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

constexpr bool is_high_surrogate(uint32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

constexpr bool is_low_surrogate(uint32_t cp) noexcept {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

/// @brief True if @p cp is a Unicode scalar value (not a surrogate, in range).
constexpr bool is_scalar(uint32_t cp) noexcept {
    return cp <= kMaxCodePoint && !is_surrogate(cp);
}

/// @brief Combine a surrogate pair into a supplementary code point.
constexpr uint32_t combine_surrogates(uint32_t high, uint32_t low) noexcept {
    return 0x10000u + ((high - 0xD800u) << 10) + (low - 0xDC00u);
}

/// @brief Encodes a Unicode scalar value as UTF-8 and appends to the string.
/// @param cp   Scalar value (caller checks is_scalar()).
/// @param out  Destination string for UTF-8 bytes.
inline void encode(uint32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

/// @brief Number of code points in UTF-8 text.
/// Counts every byte that is not a continuation byte, so malformed input
/// still yields a finite, monotonic count.
inline size_t count_scalars(std::string_view text) noexcept {
    size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) ++n;
    }
    return n;
}

} // namespace bourne::detail::utf8
