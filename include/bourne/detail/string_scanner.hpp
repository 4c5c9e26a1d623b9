#pragma once

/// @file string_scanner.hpp
/// @brief Quoted string scanning and escape decoding.
///
/// Scanning finds the closing quote without decoding anything: a backslash
/// only hides the byte after it. Decoding then runs over the raw slice.
///
/// Decoding rules:
///   \f \b \n \r \t   control characters
///   \uXXXX           exactly four hex digits, a Unicode scalar value; a
///                    high surrogate followed by \u low surrogate is
///                    combined into one supplementary code point
///   \<any other>     the byte itself (\" \\ \/ \' and unknown escapes)
///
/// A raw line break ends the scan with an error unless a backslash
/// precedes it, in which case it decodes to itself.

#include "../config.hpp"
#include "../error.hpp"
#include "cursor.hpp"
#include "utf8.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bourne::detail {

/// @brief Nibble value of a hex digit, or 0xFF.
constexpr uint8_t hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return 0xFF;
}

/// @brief Read four hex digits at input[pos], stopping at @p end.
inline uint32_t read_hex4(std::string_view input, size_t& pos, size_t end) {
    uint32_t val = 0;
    for (int i = 0; i < 4; ++i) {
        if (BOURNE_UNLIKELY(pos >= end)) raise(input, errc::unexpected_eof, pos, "incomplete \\u escape");
        const uint8_t nib = hex_value(input[pos]);
        if (BOURNE_UNLIKELY(nib > 15)) raise(input, errc::invalid_hex, pos);
        val = (val << 4) | nib;
        ++pos;
    }
    return val;
}

/// @brief Decode the escaped text input[begin, end) and append it to @p out.
/// Errors are reported at offsets within @p input.
inline void unescape_into(std::string_view input, size_t begin, size_t end, std::string& out) {
    out.reserve(out.size() + (end - begin));
    size_t pos = begin;
    while (pos < end) {
        if (BOURNE_LIKELY(input[pos] != '\\')) {
            const size_t run = pos;
            while (pos < end && input[pos] != '\\') ++pos;
            out.append(input.data() + run, pos - run);
            continue;
        }

        const size_t escape_at = pos++;
        if (BOURNE_UNLIKELY(pos >= end)) raise(input, errc::unexpected_eof, pos, "dangling backslash");

        const char c = input[pos++];
        switch (c) {
            case 'f': out.push_back('\f'); break;
            case 'b': out.push_back('\b'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                uint32_t cp = read_hex4(input, pos, end);
                if (utf8::is_high_surrogate(cp) && end - pos >= 2 &&
                    input[pos] == '\\' && input[pos + 1] == 'u') {
                    pos += 2;
                    const uint32_t low = read_hex4(input, pos, end);
                    if (BOURNE_UNLIKELY(!utf8::is_low_surrogate(low))) {
                        raise(input, errc::invalid_escape_sequence, escape_at,
                              "high surrogate not followed by a low surrogate");
                    }
                    cp = utf8::combine_surrogates(cp, low);
                }
                if (BOURNE_UNLIKELY(!utf8::is_scalar(cp))) {
                    raise(input, errc::invalid_escape_sequence, escape_at, "lone surrogate");
                }
                utf8::encode(cp, out);
                break;
            }
            default:
                out.push_back(c);
                break;
        }
    }
}

/// @brief Scan a double-quoted string at the cursor and return it decoded.
inline std::string scan_string(Cursor& cur) {
    const auto first = cur.peek();
    if (BOURNE_UNLIKELY(!first)) cur.fail(errc::unexpected_eof, cur.offset());
    if (BOURNE_UNLIKELY(*first != '"')) cur.fail(errc::invalid_character, cur.offset());

    cur.advance(1);
    const size_t start = cur.offset();

    for (;;) {
        const auto ib = cur.indexed_next();
        if (BOURNE_UNLIKELY(!ib)) cur.fail(errc::unexpected_eof_in_string, start);

        switch (ib->byte) {
            case '\n':
            case '\r':
                cur.fail(errc::line_break_in_string, ib->index);
            case '"': {
                std::string out;
                unescape_into(cur.input(), start, ib->index, out);
                return out;
            }
            case '\\':
                // The escaped byte is never interpreted here, not even a
                // line break.
                cur.advance(1);
                break;
            default:
                break;
        }
    }
}

} // namespace bourne::detail
