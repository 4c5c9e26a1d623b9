#pragma once

/// @file number_scanner.hpp
/// @brief State machine for numeric literals.
///
/// Grammar:
///   [+|-]?                     optional sign
///   ( 0 | [1-9] [0-9]* )       single zero, or non-zero digit then digits
///   ( . [0-9]+ )?              optional fraction, at least one digit
///   ( [e|E] [+|-]? [0-9]+ )?   optional exponent, at least one digit
///
/// A literal ends at '}', ']', ',', ASCII whitespace or end of input. The
/// terminator byte is handed back to the caller by rewinding the cursor.
/// Literals without '.' or an exponent become Int, the rest Float. An Int
/// that does not fit in int64_t is an error, never a silent Float. A Float
/// outside double range saturates to infinity or zero.

#include "../config.hpp"
#include "../error.hpp"
#include "../number.hpp"
#include "cursor.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

namespace bourne::detail {

enum class NumberState : uint8_t {
    Start,              ///< Before everything
    AfterSign,          ///< Sign seen, integer digit required
    AfterZero,          ///< Leading zero; no more integer digits may follow
    IntegerPart,        ///< Inside the integer digits
    AfterDecimalPoint,  ///< '.' seen, digit required
    FractionalPart,     ///< Inside the fraction digits
    AfterExponent,      ///< 'e'/'E' seen, sign or digit required
    AfterExponentSign,  ///< Exponent sign seen, digit required
    ExponentPart,       ///< Inside the exponent digits
};

/// @brief States in which the literal may legally end.
constexpr bool is_accepting(NumberState s) noexcept {
    return s == NumberState::AfterZero || s == NumberState::IntegerPart ||
           s == NumberState::FractionalPart || s == NumberState::ExponentPart;
}

constexpr bool is_number_terminator(char c) noexcept {
    return c == '}' || c == ']' || c == ',' || is_ascii_whitespace(c);
}

constexpr bool is_digit(char c) noexcept {
    return static_cast<unsigned>(c - '0') <= 9u;
}

/// @brief Next state for byte @p c, or false if @p c is not allowed.
inline bool step(NumberState& state, char c, bool& is_integer) noexcept {
    switch (state) {
        case NumberState::Start:
            if (c == '+' || c == '-') { state = NumberState::AfterSign; return true; }
            [[fallthrough]];
        case NumberState::AfterSign:
            if (c == '0') { state = NumberState::AfterZero; return true; }
            if (is_digit(c)) { state = NumberState::IntegerPart; return true; }
            return false;
        case NumberState::AfterZero:
        case NumberState::IntegerPart:
            if (is_digit(c)) return state == NumberState::IntegerPart;
            if (c == '.') {
                state = NumberState::AfterDecimalPoint;
                is_integer = false;
                return true;
            }
            [[fallthrough]];
        case NumberState::FractionalPart:
            if (state == NumberState::FractionalPart && is_digit(c)) return true;
            if (c == 'e' || c == 'E') {
                state = NumberState::AfterExponent;
                is_integer = false;
                return true;
            }
            return false;
        case NumberState::AfterDecimalPoint:
            if (is_digit(c)) { state = NumberState::FractionalPart; return true; }
            return false;
        case NumberState::AfterExponent:
            if (c == '+' || c == '-') { state = NumberState::AfterExponentSign; return true; }
            [[fallthrough]];
        case NumberState::AfterExponentSign:
            if (is_digit(c)) { state = NumberState::ExponentPart; return true; }
            return false;
        case NumberState::ExponentPart:
            return is_digit(c);
    }
    return false;
}

inline Number convert_integer(const Cursor& cur, std::string_view text, size_t start) {
    int64_t value = 0;
    const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (BOURNE_UNLIKELY(ec != std::errc{} || p != text.data() + text.size())) {
        cur.fail(errc::invalid_integer, start, std::string(text),
                 ec != std::errc{} ? ec : std::errc::invalid_argument);
    }
    return Number(value);
}

/// @brief Value of an out-of-range literal: +-HUGE_VAL on overflow, +-0 or
/// the nearest subnormal on underflow.
inline double saturate(std::string_view text) {
    const std::string buf(text);
    return std::strtod(buf.c_str(), nullptr);
}

inline Number convert_float(const Cursor& cur, std::string_view text, size_t start) {
#if defined(__cpp_lib_to_chars) && __cpp_lib_to_chars >= 201611L
    double value = 0.0;
    const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (BOURNE_LIKELY(ec == std::errc{} && p == text.data() + text.size())) {
        return Number(value);
    }
    if (ec == std::errc::result_out_of_range && p == text.data() + text.size()) {
        return Number(saturate(text));
    }
    cur.fail(errc::invalid_float, start, std::string(text),
             ec != std::errc{} ? ec : std::errc::invalid_argument);
#else
    const std::string buf(text);
    char* end_ptr = nullptr;
    const double value = std::strtod(buf.c_str(), &end_ptr);
    if (BOURNE_UNLIKELY(end_ptr != buf.c_str() + buf.size())) {
        cur.fail(errc::invalid_float, start, buf, std::errc::invalid_argument);
    }
    return Number(value);
#endif
}

/// @brief Scan one numeric literal starting at the cursor.
/// On success the cursor sits on the terminator (or at end of input).
inline Number scan_number(Cursor& cur) {
    const size_t start = cur.offset();
    NumberState state = NumberState::Start;
    bool is_integer = true;
    size_t end = start;
    bool terminated = false;

    while (auto ib = cur.indexed_next()) {
        if (is_number_terminator(ib->byte)) {
            if (BOURNE_UNLIKELY(!is_accepting(state))) {
                cur.fail(errc::invalid_character, ib->index);
            }
            end = ib->index;
            cur.rewind();
            terminated = true;
            break;
        }
        if (BOURNE_UNLIKELY(!step(state, ib->byte, is_integer))) {
            cur.fail(errc::invalid_character, ib->index);
        }
    }

    if (!terminated) {
        if (BOURNE_UNLIKELY(state == NumberState::Start)) {
            cur.fail(errc::invalid_character, cur.offset());
        }
        if (BOURNE_UNLIKELY(!is_accepting(state))) {
            cur.fail(errc::unexpected_eof, cur.offset(), "incomplete number");
        }
        end = cur.offset();
    }

    if (BOURNE_UNLIKELY(end == start)) {
        cur.fail(errc::invalid_character, cur.offset());
    }

    std::string_view text = cur.slice(start, end);
    // from_chars accepts '-' but not '+'.
    if (text.front() == '+') text.remove_prefix(1);

    return is_integer ? convert_integer(cur, text, start)
                      : convert_float(cur, text, start);
}

} // namespace bourne::detail
