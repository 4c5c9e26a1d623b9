#pragma once

/// @file error.hpp
/// @brief Error types for bourne: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: ParseError, TypeError (default)
///   - Via error_code: bourne::errc enum + bourne_category() (exception-free)
///
/// Use try_parse(input) for exception-free parsing.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>

namespace bourne {

// =====================================================================
// Source position for parse errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

/// @brief Resolve a byte offset into a line/column position.
/// Offsets past the end are clamped to the input size.
inline SourceLocation locate(std::string_view input, size_t offset) noexcept {
    SourceLocation loc;
    loc.offset = offset;
    const size_t stop = offset < input.size() ? offset : input.size();
    for (size_t i = 0; i < stop; ++i) {
        if (input[i] == '\n') { ++loc.line; loc.column = 1; }
        else { ++loc.column; }
    }
    return loc;
}

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief Error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Parse errors (1-49)
    invalid_character        = 1,
    unexpected_eof           = 2,
    unexpected_eof_in_string = 3,
    line_break_in_string     = 4,
    invalid_integer          = 5,
    invalid_float            = 6,
    invalid_escape_sequence  = 7,
    invalid_hex              = 8,
    unexpected_comma         = 9,
    max_depth_exceeded       = 10,

    // Value access errors (50-79)
    type_mismatch            = 50,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class bourne_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "bourne";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                       return "success";
            case errc::invalid_character:        return "invalid character";
            case errc::unexpected_eof:           return "unexpected end of stream";
            case errc::unexpected_eof_in_string: return "unexpected end of stream while parsing string";
            case errc::line_break_in_string:     return "line break while parsing string";
            case errc::invalid_integer:          return "integer literal out of range";
            case errc::invalid_float:            return "invalid float literal";
            case errc::invalid_escape_sequence:  return "invalid escape sequence";
            case errc::invalid_hex:              return "invalid hex digit in unicode escape";
            case errc::unexpected_comma:         return "unexpected separator in array or object";
            case errc::max_depth_exceeded:       return "maximum nesting depth exceeded";
            case errc::type_mismatch:            return "type mismatch";
            default:                             return "unknown bourne error";
        }
    }
};

} // namespace detail

/// @brief Get the bourne error category singleton.
inline const std::error_category& bourne_category() noexcept {
    static const detail::bourne_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from bourne::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), bourne_category()};
}

/// @brief Create an error_condition from bourne::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), bourne_category()};
}

// =====================================================================
// Exception types
// =====================================================================

/// @brief JSON parse error with source position information.
///
/// Numeric conversion failures (integer overflow, float out of range) also
/// carry the std::from_chars failure in cause().
class ParseError : public std::system_error {
public:
    ParseError(errc code, SourceLocation loc, const std::string& context = {},
               std::errc cause = std::errc{})
        : std::system_error(make_error_code(code), format_message(code, loc, context))
        , location_(loc)
        , cause_(cause) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief Byte index of the offending input.
    [[nodiscard]] size_t offset() const noexcept {
        return location_.offset;
    }

    /// @brief Native conversion failure, std::errc{} unless the error is
    /// errc::invalid_integer or errc::invalid_float.
    [[nodiscard]] std::errc cause() const noexcept {
        return cause_;
    }

private:
    static std::string format_message(errc code, const SourceLocation& loc,
                                      const std::string& context) {
        std::string msg = "bourne parse error at line " + std::to_string(loc.line) +
                          ", column " + std::to_string(loc.column) +
                          " (offset " + std::to_string(loc.offset) + "): " +
                          make_error_code(code).message();
        if (!context.empty()) {
            msg += ": ";
            msg += context;
        }
        return msg;
    }

    SourceLocation location_;
    std::errc cause_;
};

/// @brief Type mismatch when reading or mutating a value.
///
/// Raised by the typed getters and by the coerce-or-fail mutators; it marks
/// a broken caller assumption, not bad input.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

namespace detail {

/// @brief Throw a ParseError located at @p offset within @p input.
[[noreturn]] inline void raise(std::string_view input, errc code, size_t offset,
                               const std::string& context = {},
                               std::errc cause = std::errc{}) {
    throw ParseError(code, locate(input, offset), context, cause);
}

} // namespace detail

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code + error position.
/// Usage: auto [val, ec, loc] = bourne::try_parse(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;
    SourceLocation location;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace bourne

// Register bourne::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<bourne::errc> : true_type {};
} // namespace std
