#pragma once

/// @file parser.hpp
/// @brief Recursive-descent JSON parser.
///
/// Features:
///   - One byte of lookahead picks the sub-parser; no backtracking
///   - Byte-accurate error offsets (ParseError::offset())
///   - Exception-free parsing via try_parse() with error_code
///   - Recursion depth limiting to protect against stack overflow
///
/// The accepted grammar is strict about separators (no leading, doubled or
/// trailing commas, no bare keys) and lenient about escapes (see
/// string_scanner.hpp) and a leading '+' on numbers.

#include "config.hpp"
#include "detail/cursor.hpp"
#include "detail/number_scanner.hpp"
#include "detail/string_scanner.hpp"
#include "error.hpp"
#include "parse_options.hpp"
#include "value.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace bourne {
namespace detail {

class Parser {
public:
    /// @brief Parse a complete JSON text (with exceptions).
    [[nodiscard]] static Value parse(std::string_view input,
                                     const ParseOptions& opts = {}) {
        Parser p(input, opts);
        p.cur_.eat_whitespace();
        Value result = p.parse_value();
        p.cur_.eat_whitespace();
        if (BOURNE_UNLIKELY(!p.cur_.is_eof())) {
            p.cur_.fail(errc::invalid_character, p.cur_.offset(), "trailing content");
        }
        return result;
    }

    /// @brief Parse a complete JSON text (no parse exceptions, error_code).
    [[nodiscard]] static result<Value> try_parse(std::string_view input,
                                                 const ParseOptions& opts = {}) {
        try {
            return {parse(input, opts), {}, {}};
        } catch (const ParseError& e) {
            return {Value{}, e.code(), e.location()};
        }
    }

private:
    Cursor cur_;
    size_t depth_ = 0;
    size_t max_depth_;

    Parser(std::string_view input, const ParseOptions& opts) noexcept
        : cur_(input), max_depth_(opts.effective_max_depth()) {}

    // ─── Depth tracking ──────────────────────────────────────────────────────

    void push_depth(size_t at) {
        if (BOURNE_UNLIKELY(++depth_ > max_depth_)) {
            cur_.fail(errc::max_depth_exceeded, at,
                      "limit is " + std::to_string(max_depth_));
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Delimiters ──────────────────────────────────────────────────────────

    /// Consume @p c or fail at the offending byte.
    size_t expect(char c) {
        const auto ib = cur_.indexed_next();
        if (BOURNE_UNLIKELY(!ib)) cur_.fail(errc::unexpected_eof, cur_.offset());
        if (BOURNE_UNLIKELY(ib->byte != c)) {
            cur_.fail(errc::invalid_character, ib->index,
                      std::string("expected '") + c + "'");
        }
        return ib->index;
    }

    // ─── Value parsing ───────────────────────────────────────────────────────

    Value parse_value() {
        const auto c = cur_.peek();
        if (BOURNE_UNLIKELY(!c)) cur_.fail(errc::unexpected_eof, cur_.offset());

        switch (*c) {
            case 'n': return parse_null();
            case 't':
            case 'f': return Value(parse_boolean());
            case '+': case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return Value(scan_number(cur_));
            case '"': return Value(scan_string(cur_));
            case '[': return parse_array();
            case '{': return parse_object();
            default:
                cur_.fail(errc::invalid_character, cur_.offset());
        }
    }

    Value parse_null() {
        if (BOURNE_UNLIKELY(!cur_.matches("null"))) {
            cur_.fail(errc::invalid_character, cur_.offset(), "expected 'null'");
        }
        cur_.advance(4);
        return Value(nullptr);
    }

    bool parse_boolean() {
        if (cur_.matches("true")) {
            cur_.advance(4);
            return true;
        }
        if (cur_.matches("false")) {
            cur_.advance(5);
            return false;
        }
        cur_.fail(errc::invalid_character, cur_.offset(), "expected 'true' or 'false'");
    }

    // ─── Array parsing ────────────────────────────────────────────────────

    Value parse_array() {
        push_depth(expect('['));
        Array arr;

        for (;;) {
            cur_.eat_whitespace();
            const auto c = cur_.peek();
            if (BOURNE_UNLIKELY(!c)) cur_.fail(errc::unexpected_eof, cur_.offset());

            // Only a genuinely empty array may close here.
            if (*c == ']' && arr.empty()) {
                cur_.advance(1);
                break;
            }
            if (BOURNE_UNLIKELY(*c == ']' || *c == ',')) {
                cur_.fail(errc::unexpected_comma, cur_.offset());
            }

            arr.push_back(parse_value());
            cur_.eat_whitespace();

            const auto sep = cur_.indexed_next();
            if (BOURNE_UNLIKELY(!sep)) cur_.fail(errc::unexpected_eof, cur_.offset());
            if (sep->byte == ']') break;
            if (BOURNE_UNLIKELY(sep->byte != ',')) {
                cur_.fail(errc::invalid_character, sep->index, "expected ',' or ']' in array");
            }
        }

        pop_depth();
        return Value(std::move(arr));
    }

    // ─── Object parsing ──────────────────────────────────────────────────

    Value parse_object() {
        push_depth(expect('{'));
        Object obj;

        for (;;) {
            cur_.eat_whitespace();
            const auto c = cur_.peek();
            if (BOURNE_UNLIKELY(!c)) cur_.fail(errc::unexpected_eof, cur_.offset());

            if (*c == '}' && obj.empty()) {
                cur_.advance(1);
                break;
            }
            if (BOURNE_UNLIKELY(*c == '}' || *c == ',')) {
                cur_.fail(errc::unexpected_comma, cur_.offset());
            }
            if (BOURNE_UNLIKELY(*c != '"')) {
                cur_.fail(errc::invalid_character, cur_.offset(), "expected string key in object");
            }

            std::string key = scan_string(cur_);
            cur_.eat_whitespace();
            expect(':');
            cur_.eat_whitespace();
            Value value = parse_value();
            // Later duplicates overwrite earlier ones.
            obj.insert(std::move(key), std::move(value));
            cur_.eat_whitespace();

            const auto sep = cur_.indexed_next();
            if (BOURNE_UNLIKELY(!sep)) cur_.fail(errc::unexpected_eof, cur_.offset());
            if (sep->byte == '}') break;
            if (BOURNE_UNLIKELY(sep->byte != ',')) {
                cur_.fail(errc::invalid_character, sep->index, "expected ',' or '}' in object");
            }
        }

        pop_depth();
        return Value(std::move(obj));
    }
};

} // namespace detail

// ─── Public parsing API ─────────────────────────────────────────────────────

/// @brief Parse JSON from a string (with exceptions).
/// @throws ParseError on invalid JSON.
[[nodiscard]] inline Value parse(std::string_view input,
                                 const ParseOptions& opts = {}) {
    return detail::Parser::parse(input, opts);
}

/// @brief Parse JSON (no parse exceptions, returns result with error_code).
[[nodiscard]] inline result<Value> try_parse(std::string_view input,
                                             const ParseOptions& opts = {}) {
    return detail::Parser::try_parse(input, opts);
}

} // namespace bourne
