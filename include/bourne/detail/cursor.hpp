#pragma once

/// @file cursor.hpp
/// @brief Byte cursor over a fully buffered input.
///
/// The cursor never fails: reads past the end return std::nullopt and
/// advance() clamps at the end. The offset only moves forward, except for
/// rewind(), which steps back one byte so a terminator consumed by the
/// number scanner can be read again by its caller.

#include "../config.hpp"
#include "../error.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace bourne::detail {

/// @brief A byte and the offset it was read from.
struct IndexedByte {
    size_t index;
    char byte;
};

/// @brief ASCII whitespace: space, tab, line feed, form feed, carriage return.
constexpr bool is_ascii_whitespace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\f' || c == '\r';
}

class Cursor {
public:
    explicit Cursor(std::string_view input) noexcept : input_(input) {}

    [[nodiscard]] std::string_view input() const noexcept { return input_; }
    [[nodiscard]] size_t offset() const noexcept { return pos_; }
    [[nodiscard]] bool is_eof() const noexcept { return pos_ >= input_.size(); }

    /// Next byte without consuming it.
    [[nodiscard]] std::optional<char> peek() const noexcept {
        if (pos_ >= input_.size()) return std::nullopt;
        return input_[pos_];
    }

    std::optional<char> next() noexcept {
        if (pos_ >= input_.size()) return std::nullopt;
        return input_[pos_++];
    }

    /// Consume one byte, paired with the offset it was read from.
    std::optional<IndexedByte> indexed_next() noexcept {
        if (pos_ >= input_.size()) return std::nullopt;
        IndexedByte ib{pos_, input_[pos_]};
        ++pos_;
        return ib;
    }

    void advance(size_t n) noexcept {
        const size_t remaining = input_.size() - pos_;
        pos_ += n < remaining ? n : remaining;
    }

    /// Step back exactly one byte.
    void rewind() noexcept {
        if (pos_ > 0) --pos_;
    }

    /// True if @p literal occurs verbatim at the current offset.
    [[nodiscard]] bool matches(std::string_view literal) const noexcept {
        return input_.substr(pos_).substr(0, literal.size()) == literal;
    }

    void eat_whitespace() noexcept {
        while (pos_ < input_.size() && is_ascii_whitespace(input_[pos_])) ++pos_;
    }

    /// Throw a ParseError at @p offset of this input.
    [[noreturn]] BOURNE_NOINLINE void fail(errc code, size_t offset,
                                           const std::string& context = {},
                                           std::errc cause = std::errc{}) const {
        raise(input_, code, offset, context, cause);
    }

    /// Bytes in [begin, end).
    [[nodiscard]] std::string_view slice(size_t begin, size_t end) const noexcept {
        return input_.substr(begin, end - begin);
    }

private:
    std::string_view input_;
    size_t pos_ = 0;
};

} // namespace bourne::detail
