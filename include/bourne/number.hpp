#pragma once

/// @file number.hpp
/// @brief Number: either a 64-bit signed integer or a double, never both.
///
/// The kind is fixed when the number is created. The parser picks Int for
/// literals without '.', 'e' or 'E' and Float otherwise, so "1" and "1.0"
/// are different numbers.

#include "config.hpp"
#include "error.hpp"

#include <cstdint>
#include <string>

namespace bourne {

class Number {
public:
    enum class Kind : uint8_t { Int, Float };

    constexpr Number() noexcept : kind_(Kind::Int), u_(int64_t{0}) {}
    constexpr Number(int v) noexcept : kind_(Kind::Int), u_(static_cast<int64_t>(v)) {}
    constexpr Number(int64_t v) noexcept : kind_(Kind::Int), u_(v) {}
    constexpr Number(double v) noexcept : kind_(Kind::Float), u_(v) {}

    [[nodiscard]] constexpr Kind kind() const noexcept { return kind_; }
    [[nodiscard]] constexpr bool is_int() const noexcept { return kind_ == Kind::Int; }
    [[nodiscard]] constexpr bool is_float() const noexcept { return kind_ == Kind::Float; }

    int64_t as_int() const {
        if (BOURNE_UNLIKELY(!is_int())) throw TypeError("expected integer number, got float");
        return u_.i;
    }

    double as_float() const {
        if (BOURNE_UNLIKELY(!is_float())) throw TypeError("expected float number, got integer");
        return u_.d;
    }

    /// Either kind as a double. Integers above 2^53 lose precision.
    [[nodiscard]] constexpr double to_double() const noexcept {
        return is_int() ? static_cast<double>(u_.i) : u_.d;
    }

    /// Same kind and same value; Int(1) != Float(1.0).
    [[nodiscard]] constexpr bool operator==(const Number& other) const noexcept {
        if (kind_ != other.kind_) return false;
        return is_int() ? u_.i == other.u_.i : u_.d == other.u_.d;
    }
    [[nodiscard]] constexpr bool operator!=(const Number& other) const noexcept {
        return !(*this == other);
    }

private:
    Kind kind_;
    union Payload {
        int64_t i;
        double d;
        constexpr Payload(int64_t v) noexcept : i(v) {}
        constexpr Payload(double v) noexcept : d(v) {}
    } u_;
};

} // namespace bourne
