#pragma once

/// @file value.hpp
/// @brief Library core: Value, the tagged union over every JSON kind.
///
/// Implementation:
///   - Null, Bool and Number live inline; String, Array and Object are
///     heap-allocated and exclusively owned by the Value
///   - Manual resource management (copy/move/destroy); a tree never shares
///     or cycles, so destruction tears down the whole subtree
///   - Two access styles, kept apart on purpose:
///       get()              fallible, returns nullptr when absent
///       vivify/push/insert coerce Null into the needed container and
///                          throw TypeError on any other kind

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "number.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace bourne {

class Value {
public:
    Value() noexcept : kind_(Type::Null) {}
    Value(std::nullptr_t) noexcept : kind_(Type::Null) {}
    Value(bool v) noexcept : kind_(Type::Bool) { u_.b = v; }
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_signed_v<T> &&
                               !std::is_same_v<T, bool>, int> = 0>
    Value(T v) noexcept : kind_(Type::Number) { u_.num = Number(static_cast<int64_t>(v)); }

    /// @throws std::out_of_range if @p v exceeds INT64_MAX.
    template <typename T,
              std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T> &&
                               !std::is_same_v<T, bool>, int> = 0>
    Value(T v) : kind_(Type::Null) {
        if (BOURNE_UNLIKELY(static_cast<uint64_t>(v) >
                            static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))) {
            throw std::out_of_range("integer " + std::to_string(v) + " exceeds int64 range");
        }
        u_.num = Number(static_cast<int64_t>(v));
        kind_ = Type::Number;
    }
    Value(double v) noexcept : kind_(Type::Number) { u_.num = Number(v); }
    Value(Number v) noexcept : kind_(Type::Number) { u_.num = v; }
    Value(const char* v) : kind_(Type::Null) {
        if (BOURNE_UNLIKELY(!v)) return;
        u_.str = new std::string(v);
        kind_ = Type::String;
    }
    Value(std::string_view v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(const std::string& v) : kind_(Type::String) { u_.str = new std::string(v); }
    Value(std::string&& v) : kind_(Type::String) { u_.str = new std::string(std::move(v)); }

    Value(const Array& v) : kind_(Type::Array) { u_.arr = new Array(v); }
    Value(Array&& v) : kind_(Type::Array) { u_.arr = new Array(std::move(v)); }
    Value(const Object& v) : kind_(Type::Object) { u_.obj = new Object(v); }
    Value(Object&& v) : kind_(Type::Object) { u_.obj = new Object(std::move(v)); }

    Value(const Value& o) : kind_(Type::Null) { copy_payload(o); }
    Value(Value&& o) noexcept : kind_(o.kind_), u_(o.u_) {
        o.kind_ = Type::Null;  // Only this is needed for destroy() to be a no-op
    }
    Value& operator=(const Value& o) {
        if (this != &o) { Value tmp(o); swap(tmp); }
        return *this;
    }
    Value& operator=(Value&& o) noexcept {
        // o may live inside this tree; take it before the old payload goes.
        Value tmp(std::move(o));
        swap(tmp);
        return *this;
    }
    ~Value() { destroy(); }

    void swap(Value& o) noexcept {
        std::swap(kind_, o.kind_);
        std::swap(u_, o.u_);
    }

    [[nodiscard]] static Value array() { return Value(Array{}); }
    [[nodiscard]] static Value object() { return Value(Object{}); }

    // ─── Kind queries ────────────────────────────────────────────────────

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()   const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()   const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_number() const noexcept { return kind_ == Type::Number; }
    [[nodiscard]] bool is_int()    const noexcept { return is_number() && u_.num.is_int(); }
    [[nodiscard]] bool is_float()  const noexcept { return is_number() && u_.num.is_float(); }
    [[nodiscard]] bool is_string() const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()  const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object() const noexcept { return kind_ == Type::Object; }

    // ─── Typed access (throws TypeError) ─────────────────────────────────

    bool as_bool() const {
        if (BOURNE_UNLIKELY(!is_bool())) throw mismatch("bool");
        return u_.b;
    }
    const Number& as_number() const {
        if (BOURNE_UNLIKELY(!is_number())) throw mismatch("number");
        return u_.num;
    }
    int64_t as_int() const { return as_number().as_int(); }
    double as_float() const { return as_number().as_float(); }

    [[nodiscard]] const std::string& as_string() const {
        if (BOURNE_UNLIKELY(!is_string())) throw mismatch("string");
        return *u_.str;
    }
    std::string& as_string() {
        if (BOURNE_UNLIKELY(!is_string())) throw mismatch("string");
        return *u_.str;
    }
    [[nodiscard]] const Array& as_array() const {
        if (BOURNE_UNLIKELY(!is_array())) throw mismatch("array");
        return *u_.arr;
    }
    Array& as_array() {
        if (BOURNE_UNLIKELY(!is_array())) throw mismatch("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (BOURNE_UNLIKELY(!is_object())) throw mismatch("object");
        return *u_.obj;
    }
    Object& as_object() {
        if (BOURNE_UNLIKELY(!is_object())) throw mismatch("object");
        return *u_.obj;
    }

    // ─── Fallible lookup ─────────────────────────────────────────────────
    // nullptr when the element is absent or this value is not the matching
    // container kind. Never throws for a kind mismatch.

    [[nodiscard]] const Value* get(size_t index) const noexcept {
        if (!is_array() || index >= u_.arr->size()) return nullptr;
        return &(*u_.arr)[index];
    }
    [[nodiscard]] Value* get(size_t index) noexcept {
        if (!is_array() || index >= u_.arr->size()) return nullptr;
        return &(*u_.arr)[index];
    }
    [[nodiscard]] const Value* get(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] Value* get(std::string_view key) {
        return is_object() ? u_.obj->find(key) : nullptr;
    }
    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }

    // ─── Coerce-or-fail mutation ─────────────────────────────────────────
    // The caller asserts the kind: Null becomes the needed container, any
    // other mismatch throws TypeError.

    /// @brief Element at @p index, converting Null to an empty array and
    /// growing the array with Nulls up to @p index.
    /// @throws std::length_error if @p index is SIZE_MAX.
    Value& vivify(size_t index) {
        if (BOURNE_UNLIKELY(index == std::numeric_limits<size_t>::max())) {
            throw std::length_error("array index out of range");
        }
        if (is_null()) *this = Value::array();
        auto& a = as_array();
        if (index >= a.size()) a.resize(index + 1);
        return a[index];
    }

    /// @brief Member @p key, converting Null to an empty object and
    /// inserting a Null member if the key is absent.
    Value& vivify(std::string_view key) {
        if (is_null()) *this = Value::object();
        return as_object().get_or_insert(key);
    }

    /// @brief Append to an array; Null becomes an empty array first.
    void push(Value v) {
        if (is_null()) *this = Value::array();
        as_array().push_back(std::move(v));
    }

    /// @brief Insert or overwrite a member; Null becomes an empty object
    /// first. Returns the replaced value, if any.
    std::optional<Value> insert(std::string key, Value v) {
        if (is_null()) *this = Value::object();
        return as_object().insert(std::move(key), std::move(v));
    }

    bool erase(std::string_view key) { return as_object().erase(key); }

    // ─── Size ────────────────────────────────────────────────────────────

    /// Code points for a string, elements for an array or object, 0 otherwise.
    [[nodiscard]] size_t size() const noexcept {
        switch (kind_) {
            case Type::String: return detail::utf8::count_scalars(*u_.str);
            case Type::Array:  return u_.arr->size();
            case Type::Object: return u_.obj->size();
            default:           return 0;
        }
    }
    [[nodiscard]] bool empty() const noexcept { return size() == 0; }

    // ─── Comparison ──────────────────────────────────────────────────────

    [[nodiscard]] bool operator==(const Value& other) const {
        if (kind_ != other.kind_) return false;
        switch (kind_) {
            case Type::Null:   return true;
            case Type::Bool:   return u_.b == other.u_.b;
            case Type::Number: return u_.num == other.u_.num;
            case Type::String: return *u_.str == *other.u_.str;
            case Type::Array:  return *u_.arr == *other.u_.arr;
            case Type::Object: return *u_.obj == *other.u_.obj;
        }
        return false;
    }
    [[nodiscard]] bool operator!=(const Value& other) const { return !(*this == other); }

private:
    Type kind_;
    union Payload {
        bool b;
        Number num;
        std::string* str;
        Array* arr;
        Object* obj;
        Payload() noexcept : b(false) {}
    } u_;

    TypeError mismatch(const char* expected) const {
        return TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    void copy_payload(const Value& o) {
        switch (o.kind_) {
            case Type::String: u_.str = new std::string(*o.u_.str); break;
            case Type::Array:  u_.arr = new Array(*o.u_.arr); break;
            case Type::Object: u_.obj = new Object(*o.u_.obj); break;
            default:           u_ = o.u_; break;
        }
        kind_ = o.kind_;
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: delete u_.str; break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
        kind_ = Type::Null;
    }
};

} // namespace bourne
