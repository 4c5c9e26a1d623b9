#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for bourne.

#include "config.hpp"
#include "detail/object_map.hpp"

#include <cstdint>
#include <vector>

namespace bourne {

// ─── Forward declarations ───────────────────────────────────────────────
class Value;
class Number;

/// JSON value kinds
enum class Type : uint8_t {
    Null   = 0,
    Bool   = 1,
    Number = 2,
    String = 3,
    Array  = 4,
    Object = 5
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:   return "null";
        case Type::Bool:   return "bool";
        case Type::Number: return "number";
        case Type::String: return "string";
        case Type::Array:  return "array";
        case Type::Object: return "object";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: values in insertion order.
using Array = std::vector<Value>;

/// JSON object: unique string keys mapped to values. The backing is a
/// build-wide policy, see BOURNE_PRESERVE_ORDER in config.hpp.
#if BOURNE_PRESERVE_ORDER
using Object = detail::OrderedMap<Value>;
#else
using Object = detail::HashMap<Value>;
#endif

} // namespace bourne
