#pragma once

/// @file hash.hpp
/// @brief String hashing for object key lookup.
///
/// 64-bit FNV-1a over the key bytes. Both object backings share it, so a
/// key hashes identically whether it is held as std::string or viewed as
/// std::string_view.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace bourne::detail {

struct KeyHash {
    using is_transparent = void;  // Heterogeneous lookup

    static size_t hash(const char* data, size_t len) noexcept {
        constexpr uint64_t kOffsetBasis = 0xcbf29ce484222325ULL;
        constexpr uint64_t kPrime       = 0x100000001b3ULL;

        uint64_t h = kOffsetBasis;
        for (size_t i = 0; i < len; ++i) {
            h ^= static_cast<unsigned char>(data[i]);
            h *= kPrime;
        }
        return static_cast<size_t>(h);
    }

    size_t operator()(std::string_view sv) const noexcept {
        return hash(sv.data(), sv.size());
    }

    size_t operator()(const std::string& s) const noexcept {
        return hash(s.data(), s.size());
    }
};

struct KeyEqual {
    using is_transparent = void;

    bool operator()(std::string_view a, std::string_view b) const noexcept {
        return a == b;
    }
};

} // namespace bourne::detail
