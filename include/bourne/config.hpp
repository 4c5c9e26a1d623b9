#pragma once

/// @file config.hpp
/// @brief Configuration macros for the bourne library.
///
/// Controls:
///   - Branch prediction hints
///   - Default nesting depth limit
///   - Object backing policy (hash vs insertion-ordered)

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define BOURNE_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define BOURNE_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define BOURNE_NOINLINE    __attribute__((noinline))
#elif defined(_MSC_VER)
    #define BOURNE_LIKELY(x)   (x)
    #define BOURNE_UNLIKELY(x) (x)
    #define BOURNE_NOINLINE    __declspec(noinline)
#else
    #define BOURNE_LIKELY(x)   (x)
    #define BOURNE_UNLIKELY(x) (x)
    #define BOURNE_NOINLINE
#endif

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================
// Used when ParseOptions::max_depth is left at 0.

#if !defined(BOURNE_MAX_DEPTH)
    #define BOURNE_MAX_DEPTH 512
#endif

// =====================================================================
// Object backing policy
// =====================================================================
// 0: hash map, iteration order unspecified.
// 1: insertion-ordered entries with a lazy hash index.
// Chosen once per build; the CMake option BOURNE_PRESERVE_ORDER sets it
// on the library target so every translation unit agrees.

#if !defined(BOURNE_PRESERVE_ORDER)
    #define BOURNE_PRESERVE_ORDER 0
#endif

// =====================================================================
// Ordered object index threshold
// =====================================================================
// Below this many keys the ordered backing uses linear search.

#if !defined(BOURNE_OBJECT_LINEAR_THRESHOLD)
    #define BOURNE_OBJECT_LINEAR_THRESHOLD 16
#endif
