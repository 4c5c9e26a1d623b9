#pragma once

/// @file parse_options.hpp
/// @brief Parser configuration.
///
/// The grammar itself is fixed (no comments, no trailing commas, no bare
/// keys); the only knob is the nesting limit.

#include "config.hpp"

#include <cstddef>

namespace bourne {

/// @brief Parser configuration.
struct ParseOptions {
    /// Maximum nesting depth of arrays and objects combined.
    /// 0 = use BOURNE_MAX_DEPTH from config.hpp.
    size_t max_depth = 0;

    /// Depth limit actually enforced.
    [[nodiscard]] constexpr size_t effective_max_depth() const noexcept {
        return max_depth > 0 ? max_depth : static_cast<size_t>(BOURNE_MAX_DEPTH);
    }

    // ─── Factory methods ─────────────────────────────────────────────────

    static constexpr ParseOptions defaults() noexcept {
        return {};
    }

    static constexpr ParseOptions with_max_depth(size_t depth) noexcept {
        ParseOptions opts;
        opts.max_depth = depth;
        return opts;
    }
};

} // namespace bourne
