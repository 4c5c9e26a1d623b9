#pragma once

/// @file unescape.hpp
/// @brief Public escape decoder for raw (still escaped) string contents.

#include "detail/string_scanner.hpp"

#include <string>
#include <string_view>

namespace bourne {

/// @brief Decode the escape sequences in @p raw, the text between the
/// quotes of a JSON string.
/// @throws ParseError (invalid_hex, invalid_escape_sequence, unexpected_eof)
///         with offsets relative to @p raw.
[[nodiscard]] inline std::string unescape(std::string_view raw) {
    std::string out;
    detail::unescape_into(raw, 0, raw.size(), out);
    return out;
}

} // namespace bourne
