#pragma once

#include <cstddef>
#include <optional>
#include <string_view>

namespace escrow {
namespace util {

// -----------------------------------------------------------------------------
// utf8_scalar_count(text)
// -----------------------------------------------------------------------------
// @brief  Counts the Unicode scalar values encoded in `text`.
//
// @return The count, or std::nullopt if `text` is not well-formed UTF-8
//         (truncated sequence, stray continuation byte, overlong encoding,
//         UTF-16 surrogate, or a code point above U+10FFFF).
//
// @details
// Agreement descriptions are bounded in scalar values, not bytes: "café" is
// 4 scalars and 5 bytes. The engine uses this to enforce
// kMaxDescriptionLength on create.
// -----------------------------------------------------------------------------
std::optional<std::size_t> utf8_scalar_count(std::string_view text);

}  // namespace util
}  // namespace escrow
