#include "escrow/util/utf8.hpp"

#include <cstdint>

namespace escrow {
namespace util {

std::optional<std::size_t> utf8_scalar_count(std::string_view text) {
  std::size_t count = 0;
  std::size_t i = 0;

  while (i < text.size()) {
    const auto lead = static_cast<std::uint8_t>(text[i]);

    std::size_t length = 0;
    std::uint32_t code_point = 0;
    std::uint32_t min_code_point = 0;

    if (lead < 0x80) {
      length = 1;
      code_point = lead;
    } else if ((lead & 0xE0) == 0xC0) {
      length = 2;
      code_point = lead & 0x1F;
      min_code_point = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
      length = 3;
      code_point = lead & 0x0F;
      min_code_point = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
      length = 4;
      code_point = lead & 0x07;
      min_code_point = 0x10000;
    } else {
      return std::nullopt;  // continuation byte or 0xF8..0xFF as lead
    }

    if (i + length > text.size()) {
      return std::nullopt;
    }

    for (std::size_t k = 1; k < length; ++k) {
      const auto byte = static_cast<std::uint8_t>(text[i + k]);
      if ((byte & 0xC0) != 0x80) {
        return std::nullopt;
      }
      code_point = (code_point << 6) | (byte & 0x3F);
    }

    if (length > 1 && code_point < min_code_point) {
      return std::nullopt;  // overlong
    }
    if (code_point >= 0xD800 && code_point <= 0xDFFF) {
      return std::nullopt;  // surrogate
    }
    if (code_point > 0x10FFFF) {
      return std::nullopt;
    }

    i += length;
    ++count;
  }

  return count;
}

}  // namespace util
}  // namespace escrow
