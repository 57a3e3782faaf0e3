// =============================================================================
// utf8_test.cpp
// =============================================================================
// Unit tests for escrow::util::utf8_scalar_count.
// =============================================================================

#include "escrow/util/utf8.hpp"

#include <gtest/gtest.h>

#include <string>

using escrow::util::utf8_scalar_count;

TEST(Utf8Test, CountsScalarValues) {
  EXPECT_EQ(utf8_scalar_count(""), 0u);
  EXPECT_EQ(utf8_scalar_count("hello"), 5u);
  EXPECT_EQ(utf8_scalar_count("caf\xC3\xA9"), 4u);             // café
  EXPECT_EQ(utf8_scalar_count("\xE2\x82\xAC"), 1u);            // euro sign
  EXPECT_EQ(utf8_scalar_count("\xF0\x9F\x98\x80!"), 2u);       // emoji + '!'
  EXPECT_EQ(utf8_scalar_count("\xF4\x8F\xBF\xBF"), 1u);        // U+10FFFF
}

TEST(Utf8Test, EmbeddedNulIsOneScalar) {
  std::string with_nul("a\0b", 3);
  EXPECT_EQ(utf8_scalar_count(with_nul), 3u);
}

TEST(Utf8Test, RejectsMalformedInput) {
  EXPECT_FALSE(utf8_scalar_count("\x80").has_value());          // stray continuation
  EXPECT_FALSE(utf8_scalar_count("\xC3").has_value());          // truncated
  EXPECT_FALSE(utf8_scalar_count("\xE2\x82").has_value());      // truncated
  EXPECT_FALSE(utf8_scalar_count("\xC3\x28").has_value());      // bad continuation
  EXPECT_FALSE(utf8_scalar_count("\xC0\xAF").has_value());      // overlong '/'
  EXPECT_FALSE(utf8_scalar_count("\xE0\x80\xAF").has_value());  // overlong
  EXPECT_FALSE(utf8_scalar_count("\xED\xA0\x80").has_value());  // surrogate
  EXPECT_FALSE(utf8_scalar_count("\xF4\x90\x80\x80").has_value());  // > U+10FFFF
  EXPECT_FALSE(utf8_scalar_count("\xFF").has_value());
}
