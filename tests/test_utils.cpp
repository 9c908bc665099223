#include "utils/utils.hpp"
#include <gtest/gtest.h>

// --- Tests for convert_iso8601_to_ms ---
TEST(UtilsTest, ConvertIso8601ToMs) {
  auto utc = Utils::convert_iso8601_to_ms("2023-01-01T12:00:01Z");
  ASSERT_TRUE(utc.has_value());
  EXPECT_EQ(*utc, 1672574401000ULL);

  // 08:30 -05:00 is 13:30 UTC
  auto offset = Utils::convert_iso8601_to_ms("2025-05-23T08:30:00-05:00");
  ASSERT_TRUE(offset.has_value());
  EXPECT_EQ(*offset, 1748007000000ULL);

  auto compact_offset = Utils::convert_iso8601_to_ms("2025-05-23T08:30:00-0500");
  ASSERT_TRUE(compact_offset.has_value());
  EXPECT_EQ(*compact_offset, 1748007000000ULL);

  // Fractions are truncated to milliseconds
  auto fraction = Utils::convert_iso8601_to_ms("2023-01-01T12:00:01.25Z");
  ASSERT_TRUE(fraction.has_value());
  EXPECT_EQ(*fraction, 1672574401250ULL);
  auto micros = Utils::convert_iso8601_to_ms("2023-01-01T12:00:01.123456Z");
  ASSERT_TRUE(micros.has_value());
  EXPECT_EQ(*micros, 1672574401123ULL);

  // Invalid inputs
  EXPECT_FALSE(Utils::convert_iso8601_to_ms("").has_value());
  EXPECT_FALSE(Utils::convert_iso8601_to_ms("2023-13-01T00:00:00Z").has_value());
  EXPECT_FALSE(Utils::convert_iso8601_to_ms("2023-01-01 12:00:01").has_value());
  EXPECT_FALSE(Utils::convert_iso8601_to_ms("2023-01-01T12:00:01Zjunk").has_value());
  EXPECT_FALSE(Utils::convert_iso8601_to_ms("2023-01-01T12:00:01.Z").has_value());
}

TEST(UtilsTest, FormatMsAsIso8601) {
  EXPECT_EQ(Utils::format_ms_as_iso8601(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(Utils::format_ms_as_iso8601(1672574401250ULL),
            "2023-01-01T12:00:01.250Z");

  auto parsed = Utils::convert_iso8601_to_ms(
      Utils::format_ms_as_iso8601(1748007000042ULL));
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, 1748007000042ULL);
}

// --- Tests for split_string ---
TEST(UtilsTest, SplitString) {
  std::vector<std::string> expected = {"a", "b", "", "c"};
  EXPECT_EQ(Utils::split_string("a,b,,c", ','), expected);
  EXPECT_TRUE(Utils::split_string("", ',').empty());
  EXPECT_EQ(Utils::split_string("single", ',').size(), 1u);
}

// --- Tests for string_to_number ---
TEST(UtilsTest, StringToNumber) {
  EXPECT_EQ(Utils::string_to_number<int>("123").value_or(0), 123);
  EXPECT_EQ(Utils::string_to_number<uint64_t>("1800").value_or(0), 1800u);
  EXPECT_FALSE(Utils::string_to_number<int>("12a").has_value());
  EXPECT_FALSE(Utils::string_to_number<int>("").has_value());
  EXPECT_FALSE(Utils::string_to_number<uint32_t>("-1").has_value());
}

TEST(UtilsTest, TrimCopy) {
  EXPECT_EQ(Utils::trim_copy("  {\"a\":1}\r\n"), "{\"a\":1}");
  EXPECT_EQ(Utils::trim_copy("   "), "");
}
