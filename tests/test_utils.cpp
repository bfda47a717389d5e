#include "utils/utils.hpp"
#include <gtest/gtest.h>

// --- Tests for parse_duration_ms ---
TEST(UtilsTest, ParseDuration) {
  EXPECT_EQ(Utils::parse_duration_ms("15m"), 15ULL * 60 * 1000);
  EXPECT_EQ(Utils::parse_duration_ms("1h"), 3600000ULL);
  EXPECT_EQ(Utils::parse_duration_ms("7d"), 7ULL * 86400000);
  EXPECT_EQ(Utils::parse_duration_ms("1w"), 7ULL * 86400000);
  EXPECT_EQ(Utils::parse_duration_ms("1mo"), 30ULL * 86400000);
  EXPECT_EQ(Utils::parse_duration_ms(" 2H "), 2ULL * 3600000);
  // Invalid inputs
  EXPECT_FALSE(Utils::parse_duration_ms("").has_value());
  EXPECT_FALSE(Utils::parse_duration_ms("h").has_value());
  EXPECT_FALSE(Utils::parse_duration_ms("0h").has_value());
  EXPECT_FALSE(Utils::parse_duration_ms("3x").has_value());
}

// --- Tests for stable_hash ---
TEST(UtilsTest, StableHash) {
  // FNV-1a reference values
  EXPECT_EQ(Utils::stable_hash(""), 14695981039346656037ULL);
  EXPECT_EQ(Utils::hash_to_hex(Utils::stable_hash("a")), "af63dc4c8601ec8c");
  EXPECT_EQ(Utils::stable_hash(std::vector<std::string>{"a", "b"}),
            Utils::stable_hash(std::vector<std::string>{"a", "b"}));
  EXPECT_NE(Utils::stable_hash(std::vector<std::string>{"ab", "c"}),
            Utils::stable_hash(std::vector<std::string>{"a", "bc"}));
  EXPECT_EQ(Utils::hash_to_hex(0).size(), 16u);
}

// --- Tests for time helpers ---
TEST(UtilsTest, TimeFormatting) {
  EXPECT_EQ(Utils::format_iso8601_ms(1672574401123ULL),
            "2023-01-01T12:00:01.123Z");
  EXPECT_EQ(Utils::format_iso8601_ms(0), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(Utils::hour_of_day_utc(1672574401000ULL), 12);
  EXPECT_EQ(Utils::hour_of_day_utc(0), 0);
}

// --- Tests for string helpers ---
TEST(UtilsTest, StringHelpers) {
  auto parts = Utils::split_string("a,b,,c", ',');
  ASSERT_EQ(parts.size(), 4u);
  EXPECT_EQ(parts[2], "");
  EXPECT_EQ(Utils::trim_copy("  hi \t"), "hi");
  EXPECT_EQ(Utils::to_lower_copy("MiXeD"), "mixed");
  EXPECT_EQ(Utils::to_upper_copy("warn"), "WARN");
  EXPECT_EQ(Utils::to_upper_copy("\xC3\xA9x"), "\xC3\xA9X");
  EXPECT_EQ(Utils::string_to_number<int>("42"), 42);
  EXPECT_FALSE(Utils::string_to_number<int>("4x2").has_value());
  EXPECT_DOUBLE_EQ(*Utils::string_to_number<double>("2.5"), 2.5);
}
