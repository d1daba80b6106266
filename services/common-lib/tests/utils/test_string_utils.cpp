/**
 * @file test_string_utils.cpp
 * @brief Unit tests for string utility functions
 */

#include <gtest/gtest.h>
#include <nisab/utils/string_utils.h>

using namespace nisab::utils;

TEST(StringUtilsTest, TrimRemovesSurroundingWhitespace) {
    EXPECT_EQ(trim("  hello \t\n"), "hello");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("a b"), "a b");
}

TEST(StringUtilsTest, CaseConversion) {
    EXPECT_EQ(toUpper("usd"), "USD");
    EXPECT_EQ(toLower("GoLd"), "gold");
}

TEST(StringUtilsTest, Utf8LengthCountsCodePoints) {
    EXPECT_EQ(utf8Length("abc"), 3u);
    EXPECT_EQ(utf8Length("\xD9\x85\xD8\xA7\xD9\x84"), 3u);  // Arabic "mal"
    EXPECT_EQ(utf8Length(""), 0u);
}
