// tests/test_text_utils.cpp
// Tests for the shared text helpers.

#include "text_utils.hpp"
#include <gtest/gtest.h>

TEST(TextUtils, TrimStripsSurroundingBlanksOnly) {
    EXPECT_EQ(trim("  mon. 09:00 \t\r\n"), "mon. 09:00");
    EXPECT_EQ(trim("a b"), "a b");
    EXPECT_EQ(trim(" \t "), "");
    EXPECT_EQ(trim(""), "");
}

TEST(TextUtils, ToLowerKeepsNonLetters) {
    EXPECT_EQ(toLower("Artificial Intelligence"), "artificial intelligence");
    EXPECT_EQ(toLower("THUR. 09:00-10:30"), "thur. 09:00-10:30");
}

TEST(TextUtils, IsBlank) {
    EXPECT_TRUE(isBlank(""));
    EXPECT_TRUE(isBlank(" \t\n"));
    EXPECT_FALSE(isBlank(" x "));
}
