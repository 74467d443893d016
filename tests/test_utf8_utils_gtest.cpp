#include <gtest/gtest.h>

#include <string>

#include "utf8_utils.hpp"

TEST(Utf8UtilsTest, LeadByteLength) {
    EXPECT_EQ(utf8_len('a'), 1u);
    EXPECT_EQ(utf8_len(0xD0), 2u);
    EXPECT_EQ(utf8_len(0xE2), 3u);
    EXPECT_EQ(utf8_len(0xF0), 4u);
    EXPECT_EQ(utf8_len(0x80), 1u) << "continuation byte is not a lead";
}

TEST(Utf8UtilsTest, ValidSequence) {
    const std::string s = u8"жx";
    EXPECT_TRUE(is_valid_utf8(0xD0, 2, s, 0));
    EXPECT_FALSE(is_valid_utf8(0xD0, 2, std::string("\xD0"), 0)) << "truncated";
    EXPECT_FALSE(is_valid_utf8(0xD0, 2, std::string("\xD0x"), 0)) << "bad continuation";
}

TEST(Utf8UtilsTest, CharIndexCountsCodePoints) {
    const std::string s = u8"ёж 'x";
    EXPECT_EQ(utf8_char_index(s, 0), 0u);
    EXPECT_EQ(utf8_char_index(s, 2), 1u);
    EXPECT_EQ(utf8_char_index(s, 5), 3u);
    EXPECT_EQ(utf8_char_index(s, 100), 5u);
}

TEST(Utf8UtilsTest, CharIndexStepsOverBrokenBytes) {
    const std::string s = "\xFF\xD0z";
    EXPECT_EQ(utf8_char_index(s, 3), 3u);
}

TEST(Utf8UtilsTest, Snippet) {
    EXPECT_EQ(make_snippet_utf8("hello world", 6, 20), "world");
    EXPECT_EQ(make_snippet_utf8("hello world", 0, 5), "hello...");
    EXPECT_EQ(make_snippet_utf8(u8"привет", 0, 2), u8"пр...");
    EXPECT_EQ(make_snippet_utf8("abc", 3, 5), "");
    EXPECT_EQ(make_snippet_utf8("abc", 0, 0), "");
}
