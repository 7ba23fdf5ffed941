#include "gradelib/utf8.hh"

#include <gtest/gtest.h>

// NOLINTNEXTLINE
TEST(utf8, find_invalid_utf8) {
    EXPECT_EQ(find_invalid_utf8(""), std::nullopt);
    EXPECT_EQ(find_invalid_utf8("plain ascii\n"), std::nullopt);
    EXPECT_EQ(find_invalid_utf8("za\xc5\xbc\xc3\xb3\xc5\x82\xc4\x87"), std::nullopt);
    EXPECT_EQ(find_invalid_utf8("\xe2\x82\xac \xf0\x9f\x98\x80"), std::nullopt);

    EXPECT_EQ(find_invalid_utf8("ab\xff"), 2);
    EXPECT_EQ(find_invalid_utf8("a\x80"), 1); // lone continuation byte
    EXPECT_EQ(find_invalid_utf8("a\xc5"), 1); // truncated sequence
    EXPECT_EQ(find_invalid_utf8("\xc0\xaf"), 0); // overlong
    EXPECT_EQ(find_invalid_utf8("\xed\xa0\x80"), 0); // surrogate
    EXPECT_EQ(find_invalid_utf8("\xf4\x90\x80\x80"), 0); // above U+10FFFF
}

// NOLINTNEXTLINE
TEST(utf8, Utf8DecodeError) {
    Utf8DecodeError err(7);
    EXPECT_EQ(err.offset(), 7);
    EXPECT_STREQ(err.what(), "invalid UTF-8 sequence at byte 7");
}
