#include "utils/utf8.h"
#include <gtest/gtest.h>

TEST(Utf8Test, DecodesAllSequenceLengths)
{
    // A, é, █, 😀
    const std::string text = "A\xC3\xA9\xE2\x96\x88\xF0\x9F\x98\x80";
    EXPECT_EQ(Utf8::decode(text), std::u32string({ 0x41, 0xE9, 0x2588, 0x1F600 }));
}

TEST(Utf8Test, EncodeInvertsDecode)
{
    const std::u32string codepoints = U" .:░▒▓█😀";
    EXPECT_EQ(Utf8::decode(Utf8::encode(codepoints)), codepoints);
    EXPECT_EQ(Utf8::encode(U'é'), "\xC3\xA9");
}

TEST(Utf8Test, EmptyStringDecodesToEmpty)
{
    EXPECT_TRUE(Utf8::decode("").empty());
}

TEST(Utf8Test, MalformedInputIsRejected)
{
    EXPECT_THROW(Utf8::decode("\x80"), Utf8::DecodeError);          // stray continuation byte
    EXPECT_THROW(Utf8::decode("ab\xE2\x96"), Utf8::DecodeError);    // truncated
    EXPECT_THROW(Utf8::decode("\xC3\x41"), Utf8::DecodeError);      // bad continuation
    EXPECT_THROW(Utf8::decode("\xC0\xAF"), Utf8::DecodeError);      // overlong '/'
    EXPECT_THROW(Utf8::decode("\xED\xA0\x80"), Utf8::DecodeError);  // surrogate
    EXPECT_THROW(Utf8::decode("\xF4\x90\x80\x80"), Utf8::DecodeError); // above U+10FFFF
    EXPECT_THROW(Utf8::decode("\xFF"), Utf8::DecodeError);
}

TEST(Utf8Test, DescribeFormatsCodePoint)
{
    EXPECT_EQ(Utf8::describe(U'A'), "U+0041");
    EXPECT_EQ(Utf8::describe(0x1F600), "U+1F600");
}
