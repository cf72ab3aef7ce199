#include <gtest/gtest.h>

#include "utf8.h"

using grep::decode_utf8;
using grep::encode_utf8;


TEST(Utf8, AsciiIsUnchanged) {
    EXPECT_EQ(decode_utf8("grep"), U"grep");
    EXPECT_EQ(decode_utf8(""), U"");
}


TEST(Utf8, MultiByteSequences) {
    // é (2 bytes), € (3 bytes), 😀 (4 bytes)
    EXPECT_EQ(decode_utf8("\xC3\xA9"), U"\u00E9");
    EXPECT_EQ(decode_utf8("\xE2\x82\xAC"), U"\u20AC");
    EXPECT_EQ(decode_utf8("\xF0\x9F\x98\x80"), U"\U0001F600");
    EXPECT_EQ(decode_utf8("caf\xC3\xA9!").size(), 5u);
}


TEST(Utf8, MalformedBytesBecomeLoneSurrogates) {
    // stray continuation byte
    EXPECT_EQ(decode_utf8("a\x80" "b"), std::u32string({U'a', 0xDC80, U'b'}));
    // truncated sequence
    EXPECT_EQ(decode_utf8("\xE2\x82"), std::u32string({0xDCE2, 0xDC82}));
    // overlong encoding of '/'
    EXPECT_EQ(decode_utf8("\xC0\xAF"), std::u32string({0xDCC0, 0xDCAF}));
    // UTF-16 surrogate
    EXPECT_EQ(decode_utf8("\xED\xA0\x80"), std::u32string({0xDCED, 0xDCA0, 0xDC80}));
}


TEST(Utf8, MalformedByteIsNotALatin1Character) {
    EXPECT_NE(decode_utf8("\xE9"), decode_utf8("\xC3\xA9"));
    EXPECT_NE(decode_utf8("\xFF"), U"\u00FF");
}


TEST(Utf8, EncodeRestoresWellFormedText) {
    std::string text = "na\xC3\xAFve \xE2\x82\xAC \xF0\x9F\x98\x80";
    EXPECT_EQ(encode_utf8(decode_utf8(text)), text);
}


TEST(Utf8, EncodeRestoresMalformedBytes) {
    std::string text = "a\xE9" "b\xFF\xE2\x82";
    EXPECT_EQ(encode_utf8(decode_utf8(text)), text);
}
