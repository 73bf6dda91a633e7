// EN: Unit tests for the UTF-8 and trimming helpers
// FR: Tests unitaires des utilitaires UTF-8 et de découpe des blancs

#include <gtest/gtest.h>
#include "infrastructure/io/text_utils.hpp"

#include <string>

using namespace FP::IO::TextUtils;

TEST(TextUtilsTest, ValidTextIsUnchanged) {
    std::string text = "caf\xC3\xA9, na\xC3\xAFve, \xE2\x82\xAC 12";
    EXPECT_TRUE(isValidUtf8(text));
    EXPECT_EQ(sanitizeUtf8(text), text);
}

TEST(TextUtilsTest, InvalidBytesAreReplaced) {
    // EN: Latin-1 "é" is a lone 0xE9 byte
    // FR: Le "é" Latin-1 est un octet 0xE9 isolé
    std::string latin1 = "caf\xE9";
    EXPECT_FALSE(isValidUtf8(latin1));
    EXPECT_EQ(sanitizeUtf8(latin1), "caf" + std::string(kReplacementCharacter));
}

TEST(TextUtilsTest, OverlongAndSurrogateSequencesAreRejected) {
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));
    EXPECT_FALSE(isValidUtf8("\xE0\x80\xAF"));
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80"));
}

TEST(TextUtilsTest, TruncatedSequenceAtEndIsReplaced) {
    std::string text = "ab\xE2\x82";
    std::string expected = "ab" + std::string(kReplacementCharacter) + std::string(kReplacementCharacter);
    EXPECT_EQ(sanitizeUtf8(text), expected);
}

TEST(TextUtilsTest, PrefixCountsCodePoints) {
    std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9x";
    EXPECT_EQ(utf8Length(text), 4u);
    EXPECT_EQ(utf8Prefix(text, 2), "\xC3\xA9\xC3\xA9");
    EXPECT_EQ(utf8Prefix(text, 10), text);
    EXPECT_EQ(utf8Prefix(text, 0), "");
}

TEST(TextUtilsTest, PrefixNeverSplitsASequence) {
    std::string text(499, 'a');
    text += "\xE2\x82\xAC";
    text += "tail";
    std::string prefix = utf8Prefix(text, 500);
    EXPECT_EQ(prefix.size(), 502u);
    EXPECT_TRUE(isValidUtf8(prefix));
}

TEST(TextUtilsTest, TrimRemovesAsciiWhitespaceOnBothEnds) {
    EXPECT_EQ(trim("  a,b \r\n"), "a,b");
    EXPECT_EQ(trim("\t\f\vx y\v"), "x y");
    EXPECT_EQ(trim(" \r\n\t"), "");
    EXPECT_EQ(trim(""), "");
    EXPECT_EQ(trim("inner  space"), "inner  space");
}
