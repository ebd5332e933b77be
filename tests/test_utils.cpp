#include <gtest/gtest.h>
#include <core/utils.hpp>

TEST(IsValidUtf8, AcceptsWellFormedText) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));               // U+00E9
    EXPECT_TRUE(is_valid_utf8("\xe0\xa0\x80"));              // U+0800, lowest 3-byte
    EXPECT_TRUE(is_valid_utf8("\xed\x9f\xbf"));              // U+D7FF, below surrogates
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x98\x80"));          // U+1F600
    EXPECT_TRUE(is_valid_utf8("\xf4\x8f\xbf\xbf"));          // U+10FFFF
}

TEST(IsValidUtf8, RejectsOverlongForms) {
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xe0\x80\xaf"));
    EXPECT_FALSE(is_valid_utf8("\xe0\x9f\xbf"));
    EXPECT_FALSE(is_valid_utf8("\xf0\x8f\xbf\xbf"));
}

TEST(IsValidUtf8, RejectsSurrogatesAndOutOfRange) {
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));             // U+D800
    EXPECT_FALSE(is_valid_utf8("\xed\xbf\xbf"));             // U+DFFF
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));         // U+110000
    EXPECT_FALSE(is_valid_utf8("\xf5\x80\x80\x80"));
}

TEST(IsValidUtf8, RejectsTruncatedSequences) {
    EXPECT_FALSE(is_valid_utf8("\xc3"));
    EXPECT_FALSE(is_valid_utf8("\xe2\x82"));
    EXPECT_FALSE(is_valid_utf8("\xff\xfe"));
}

TEST(QuotePlus, FormEncoding) {
    EXPECT_EQ(quote_plus("a b&c=d/e"), "a+b%26c%3Dd%2Fe");
    EXPECT_EQ(quote_plus("safe-._~"), "safe-._~");
}

TEST(ShellSingleQuote, EscapesEmbeddedQuotes) {
    EXPECT_EQ(shell_single_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_single_quote(""), "''");
}
