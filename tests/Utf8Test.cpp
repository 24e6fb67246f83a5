#include "chat/Utf8.h"

#include <gtest/gtest.h>

#include <string>

using relaychat::chat::is_valid_utf8;

TEST(Utf8Test, AcceptsWellFormedText) {
    EXPECT_TRUE(is_valid_utf8(""));
    EXPECT_TRUE(is_valid_utf8("plain ascii"));
    EXPECT_TRUE(is_valid_utf8("caf\xc3\xa9"));              // é
    EXPECT_TRUE(is_valid_utf8("\xe2\x82\xac 5"));           // €
    EXPECT_TRUE(is_valid_utf8("\xf0\x9f\x98\x80"));         // U+1F600
    EXPECT_TRUE(is_valid_utf8("\xf4\x8f\xbf\xbf"));         // U+10FFFF
}

TEST(Utf8Test, RejectsMalformedText) {
    EXPECT_FALSE(is_valid_utf8("caf\xe9"));                 // Latin-1 byte
    EXPECT_FALSE(is_valid_utf8("\xc3"));                    // truncated
    EXPECT_FALSE(is_valid_utf8("\xe2\x82"));                // truncated
    EXPECT_FALSE(is_valid_utf8("\x80"));                    // lone continuation
    EXPECT_FALSE(is_valid_utf8("\xc0\xaf"));                // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xe0\x80\xaf"));            // overlong '/'
    EXPECT_FALSE(is_valid_utf8("\xed\xa0\x80"));            // surrogate
    EXPECT_FALSE(is_valid_utf8("\xf4\x90\x80\x80"));        // above U+10FFFF
    EXPECT_FALSE(is_valid_utf8("\xff"));
    EXPECT_FALSE(is_valid_utf8("\xc3\x28"));                // bad continuation
}
