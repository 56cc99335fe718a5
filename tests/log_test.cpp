#include <gtest/gtest.h>
#include <string>

#include "kg/log.hpp"

TEST(LogTest, FingerprintShowsOnlyAPrefix)
{
    // Keys of 12 or more characters keep their first four; shorter ones are fully masked.
    EXPECT_EQ(kg::key_fingerprint("AIzaSyD-secret"), "AIza\xE2\x80\xA6");
    EXPECT_EQ(kg::key_fingerprint("abcdefghijkl"), "abcd\xE2\x80\xA6");
    EXPECT_EQ(kg::key_fingerprint("abcdefghijk"), "****");
    EXPECT_EQ(kg::key_fingerprint("abcde"), "****");
    EXPECT_EQ(kg::key_fingerprint("abcd"), "****");
    EXPECT_EQ(kg::key_fingerprint(""), "****");
}
