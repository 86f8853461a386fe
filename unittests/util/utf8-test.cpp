/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <cstring>
#include <ferry/util/utf8.h>

namespace
{
    template<size_t N>
    size_t Copy(char (&dest)[N], const char* s)
    {
        return util::copy_utf8(dest, N, s, strlen(s));
    }
} // unnamed namespace

TEST(UTF8, copy)
{
    char dest[16];
    EXPECT_EQ(9u, Copy(dest, "initrd.gz"));
    EXPECT_STREQ("initrd.gz", dest);

    EXPECT_EQ(11u, Copy(dest, "caf\xc3\xa9-\xe2\x82\xac\xf0\x9f"));
    // The last sequence is incomplete and malformed
    EXPECT_STREQ("caf\xc3\xa9-\xe2\x82\xac??", dest);
}

TEST(UTF8, copy_stops_at_nul)
{
    char dest[16];
    EXPECT_EQ(2u, util::copy_utf8(dest, sizeof(dest), "ab\0cd", 5));
    EXPECT_STREQ("ab", dest);
}

TEST(UTF8, truncates_at_code_points)
{
    // Room for 'ab' and half of the e-acute
    char dest[4];
    EXPECT_EQ(2u, Copy(dest, "ab\xc3\xa9"));
    EXPECT_STREQ("ab", dest);

    char euro[3];
    EXPECT_EQ(0u, Copy(euro, "\xe2\x82\xac"));
    EXPECT_STREQ("", euro);

    char exact[4];
    EXPECT_EQ(3u, Copy(exact, "\xe2\x82\xac"));
    EXPECT_STREQ("\xe2\x82\xac", exact);
}

TEST(UTF8, replaces_malformed_bytes)
{
    char dest[16];
    // Stray continuation, overlong encoding, surrogate, beyond U+10FFFF, bad lead
    Copy(dest, "\x80"
               "a\xc0\xaf"
               "b\xed\xa0\x80"
               "c\xf4\x90\x80\x80"
               "d\xff");
    EXPECT_STREQ("?a??b???c????d?", dest);
}

TEST(UTF8, empty_destination)
{
    char dest[1] = { 'x' };
    EXPECT_EQ(0u, Copy(dest, "abc"));
    EXPECT_EQ('\0', dest[0]);
    EXPECT_EQ(0u, util::copy_utf8(dest, 0, "abc", 3));
}
