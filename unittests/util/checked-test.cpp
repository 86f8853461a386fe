/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <ferry/util/checked.h>

TEST(Checked, add)
{
    uint64_t result = 0;
    EXPECT_TRUE(util::checked_add<uint64_t>(0x7ee00000, 0x200000, result));
    EXPECT_EQ(0x7f000000u, result);

    EXPECT_TRUE(util::checked_add<uint64_t>(0xfffffffffffff000, 0xfff, result));
    EXPECT_EQ(0xffffffffffffffffu, result);
    EXPECT_FALSE(util::checked_add<uint64_t>(0xfffffffffffff000, 0x1000, result));
}

TEST(Checked, mul)
{
    uint64_t result = 0;
    EXPECT_TRUE(util::checked_mul<uint64_t>(2048, 512, result));
    EXPECT_EQ(1048576u, result);
    EXPECT_FALSE(util::checked_mul<uint64_t>(0x100000000, 0x100000000, result));

    uint32_t small = 0;
    EXPECT_FALSE(util::checked_mul<uint32_t>(0x10000, 0x10000, small));
}

TEST(Checked, is_power_of_2)
{
    EXPECT_FALSE(util::is_power_of_2<uint64_t>(0));
    EXPECT_TRUE(util::is_power_of_2<uint64_t>(1));
    EXPECT_TRUE(util::is_power_of_2<uint64_t>(4096));
    EXPECT_TRUE(util::is_power_of_2<uint64_t>(1ull << 63));
    EXPECT_FALSE(util::is_power_of_2<uint64_t>(4097));
    EXPECT_FALSE(util::is_power_of_2<uint64_t>(0x3000));
}

TEST(Checked, align_up)
{
    uint64_t result = 0;
    EXPECT_TRUE(util::checked_align_up<uint64_t>(0x100001, 0x1000, result));
    EXPECT_EQ(0x101000u, result);
    EXPECT_TRUE(util::checked_align_up<uint64_t>(0x200000, 0x200000, result));
    EXPECT_EQ(0x200000u, result);
    EXPECT_TRUE(util::checked_align_up<uint64_t>(0, 0x1000, result));
    EXPECT_EQ(0u, result);

    EXPECT_FALSE(util::checked_align_up<uint64_t>(0xfffffffffffff001, 0x1000, result));
}

TEST(Checked, align_down)
{
    EXPECT_EQ(0x7edb0000u, util::align_down<uint64_t>(0x7edb0fff, 0x1000));
    EXPECT_EQ(0x1000000u, util::align_down<uint64_t>(0x11fffff, 0x200000));
    EXPECT_EQ(0x200000u, util::align_down<uint64_t>(0x200000, 0x200000));
}
