/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <ferry/util/fixed_vector.h>

TEST(FixedVector, empty)
{
    util::fixed_vector<int, 4> v;
    EXPECT_TRUE(v.empty());
    EXPECT_FALSE(v.full());
    EXPECT_EQ(0, v.size());
    EXPECT_EQ(4, v.capacity());
    EXPECT_EQ(v.end(), v.begin());
}

TEST(FixedVector, push_back)
{
    util::fixed_vector<int, 3> v;
    ASSERT_TRUE(v.push_back(1));
    ASSERT_TRUE(v.push_back(2));
    ASSERT_TRUE(v.push_back(3));
    EXPECT_TRUE(v.full());
    EXPECT_EQ(3, v.size());
    EXPECT_EQ(1, v.front());
    EXPECT_EQ(3, v.back());

    int i = 0;
    for (auto& n : v) {
        i++;
        EXPECT_EQ(i, n);
    }
    EXPECT_EQ(3, i);
}

TEST(FixedVector, push_back_beyond_capacity_fails)
{
    util::fixed_vector<int, 2> v;
    ASSERT_TRUE(v.push_back(1));
    ASSERT_TRUE(v.push_back(2));
    EXPECT_FALSE(v.push_back(3));
    ASSERT_EQ(2, v.size());
    EXPECT_EQ(2, v.back());
}

TEST(FixedVector, pop_back)
{
    util::fixed_vector<int, 4> v;
    ASSERT_TRUE(v.push_back(1));
    ASSERT_TRUE(v.push_back(2));
    v.pop_back();
    ASSERT_EQ(1, v.size());
    EXPECT_EQ(1, v.back());
    v.pop_back();
    EXPECT_TRUE(v.empty());
    // Popping an empty vector leaves it empty
    v.pop_back();
    EXPECT_TRUE(v.empty());
}

TEST(FixedVector, insert)
{
    util::fixed_vector<int, 4> v;
    ASSERT_TRUE(v.push_back(1));
    ASSERT_TRUE(v.push_back(3));
    ASSERT_TRUE(v.insert(v.begin() + 1, 2));
    ASSERT_TRUE(v.insert(v.begin(), 0));
    ASSERT_EQ(4, v.size());
    for (int n = 0; n < 4; n++)
        EXPECT_EQ(n, v[n]);

    EXPECT_FALSE(v.insert(v.begin(), -1));
    EXPECT_EQ(0, v.front());
}

TEST(FixedVector, insert_at_end)
{
    util::fixed_vector<int, 4> v;
    ASSERT_TRUE(v.insert(v.end(), 5));
    ASSERT_TRUE(v.insert(v.end(), 6));
    ASSERT_EQ(2, v.size());
    EXPECT_EQ(5, v[0]);
    EXPECT_EQ(6, v[1]);
}

TEST(FixedVector, erase)
{
    // Remove from center
    {
        util::fixed_vector<int, 8> v;
        for (int n = 1; n <= 3; n++)
            ASSERT_TRUE(v.push_back(n));

        auto it = v.erase(v.begin() + 1);
        ASSERT_EQ(2, v.size());
        EXPECT_EQ(v.begin() + 1, it);
        EXPECT_EQ(1, v.front());
        EXPECT_EQ(3, v.back());
    }
    // Remove a range from begin
    {
        util::fixed_vector<int, 8> v;
        for (int n = 1; n <= 5; n++)
            ASSERT_TRUE(v.push_back(n));

        v.erase(v.begin(), v.begin() + 3);
        ASSERT_EQ(2, v.size());
        EXPECT_EQ(4, v.front());
        EXPECT_EQ(5, v.back());
    }
    // Remove the last item
    {
        util::fixed_vector<int, 8> v;
        ASSERT_TRUE(v.push_back(1));
        ASSERT_TRUE(v.push_back(2));

        auto it = v.erase(v.end() - 1);
        EXPECT_EQ(v.end(), it);
        ASSERT_EQ(1, v.size());
        EXPECT_EQ(1, v.back());
    }
}

TEST(FixedVector, clear)
{
    util::fixed_vector<int, 4> v;
    ASSERT_TRUE(v.push_back(1));
    ASSERT_TRUE(v.push_back(2));
    v.clear();
    EXPECT_TRUE(v.empty());
    ASSERT_TRUE(v.push_back(9));
    EXPECT_EQ(9, v.front());
}

TEST(FixedVector, compare)
{
    util::fixed_vector<int, 4> a, b;
    EXPECT_TRUE(a == b);

    ASSERT_TRUE(a.push_back(1));
    EXPECT_TRUE(a != b);
    ASSERT_TRUE(b.push_back(1));
    EXPECT_TRUE(a == b);

    ASSERT_TRUE(a.push_back(2));
    ASSERT_TRUE(b.push_back(3));
    EXPECT_FALSE(a == b);
}

TEST(FixedVector, copy)
{
    util::fixed_vector<int, 4> a;
    ASSERT_TRUE(a.push_back(1));
    ASSERT_TRUE(a.push_back(2));

    auto b = a;
    ASSERT_TRUE(b.push_back(3));
    EXPECT_EQ(2, a.size());
    EXPECT_EQ(3, b.size());
    EXPECT_EQ(2, b[1]);
}
