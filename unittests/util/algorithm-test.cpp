/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <ferry/util/algorithm.h>
#include <ferry/util/fixed_vector.h>

namespace
{
    struct Item {
        int key;
        int order;
    };
} // namespace

TEST(Algorithm, find_if)
{
    util::fixed_vector<int, 8> v;
    for (int n : { 3, 8, 5, 8 })
        ASSERT_TRUE(v.push_back(n));

    auto it = util::find_if(v, [](int n) { return n == 8; });
    ASSERT_NE(v.end(), it);
    EXPECT_EQ(1, it - v.begin());

    it = util::find_if(v, [](int n) { return n > 100; });
    EXPECT_EQ(v.end(), it);
}

TEST(Algorithm, find_if_empty)
{
    util::fixed_vector<int, 4> v;
    EXPECT_EQ(v.end(), util::find_if(v, [](int) { return true; }));
}

TEST(Algorithm, for_each)
{
    int values[] = { 1, 2, 3, 4 };
    int sum = 0;
    util::for_each(values, values + 4, [&](int n) { sum += n; });
    EXPECT_EQ(10, sum);
}

TEST(Algorithm, insertion_sort)
{
    util::fixed_vector<uint64_t, 16> v;
    for (uint64_t n : { 0x100000ull, 0ull, 0xffffffffffffffffull, 0x9fc00ull, 0x100000ull, 42ull })
        ASSERT_TRUE(v.push_back(n));

    util::insertion_sort(v, [](uint64_t a, uint64_t b) { return a < b; });
    const uint64_t expected[] = { 0, 42, 0x9fc00, 0x100000, 0x100000, 0xffffffffffffffff };
    ASSERT_EQ(6, v.size());
    for (size_t n = 0; n < v.size(); n++)
        EXPECT_EQ(expected[n], v[n]);
}

TEST(Algorithm, insertion_sort_is_stable)
{
    util::fixed_vector<Item, 8> v;
    const Item items[] = { { 2, 0 }, { 1, 1 }, { 2, 2 }, { 1, 3 }, { 0, 4 }, { 2, 5 } };
    for (const auto& item : items)
        ASSERT_TRUE(v.push_back(item));

    util::insertion_sort(v, [](const Item& a, const Item& b) { return a.key < b.key; });
    const int expected_order[] = { 4, 1, 3, 0, 2, 5 };
    for (size_t n = 0; n < v.size(); n++)
        EXPECT_EQ(expected_order[n], v[n].order);
}

TEST(Algorithm, insertion_sort_trivial)
{
    util::fixed_vector<int, 4> v;
    util::insertion_sort(v, [](int a, int b) { return a < b; });
    EXPECT_TRUE(v.empty());

    ASSERT_TRUE(v.push_back(7));
    util::insertion_sort(v, [](int a, int b) { return a < b; });
    ASSERT_EQ(1, v.size());
    EXPECT_EQ(7, v[0]);
}
