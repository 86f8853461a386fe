/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_CHECKED_H
#define FERRY_UTIL_CHECKED_H

#include <stdint.h>

// Arithmetic on sizes and addresses that reports overflow instead of wrapping
namespace util
{
    template<typename T>
    [[nodiscard]] constexpr bool checked_add(T a, T b, T& result)
    {
        return !__builtin_add_overflow(a, b, &result);
    }

    template<typename T>
    [[nodiscard]] constexpr bool checked_mul(T a, T b, T& result)
    {
        return !__builtin_mul_overflow(a, b, &result);
    }

    template<typename T>
    constexpr bool is_power_of_2(T v)
    {
        return v != 0 && (v & (v - 1)) == 0;
    }

    // 'alignment' must be a power of two
    template<typename T>
    [[nodiscard]] constexpr bool checked_align_up(T v, T alignment, T& result)
    {
        T sum{};
        if (!checked_add(v, alignment - 1, sum))
            return false;
        result = sum & ~(alignment - 1);
        return true;
    }

    template<typename T>
    constexpr T align_down(T v, T alignment)
    {
        return v & ~(alignment - 1);
    }

} // namespace util

#endif // FERRY_UTIL_CHECKED_H
