/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_INTERVAL_H
#define FERRY_UTIL_INTERVAL_H

namespace util
{
    // Contains the half-open interval [begin, end)
    template<typename T>
    struct interval {
        using value_type = T;

        value_type begin{};
        value_type end{};

        constexpr bool empty() const { return begin >= end; }

        constexpr value_type length() const { return empty() ? value_type{} : end - begin; }

        constexpr bool contains(const value_type& value) const
        {
            return value >= begin && value < end;
        }

        // Whether 'other' lies completely within this interval
        constexpr bool contains(const interval& other) const
        {
            return !other.empty() && other.begin >= begin && other.end <= end;
        }

        constexpr interval overlap(const interval& other) const
        {
            interval result;
            if (begin >= other.end) return result;
            if (end <= other.begin) return result;
            result.begin = (begin > other.begin) ? begin : other.begin;
            result.end = (end < other.end) ? end : other.end;
            return result;
        }

        constexpr bool overlaps(const interval& other) const { return !overlap(other).empty(); }

        friend constexpr bool operator==(const interval& a, const interval& b)
        {
            return a.begin == b.begin && a.end == b.end;
        }

        friend constexpr bool operator!=(const interval& a, const interval& b) { return !(a == b); }
    };

} // namespace util

#endif /* FERRY_UTIL_INTERVAL_H */
