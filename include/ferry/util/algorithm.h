/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_ALGORITHM_H
#define FERRY_UTIL_ALGORITHM_H

#include "utility.h"

namespace util
{
    template<typename InputIterator, typename UnaryPredicate>
    InputIterator find_if(InputIterator first, InputIterator last, UnaryPredicate pred)
    {
        for (/* nothing */; first != last; ++first) {
            if (pred(*first))
                return first;
        }
        return last;
    }

    template<typename Container, typename UnaryPredicate>
    auto find_if(Container& container, UnaryPredicate pred)
    {
        return find_if(container.begin(), container.end(), pred);
    }

    template<typename InputIt, typename UnaryFunction>
    UnaryFunction for_each(InputIt first, InputIt last, UnaryFunction f)
    {
        for (/* nothing */; first != last; ++first)
            f(*first);
        return f;
    }

    template<typename Container, typename UnaryFunction>
    UnaryFunction for_each(Container& container, UnaryFunction f)
    {
        return for_each(container.begin(), container.end(), f);
    }

    /*
     * Stable insertion sort; the sequences we sort are a few hundred entries at
     * most, and we cannot allocate.
     */
    template<typename RandomIt, typename Less>
    void insertion_sort(RandomIt first, RandomIt last, Less less)
    {
        if (first == last)
            return;
        for (auto i = first + 1; i != last; ++i) {
            auto value = move(*i);
            auto j = i;
            for (/* nothing */; j != first && less(value, *(j - 1)); --j)
                *j = move(*(j - 1));
            *j = move(value);
        }
    }

    template<typename Container, typename Less>
    void insertion_sort(Container& container, Less less)
    {
        insertion_sort(container.begin(), container.end(), less);
    }

} // namespace util

#endif // FERRY_UTIL_ALGORITHM_H
