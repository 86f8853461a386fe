/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2018 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_ARRAY_H
#define FERRY_UTIL_ARRAY_H

#include <stddef.h>

namespace util
{
    // Similar to std::array - fixed-length array container
    template<typename T, size_t N>
    struct array {
        using value_type = T;
        using iterator = T*;
        using const_iterator = const T*;

        constexpr bool empty() const { return N == 0; }

        constexpr size_t size() const { return N; }

        constexpr T& operator[](size_t n) { return a_Items[n]; }

        constexpr const T& operator[](size_t n) const { return a_Items[n]; }

        constexpr T& front() { return a_Items[0]; }

        constexpr const T& front() const { return a_Items[0]; }

        constexpr T& back() { return a_Items[N - 1]; }

        constexpr const T& back() const { return a_Items[N - 1]; }

        T* data() { return a_Items; }

        const T* data() const { return a_Items; }

        void fill(const T& value)
        {
            for (auto& item : a_Items)
                item = value;
        }

        iterator begin() { return &a_Items[0]; }

        iterator end() { return &a_Items[N]; }

        const_iterator begin() const { return &a_Items[0]; }

        const_iterator end() const { return &a_Items[N]; }

        T a_Items[N];
    };

} // namespace util

#endif /* FERRY_UTIL_ARRAY_H */
