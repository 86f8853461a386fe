/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_UTILITY_H
#define FERRY_UTIL_UTILITY_H

namespace util
{
    namespace detail
    {
        template<typename T>
        struct remove_reference {
            typedef T type;
        };

        template<typename T>
        struct remove_reference<T&> {
            typedef T type;
        };

    } // namespace detail

    template<typename T>
    typename detail::remove_reference<T>::type&& move(T&& obj)
    {
        return (typename detail::remove_reference<T>::type&&)obj;
    }

    template<typename T>
    void swap(T& a, T& b)
    {
        T tmp(move(a));
        a = move(b);
        b = move(tmp);
    }

    template<typename T>
    constexpr const T& min(const T& a, const T& b)
    {
        return (b < a) ? b : a;
    }

    template<typename T>
    constexpr const T& max(const T& a, const T& b)
    {
        return (a < b) ? b : a;
    }

} // namespace util

#endif // FERRY_UTIL_UTILITY_H
