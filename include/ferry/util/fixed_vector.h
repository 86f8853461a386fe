/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_FIXED_VECTOR_H
#define FERRY_UTIL_FIXED_VECTOR_H

#include <stddef.h>
#include "utility.h"

namespace util
{
    /*
     * Vector with inline storage for at most N items; nothing is ever
     * allocated. Operations that would exceed the capacity fail instead.
     */
    template<typename T, size_t N>
    class fixed_vector
    {
      public:
        using value_type = T;
        using iterator = T*;
        using const_iterator = const T*;

        constexpr size_t capacity() const { return N; }
        size_t size() const { return v_Size; }
        bool empty() const { return v_Size == 0; }
        bool full() const { return v_Size == N; }

        void clear() { v_Size = 0; }

        T& operator[](size_t n) { return v_Items[n]; }
        const T& operator[](size_t n) const { return v_Items[n]; }

        T& front() { return v_Items[0]; }
        const T& front() const { return v_Items[0]; }
        T& back() { return v_Items[v_Size - 1]; }
        const T& back() const { return v_Items[v_Size - 1]; }

        T* data() { return v_Items; }
        const T* data() const { return v_Items; }

        iterator begin() { return &v_Items[0]; }
        iterator end() { return &v_Items[v_Size]; }
        const_iterator begin() const { return &v_Items[0]; }
        const_iterator end() const { return &v_Items[v_Size]; }

        [[nodiscard]] bool push_back(const T& item)
        {
            if (full())
                return false;
            v_Items[v_Size++] = item;
            return true;
        }

        void pop_back()
        {
            if (v_Size > 0)
                --v_Size;
        }

        // Inserts 'item' before 'pos'
        [[nodiscard]] bool insert(iterator pos, const T& item)
        {
            if (full())
                return false;
            for (auto it = end(); it != pos; --it)
                *it = move(*(it - 1));
            *pos = item;
            ++v_Size;
            return true;
        }

        iterator erase(iterator first, iterator last)
        {
            const auto count = last - first;
            for (auto it = last; it != end(); ++it)
                *(it - count) = move(*it);
            v_Size -= count;
            return first;
        }

        iterator erase(iterator pos) { return erase(pos, pos + 1); }

        friend bool operator==(const fixed_vector& a, const fixed_vector& b)
        {
            if (a.size() != b.size())
                return false;
            for (size_t n = 0; n < a.size(); ++n) {
                if (!(a[n] == b[n]))
                    return false;
            }
            return true;
        }

        friend bool operator!=(const fixed_vector& a, const fixed_vector& b) { return !(a == b); }

      private:
        T v_Items[N]{};
        size_t v_Size = 0;
    };

} // namespace util

#endif // FERRY_UTIL_FIXED_VECTOR_H
