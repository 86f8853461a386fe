/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_UTF8_H
#define FERRY_UTIL_UTF8_H

#include <stddef.h>
#include <stdint.h>

namespace util
{
    namespace detail
    {
        // Length of the well-formed UTF-8 sequence at 's', or 0 if there is none
        constexpr size_t utf8_sequence_length(const uint8_t* s, size_t avail)
        {
            const uint8_t lead = s[0];
            size_t len;
            uint8_t lo = 0x80, hi = 0xbf; // range of the second byte
            if (lead < 0x80)
                return 1;
            else if (lead >= 0xc2 && lead <= 0xdf)
                len = 2;
            else if (lead >= 0xe0 && lead <= 0xef) {
                len = 3;
                if (lead == 0xe0)
                    lo = 0xa0; // overlong
                else if (lead == 0xed)
                    hi = 0x9f; // surrogates
            } else if (lead >= 0xf0 && lead <= 0xf4) {
                len = 4;
                if (lead == 0xf0)
                    lo = 0x90; // overlong
                else if (lead == 0xf4)
                    hi = 0x8f; // beyond U+10FFFF
            } else
                return 0;

            if (avail < len || s[1] < lo || s[1] > hi)
                return 0;
            for (size_t n = 2; n < len; n++)
                if (s[n] < 0x80 || s[n] > 0xbf)
                    return 0;
            return len;
        }
    } // namespace detail

    /*
     * Copies at most 'length' bytes of 's' to 'dest', always terminating it;
     * the copy stops at a nul byte. The result is well-formed UTF-8: malformed
     * bytes become '?' and a code point that does not fit is left out
     * entirely. Returns the length of the copy.
     */
    inline size_t copy_utf8(char* dest, size_t size, const char* s, size_t length)
    {
        if (size == 0)
            return 0;
        auto src = reinterpret_cast<const uint8_t*>(s);
        size_t in = 0, out = 0;
        while (in < length && src[in] != '\0') {
            size_t len = detail::utf8_sequence_length(src + in, length - in);
            const bool malformed = len == 0;
            const size_t out_len = malformed ? 1 : len;
            if (out + out_len > size - 1)
                break;
            if (malformed) {
                dest[out++] = '?';
                in++;
                continue;
            }
            for (size_t n = 0; n < len; n++)
                dest[out++] = static_cast<char>(src[in++]);
        }
        dest[out] = '\0';
        return out;
    }

} // namespace util

#endif // FERRY_UTIL_UTF8_H
