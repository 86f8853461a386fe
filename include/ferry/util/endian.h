/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_UTIL_ENDIAN_H
#define FERRY_UTIL_ENDIAN_H

#include <stdint.h>

/*
 * Byte-wise access to little and big endian values; these never depend on
 * the alignment of the pointer nor on the byte order of the host.
 */
namespace util
{
    inline uint16_t get_le16(const void* p)
    {
        auto b = static_cast<const uint8_t*>(p);
        return static_cast<uint16_t>(b[0] | b[1] << 8);
    }

    inline uint32_t get_le32(const void* p)
    {
        auto b = static_cast<const uint8_t*>(p);
        return static_cast<uint32_t>(b[0]) | static_cast<uint32_t>(b[1]) << 8 |
               static_cast<uint32_t>(b[2]) << 16 | static_cast<uint32_t>(b[3]) << 24;
    }

    inline uint64_t get_le64(const void* p)
    {
        auto b = static_cast<const uint8_t*>(p);
        return static_cast<uint64_t>(get_le32(b)) | static_cast<uint64_t>(get_le32(b + 4)) << 32;
    }

    inline uint32_t get_be32(const void* p)
    {
        auto b = static_cast<const uint8_t*>(p);
        return static_cast<uint32_t>(b[0]) << 24 | static_cast<uint32_t>(b[1]) << 16 |
               static_cast<uint32_t>(b[2]) << 8 | static_cast<uint32_t>(b[3]);
    }

    inline uint64_t get_be64(const void* p)
    {
        auto b = static_cast<const uint8_t*>(p);
        return static_cast<uint64_t>(get_be32(b)) << 32 | get_be32(b + 4);
    }

    inline void put_le16(void* p, uint16_t v)
    {
        auto b = static_cast<uint8_t*>(p);
        b[0] = v & 0xff;
        b[1] = (v >> 8) & 0xff;
    }

    inline void put_le32(void* p, uint32_t v)
    {
        auto b = static_cast<uint8_t*>(p);
        for (int n = 0; n < 4; n++)
            b[n] = (v >> (n * 8)) & 0xff;
    }

    inline void put_le64(void* p, uint64_t v)
    {
        auto b = static_cast<uint8_t*>(p);
        for (int n = 0; n < 8; n++)
            b[n] = (v >> (n * 8)) & 0xff;
    }

    inline void put_be32(void* p, uint32_t v)
    {
        auto b = static_cast<uint8_t*>(p);
        for (int n = 0; n < 4; n++)
            b[n] = (v >> ((3 - n) * 8)) & 0xff;
    }

} // namespace util

#endif // FERRY_UTIL_ENDIAN_H
