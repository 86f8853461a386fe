/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <gtest/gtest.h>
#include <vector>
#include <zlib.h>
#include <ferry/kernelimage.h>
#include <ferry/util/endian.h>

namespace fake
{
    /*
     * Deterministic filler; never starts with one of the compression
     * signatures, so it is detected as uncompressed.
     */
    inline std::vector<uint8_t> MakePayload(size_t length, uint8_t seed = 0x90)
    {
        std::vector<uint8_t> payload(length);
        for (size_t n = 0; n < length; n++)
            payload[n] = static_cast<uint8_t>((n * 7 + seed) ^ (n >> 9));
        return payload;
    }

    inline std::vector<uint8_t> Gzip(const std::vector<uint8_t>& data)
    {
        z_stream zs{};
        EXPECT_EQ(Z_OK, deflateInit2(&zs, Z_BEST_SPEED, Z_DEFLATED, 16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY));
        std::vector<uint8_t> out(deflateBound(&zs, data.size()) + 64);
        zs.next_in = const_cast<Bytef*>(data.data());
        zs.avail_in = static_cast<uInt>(data.size());
        zs.next_out = out.data();
        zs.avail_out = static_cast<uInt>(out.size());
        EXPECT_EQ(Z_STREAM_END, deflate(&zs, Z_FINISH));
        out.resize(zs.total_out);
        deflateEnd(&zs);
        return out;
    }

    struct KernelSpec {
        uint64_t ks_image_size = 0; // 0: same as the payload
        uint64_t ks_entry_offset = 0x1000;
        uint64_t ks_alignment = 0x1000;
        uint32_t ks_flags = 0;
        uint16_t ks_version = FERRY_KERNEL_HEADER_VERSION;
        uint32_t ks_magic = FERRY_KERNEL_MAGIC;
        bool ks_corrupt_crc = false;
    };

    inline void SetHeaderCrc(std::vector<uint8_t>& image)
    {
        const uint32_t crc = crc32(crc32(0L, Z_NULL, 0), image.data(), 0x3c);
        util::put_le32(&image[0x3c], crc);
    }

    // Header followed by 'payload'
    inline std::vector<uint8_t> MakeKernel(const std::vector<uint8_t>& payload, const KernelSpec& spec = KernelSpec{})
    {
        std::vector<uint8_t> image(sizeof(FERRY_KERNEL_HEADER));
        util::put_le32(&image[0x00], spec.ks_magic);
        util::put_le16(&image[0x04], spec.ks_version);
        util::put_le16(&image[0x06], sizeof(FERRY_KERNEL_HEADER));
        util::put_le32(&image[0x08], spec.ks_flags);
        util::put_le64(&image[0x10], payload.size());
        util::put_le64(&image[0x18], spec.ks_image_size != 0 ? spec.ks_image_size : payload.size());
        util::put_le64(&image[0x20], spec.ks_entry_offset);
        util::put_le64(&image[0x28], spec.ks_alignment);
        SetHeaderCrc(image);
        if (spec.ks_corrupt_crc)
            image[0x3c] ^= 0xff;
        image.insert(image.end(), payload.begin(), payload.end());
        return image;
    }

} // namespace fake
