/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_KERNELIMAGE_H
#define FERRY_KERNELIMAGE_H

#include <ferry/types.h>

/*
 * Every kernel blob starts with this header; the (possibly compressed)
 * payload immediately follows it. All fields are little endian.
 */
#define FERRY_KERNEL_MAGIC 0x4b595246 /* 'FRYK' */
#define FERRY_KERNEL_HEADER_VERSION 1
#define FERRY_KERNEL_MIN_ALIGNMENT 4096

struct FERRY_KERNEL_HEADER {
    /* 00 */ uint32_t kh_magic;
    /* 04 */ uint16_t kh_header_version;
    /* 06 */ uint16_t kh_header_size;
    /* 08 */ uint32_t kh_flags;
#define FERRY_KERNEL_FLAG_NO_FRAMEBUFFER (1 << 0)
    /* 0c */ uint32_t kh_reserved0;
    /* 10 */ uint64_t kh_payload_size;
    /* 18 */ uint64_t kh_image_size;
    /* 20 */ uint64_t kh_entry_offset;
    /* 28 */ uint64_t kh_load_alignment;
    /* 30 */ uint32_t kh_reserved1[3];
    /* 3c */ uint32_t kh_header_crc32; /* covers bytes 00..3b */
} __attribute__((packed));

#ifdef __cplusplus
static_assert(sizeof(FERRY_KERNEL_HEADER) == 64, "kernel header size mismatch");
#endif

#endif /* FERRY_KERNELIMAGE_H */
