/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include "loader/physmem.h"

/* As outlined in
 * https://www.gnu.org/software/grub/manual/multiboot2/multiboot.html#Boot-information-format */
#define MULTIBOOT2_BOOTLOADER_MAGIC 0x36d76289

struct MULTIBOOT2_INFO {
    /* 00 */ uint32_t mi_total_size;
    /* 04 */ uint32_t mi_reserved;
} __attribute__((packed));

struct MULTIBOOT2_TAG {
    /* 00 */ uint32_t mt_type;
#define MULTIBOOT2_TAG_TYPE_END 0
#define MULTIBOOT2_TAG_TYPE_CMDLINE 1
#define MULTIBOOT2_TAG_TYPE_MODULE 3
#define MULTIBOOT2_TAG_TYPE_MMAP 6
#define MULTIBOOT2_TAG_TYPE_FRAMEBUFFER 8
    /* 04 */ uint32_t mt_size;
} __attribute__((packed));

struct MULTIBOOT2_TAG_MODULE {
    /* 00 */ MULTIBOOT2_TAG mm_tag;
    /* 08 */ uint32_t mm_mod_start;
    /* 0c */ uint32_t mm_mod_end;
    /* 10 */ char mm_string[0];
} __attribute__((packed));

struct MULTIBOOT2_TAG_MMAP {
    /* 00 */ MULTIBOOT2_TAG mm_tag;
    /* 08 */ uint32_t mm_entry_size;
    /* 0c */ uint32_t mm_entry_version;
} __attribute__((packed));

struct MULTIBOOT2_MMAP_ENTRY {
    /* 00 */ uint64_t me_base;
    /* 08 */ uint64_t me_length;
    /* 10 */ uint32_t me_type;
#define MULTIBOOT2_MEMORY_AVAILABLE 1
    /* 14 */ uint32_t me_reserved;
} __attribute__((packed));

struct MULTIBOOT2_TAG_FRAMEBUFFER {
    /* 00 */ MULTIBOOT2_TAG mf_tag;
    /* 08 */ uint64_t mf_addr;
    /* 10 */ uint32_t mf_pitch;
    /* 14 */ uint32_t mf_width;
    /* 18 */ uint32_t mf_height;
    /* 1c */ uint8_t mf_bpp;
    /* 1d */ uint8_t mf_type;
#define MULTIBOOT2_FRAMEBUFFER_TYPE_RGB 1
    /* 1e */ uint16_t mf_reserved;
    /* 20 */ uint8_t mf_red_field_position;
    /* 21 */ uint8_t mf_red_mask_size;
    /* 22 */ uint8_t mf_green_field_position;
    /* 23 */ uint8_t mf_green_mask_size;
    /* 24 */ uint8_t mf_blue_field_position;
    /* 25 */ uint8_t mf_blue_mask_size;
} __attribute__((packed));

namespace firmware::multiboot
{
    // Largest information structure we are willing to walk
    static constexpr uint32_t MaxInfoSize = 64 * 1024;

    const MULTIBOOT2_INFO* MapInfo(const PhysicalMemory& physmem, addr_t info);

    /*
     * Calls 'callback(const MULTIBOOT2_TAG&)' for every tag; the walk stops at
     * the end tag or at the first malformed tag.
     */
    template<typename Callback>
    void ForEachTag(const PhysicalMemory& physmem, addr_t info, Callback callback)
    {
        auto mi = MapInfo(physmem, info);
        if (mi == nullptr)
            return;
        auto base = reinterpret_cast<const uint8_t*>(mi);
        uint32_t offset = sizeof(MULTIBOOT2_INFO);
        while (offset + sizeof(MULTIBOOT2_TAG) <= mi->mi_total_size) {
            auto tag = reinterpret_cast<const MULTIBOOT2_TAG*>(base + offset);
            if (tag->mt_type == MULTIBOOT2_TAG_TYPE_END)
                break;
            if (tag->mt_size < sizeof(MULTIBOOT2_TAG) || tag->mt_size > mi->mi_total_size - offset)
                break;
            callback(*tag);
            offset += (tag->mt_size + 7) & ~7;
        }
    }

    // Returns the tag with the given type, or nullptr
    const MULTIBOOT2_TAG* FindTag(const PhysicalMemory& physmem, addr_t info, uint32_t type);

    // Returns the n-th module tag, or nullptr
    const MULTIBOOT2_TAG_MODULE* FindModule(const PhysicalMemory& physmem, addr_t info, unsigned int n);

} // namespace firmware::multiboot
