/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
/*
 * Boot information handed to the kernel.
 *
 * The kernel receives the physical address of a FERRY_BOOTINFO_HEADER in its
 * first argument register. Sections follow the header, each aligned to 8
 * bytes and each starting with a FERRY_BOOTINFO_SECTION; a section with tag
 * FERRY_BOOTINFO_TAG_END terminates the list. All values are little endian.
 *
 * Minor versions only ever append new section types; kernels must skip tags
 * they do not know.
 */
#ifndef FERRY_BOOTINFO_H
#define FERRY_BOOTINFO_H

#include <ferry/types.h>

#define FERRY_BOOTINFO_MAGIC 0x0b0071f0
#define FERRY_BOOTINFO_VERSION_MAJOR 1
#define FERRY_BOOTINFO_VERSION_MINOR 0
#define FERRY_BOOTINFO_MAX_LENGTH (64 * 1024)
#define FERRY_BOOTINFO_SECTION_ALIGN 8

struct FERRY_BOOTINFO_HEADER {
    /* 00 */ uint32_t bh_magic;
    /* 04 */ uint16_t bh_version_major;
    /* 06 */ uint16_t bh_version_minor;
    /* 08 */ uint32_t bh_total_length;
    /* 0c */ uint32_t bh_first_section;
} __attribute__((packed));

struct FERRY_BOOTINFO_SECTION {
    /* 00 */ uint32_t bs_tag;
#define FERRY_BOOTINFO_TAG_END 0
#define FERRY_BOOTINFO_TAG_MEMORY_MAP 1
#define FERRY_BOOTINFO_TAG_COMMAND_LINE 2
#define FERRY_BOOTINFO_TAG_MODULES 3
#define FERRY_BOOTINFO_TAG_FRAMEBUFFER 4
#define FERRY_BOOTINFO_TAG_FIRMWARE 5
    /* 04 */ uint32_t bs_length; /* includes this header */
} __attribute__((packed));

struct FERRY_BOOTINFO_MEMORY_MAP {
    /* 00 */ uint32_t mm_count;
    /* 04 */ uint32_t mm_entry_size;
} __attribute__((packed));

struct FERRY_BOOTINFO_MEMORY_ENTRY {
    /* 00 */ uint64_t me_base;
    /* 08 */ uint64_t me_length;
    /* 10 */ uint32_t me_type;
#define FERRY_MEMORY_USABLE 1
#define FERRY_MEMORY_RESERVED 2
#define FERRY_MEMORY_ACPI_RECLAIM 3
#define FERRY_MEMORY_ACPI_NVS 4
#define FERRY_MEMORY_BAD_RAM 5
#define FERRY_MEMORY_BOOTLOADER 6
#define FERRY_MEMORY_FRAMEBUFFER 7
    /* 14 */ uint32_t me_attributes;
#define FERRY_MEMORY_ATTR_RUNTIME (1 << 0)
#define FERRY_MEMORY_ATTR_NON_VOLATILE (1 << 1)
#define FERRY_MEMORY_ATTR_UNCACHED (1 << 2)
#define FERRY_MEMORY_ATTR_WRITE_COMBINE (1 << 3)
} __attribute__((packed));

struct FERRY_BOOTINFO_MODULES {
    /* 00 */ uint32_t md_count;
    /* 04 */ uint32_t md_entry_size;
} __attribute__((packed));

#define FERRY_MODULE_NAME_LENGTH 64

struct FERRY_BOOTINFO_MODULE {
    /* 00 */ uint64_t mod_base;
    /* 08 */ uint64_t mod_length;
    /* 10 */ uint32_t mod_type;
#define FERRY_MODULE_GENERIC 0
#define FERRY_MODULE_RAMDISK 1
#define FERRY_MODULE_SYMBOLS 2
    /* 14 */ uint32_t mod_reserved;
    /* 18 */ char mod_name[FERRY_MODULE_NAME_LENGTH];
} __attribute__((packed));

struct FERRY_BOOTINFO_FRAMEBUFFER {
    /* 00 */ uint64_t fb_base;
    /* 08 */ uint32_t fb_width;
    /* 0c */ uint32_t fb_height;
    /* 10 */ uint32_t fb_pitch;
    /* 14 */ uint8_t fb_bpp;
    /* 15 */ uint8_t fb_red_size;
    /* 16 */ uint8_t fb_red_shift;
    /* 17 */ uint8_t fb_green_size;
    /* 18 */ uint8_t fb_green_shift;
    /* 19 */ uint8_t fb_blue_size;
    /* 1a */ uint8_t fb_blue_shift;
    /* 1b */ uint8_t fb_reserved[5];
} __attribute__((packed));

struct FERRY_BOOTINFO_FIRMWARE {
    /* 00 */ uint32_t fw_kind;
#define FERRY_FIRMWARE_UEFI 1
#define FERRY_FIRMWARE_DEVICE_TREE 2
    /* 04 */ uint32_t fw_reserved;
    /* 08 */ uint64_t fw_address;
} __attribute__((packed));

#ifdef __cplusplus
static_assert(sizeof(FERRY_BOOTINFO_HEADER) == 16, "bootinfo header size mismatch");
static_assert(sizeof(FERRY_BOOTINFO_SECTION) == 8, "bootinfo section size mismatch");
static_assert(sizeof(FERRY_BOOTINFO_MEMORY_ENTRY) == 24, "memory entry size mismatch");
static_assert(sizeof(FERRY_BOOTINFO_MODULE) == 88, "module entry size mismatch");
static_assert(sizeof(FERRY_BOOTINFO_FRAMEBUFFER) == 32, "framebuffer size mismatch");
static_assert(sizeof(FERRY_BOOTINFO_FIRMWARE) == 16, "firmware handoff size mismatch");
#endif

#endif /* FERRY_BOOTINFO_H */
