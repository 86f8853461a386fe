/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <ferry/bootinfo.h>
#include "loader/framebuffer.h"
#include "loader/image.h"
#include "loader/memorymap.h"
#include "loader/result.h"

struct LoaderContext;

// Where the boot information ended up
struct BootInfo {
    addr_t bi_base = 0;
    uint32_t bi_length = 0;
    uint64_t bi_region_size = 0;
};

namespace bootinfo
{
    static constexpr size_t MaxSections = 16;

    struct Section {
        uint32_t s_tag = FERRY_BOOTINFO_TAG_END;
        const uint8_t* s_payload = nullptr;
        uint32_t s_length = 0; // payload only
    };

    /*
     * Decoded boot information. Sections are kept in their original order,
     * including the ones we do not know; their payload points into the bytes
     * that were parsed, so the view is only valid as long as those are.
     */
    struct BootInfoView {
        uint16_t bv_version_major = FERRY_BOOTINFO_VERSION_MAJOR;
        uint16_t bv_version_minor = FERRY_BOOTINFO_VERSION_MINOR;
        util::fixed_vector<Section, MaxSections> bv_sections;

        memmap::MemoryMap bv_memory_map;
        const char* bv_command_line = nullptr;
        image::ModuleList bv_modules;
        bool bv_has_framebuffer = false;
        Framebuffer bv_framebuffer;
        bool bv_has_firmware = false;
        uint32_t bv_firmware_kind = 0;
        addr_t bv_firmware_address = 0;
    };

    bool Parse(const void* data, size_t length, BootInfoView& view);

    // Size Serialize() will need for 'view'
    size_t GetSerializedSize(const BootInfoView& view);

    // Writes the header and the sections of 'view'; 'length' receives the total length
    Result Serialize(const BootInfoView& view, void* buffer, size_t size, size_t& length);

    /*
     * Claims a region for the boot information, then writes it there. The
     * embedded memory map is taken after the claim, so it describes the region
     * holding it.
     */
    Result Build(
        const LoaderContext& lc, memmap::MemoryMap& map, const char* command_line,
        const image::ModuleList& modules, const Framebuffer* fb, BootInfo& info);

} // namespace bootinfo
