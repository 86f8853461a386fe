/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <ferry/util/fixed_vector.h>
#include <ferry/util/interval.h>
#include "loader/result.h"

struct Framebuffer;
struct LoaderContext;

namespace memmap
{
    // Values match the boot information memory types
    enum class RegionType : uint32_t {
        Usable = 1,
        Reserved = 2,
        AcpiReclaim = 3,
        AcpiNvs = 4,
        BadRam = 5,
        Bootloader = 6,
        Framebuffer = 7,
    };

    namespace attribute
    {
        static constexpr uint32_t Runtime = (1 << 0);
        static constexpr uint32_t NonVolatile = (1 << 1);
        static constexpr uint32_t Uncached = (1 << 2);
        static constexpr uint32_t WriteCombine = (1 << 3);
    } // namespace attribute

    struct MemoryRegion {
        addr_t mr_base = 0;
        uint64_t mr_length = 0;
        RegionType mr_type = RegionType::Reserved;
        uint32_t mr_attributes = 0;

        // mr_base + mr_length never overflows in a normalized map
        addr_t End() const { return mr_base + mr_length; }
        util::interval<addr_t> AsInterval() const { return { mr_base, End() }; }

        friend bool operator==(const MemoryRegion& a, const MemoryRegion& b)
        {
            return a.mr_base == b.mr_base && a.mr_length == b.mr_length && a.mr_type == b.mr_type &&
                   a.mr_attributes == b.mr_attributes;
        }
    };

    // Where a raw entry came from; architectural entries override firmware ones
    enum class Source { Firmware, Architectural };

    struct RawRegion {
        MemoryRegion rr_region;
        Source rr_source = Source::Firmware;
    };

    static constexpr size_t MaxRegions = 256;
    static constexpr size_t MaxRawRegions = 512;

    using MemoryMap = util::fixed_vector<MemoryRegion, MaxRegions>;
    using RawMemoryMap = util::fixed_vector<RawRegion, MaxRawRegions>;

    struct Statistics {
        uint64_t s_total = 0;
        uint64_t s_usable = 0;
        uint64_t s_bootloader = 0;
        uint64_t s_reserved = 0;
    };

    /*
     * Turns raw descriptors into a sorted, non-overlapping map without empty
     * entries; where entries overlap the type with the highest precedence wins,
     * and adjacent entries with identical type and attributes are merged.
     */
    Result Normalize(const RawMemoryMap& raw, MemoryMap& map);

    /*
     * Gathers raw descriptors from the firmware into the scratch raw map and
     * normalizes them; 'fb' is added as a Framebuffer region if present.
     */
    Result Acquire(const LoaderContext& lc, const Framebuffer* fb, MemoryMap& map);

    // Converts a UEFI memory type and attribute set
    MemoryRegion FromEfiDescriptor(uint32_t type, addr_t base, uint64_t pages, uint64_t attributes);

    // Reclassifies [base, base + length) as 'type' wherever the map describes it
    Result Reserve(
        const MemoryMap& in, addr_t base, uint64_t length, RegionType type, MemoryMap& out);

    /*
     * Reclassifies [base, base + length) as Bootloader in place. Under UEFI the
     * pages are claimed from the firmware as well, and recorded so that they
     * can be given back if the boot attempt fails.
     */
    bool Claim(const LoaderContext& lc, MemoryMap& map, addr_t base, uint64_t length);

    // Returns [base, base + length) to Usable, releasing it to UEFI if needed
    bool Release(const LoaderContext& lc, MemoryMap& map, addr_t base, uint64_t length);

    // Releases everything claimed since the last call
    void ReleaseAllClaims(const LoaderContext& lc);
    void ForgetClaims(const LoaderContext& lc);

    // Whether [base, base + length) lies completely within a single region of 'type'
    bool IsWithinRegionOfType(const MemoryMap& map, addr_t base, uint64_t length, RegionType type);

    /*
     * Finds 'size' bytes of Usable memory, aligned to 'alignment', within
     * [minimum, maximum). Picks the lowest such range, or the highest if
     * 'top_down' is set.
     */
    bool FindFree(
        const MemoryMap& map, uint64_t size, uint64_t alignment, addr_t minimum, addr_t maximum,
        bool top_down, addr_t& result);

    uint64_t LargestUsable(const MemoryMap& map);
    addr_t LowestUsable(const MemoryMap& map);
    Statistics GetStatistics(const MemoryMap& map);
    bool Validate(const MemoryMap& map);
    void Dump(const MemoryMap& map);

    int Precedence(RegionType type);
    const char* RegionTypeName(RegionType type);

    // Converts a type code as used by E820 and Multiboot
    RegionType FromE820Type(uint32_t type);

} // namespace memmap
