/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/memorymap.h"
#include "loader/lib.h"
#include "loader/trace.h"
#include <ferry/util/algorithm.h>
#include <ferry/util/checked.h>

namespace memmap
{
    namespace
    {
        addr_t ClippedEnd(const MemoryRegion& r)
        {
            addr_t end;
            if (!util::checked_add(r.mr_base, r.mr_length, end))
                return ~static_cast<addr_t>(0);
            return end;
        }

        bool CanMerge(const MemoryRegion& a, const MemoryRegion& b)
        {
            return a.End() == b.mr_base && a.mr_type == b.mr_type && a.mr_attributes == b.mr_attributes;
        }

        // Adds 'r' to the end of 'map', merging it with the last entry if possible
        bool Append(MemoryMap& map, const MemoryRegion& r)
        {
            if (r.mr_length == 0)
                return true;
            if (!map.empty() && CanMerge(map.back(), r)) {
                map.back().mr_length += r.mr_length;
                return true;
            }
            return map.push_back(r);
        }

        // Picks the winning entry of 'source' covering [begin, end); false if nothing covers it
        bool ResolveSegment(
            const RawMemoryMap& raw, Source source, addr_t begin, addr_t end, MemoryRegion& winner)
        {
            bool found = false;
            for (const auto& rr : raw) {
                const auto& r = rr.rr_region;
                if (rr.rr_source != source || r.mr_length == 0)
                    continue;
                if (r.mr_base > begin || ClippedEnd(r) < end)
                    continue;

                if (!found || Precedence(r.mr_type) > Precedence(winner.mr_type)) {
                    winner = r;
                    found = true;
                } else if (Precedence(r.mr_type) == Precedence(winner.mr_type)) {
                    winner.mr_attributes |= r.mr_attributes;
                }
            }
            return found;
        }

    } // unnamed namespace

    int Precedence(RegionType type)
    {
        switch (type) {
            case RegionType::Reserved:
                return 7;
            case RegionType::AcpiNvs:
                return 6;
            case RegionType::AcpiReclaim:
                return 5;
            case RegionType::Framebuffer:
                return 4;
            case RegionType::Bootloader:
                return 3;
            case RegionType::Usable:
                return 2;
            case RegionType::BadRam:
                return 1;
        }
        return 7;
    }

    const char* RegionTypeName(RegionType type)
    {
        switch (type) {
            case RegionType::Usable:
                return "usable";
            case RegionType::Reserved:
                return "reserved";
            case RegionType::AcpiReclaim:
                return "acpi-reclaim";
            case RegionType::AcpiNvs:
                return "acpi-nvs";
            case RegionType::BadRam:
                return "bad-ram";
            case RegionType::Bootloader:
                return "bootloader";
            case RegionType::Framebuffer:
                return "framebuffer";
        }
        return "unknown";
    }

    RegionType FromE820Type(uint32_t type)
    {
        switch (type) {
            case 1:
                return RegionType::Usable;
            case 3:
                return RegionType::AcpiReclaim;
            case 4:
                return RegionType::AcpiNvs;
            case 5:
                return RegionType::BadRam;
            default:
                return RegionType::Reserved;
        }
    }

    Result Normalize(const RawMemoryMap& raw, MemoryMap& map)
    {
        map.clear();

        /*
         * Every begin and end of a raw entry is a place where the outcome may
         * change; between two successive boundaries, the same set of raw entries
         * applies.
         */
        util::fixed_vector<addr_t, 2 * MaxRawRegions> boundaries;
        for (const auto& rr : raw) {
            const auto& r = rr.rr_region;
            if (r.mr_length == 0)
                continue;
            if (!boundaries.push_back(r.mr_base) || !boundaries.push_back(ClippedEnd(r)))
                return RESULT_MAKE_FAILURE(MemoryMapTooLarge);
        }
        util::insertion_sort(boundaries, [](addr_t a, addr_t b) { return a < b; });
        for (auto it = boundaries.begin(); it != boundaries.end() && it + 1 != boundaries.end();) {
            if (*it == *(it + 1))
                boundaries.erase(it + 1);
            else
                ++it;
        }

        for (size_t n = 0; n + 1 < boundaries.size(); n++) {
            const addr_t begin = boundaries[n];
            const addr_t end = boundaries[n + 1];

            MemoryRegion r;
            if (!ResolveSegment(raw, Source::Firmware, begin, end, r))
                continue; // hole; architectural entries never add memory

            MemoryRegion arch;
            if (ResolveSegment(raw, Source::Architectural, begin, end, arch))
                r.mr_type = arch.mr_type;

            r.mr_base = begin;
            r.mr_length = end - begin;
            if (!Append(map, r)) {
                TRACE(MEMMAP, ERROR, "more than %d regions after normalization", static_cast<int>(MaxRegions));
                return RESULT_MAKE_FAILURE(MemoryMapTooLarge);
            }
        }

        if (map.empty())
            return RESULT_MAKE_FAILURE(NoMemoryMap);
        return Result::Success();
    }

    Result Reserve(const MemoryMap& in, addr_t base, uint64_t length, RegionType type, MemoryMap& out)
    {
        const util::interval<addr_t> range{ base, ClippedEnd(MemoryRegion{ base, length }) };

        out.clear();
        for (const auto& r : in) {
            const auto ov = r.AsInterval().overlap(range);
            bool ok = true;
            if (ov.empty()) {
                ok = Append(out, r);
            } else {
                if (r.mr_base < ov.begin)
                    ok &= Append(out, { r.mr_base, ov.begin - r.mr_base, r.mr_type, r.mr_attributes });
                ok &= Append(out, { ov.begin, ov.length(), type, r.mr_attributes });
                if (ov.end < r.End())
                    ok &= Append(out, { ov.end, r.End() - ov.end, r.mr_type, r.mr_attributes });
            }
            if (!ok)
                return RESULT_MAKE_FAILURE(MemoryMapTooLarge);
        }

        TRACE(
            MEMMAP, INFO, "%llx-%llx now %s", static_cast<unsigned long long>(range.begin),
            static_cast<unsigned long long>(range.end), RegionTypeName(type));
        return Result::Success();
    }

    bool IsWithinRegionOfType(const MemoryMap& map, addr_t base, uint64_t length, RegionType type)
    {
        addr_t end;
        if (length == 0 || !util::checked_add(base, length, end))
            return false;
        const util::interval<addr_t> range{ base, end };
        auto it = util::find_if(map, [&](const MemoryRegion& r) {
            return r.mr_type == type && r.AsInterval().contains(range);
        });
        return it != map.end();
    }

    bool FindFree(
        const MemoryMap& map, uint64_t size, uint64_t alignment, addr_t minimum, addr_t maximum,
        bool top_down, addr_t& result)
    {
        if (size == 0 || !util::is_power_of_2(alignment))
            return false;

        const size_t count = map.size();
        for (size_t i = 0; i < count; i++) {
            const auto& r = map[top_down ? count - 1 - i : i];
            if (r.mr_type != RegionType::Usable)
                continue;

            const addr_t lo = util::max(r.mr_base, minimum);
            const addr_t hi = util::min(r.End(), maximum);
            if (hi <= lo || hi - lo < size)
                continue;

            if (top_down) {
                const addr_t candidate = util::align_down(hi - size, alignment);
                if (candidate >= lo) {
                    result = candidate;
                    return true;
                }
            } else {
                addr_t candidate, candidate_end;
                if (util::checked_align_up(lo, alignment, candidate) &&
                    util::checked_add(candidate, size, candidate_end) && candidate_end <= hi) {
                    result = candidate;
                    return true;
                }
            }
        }
        return false;
    }

    uint64_t LargestUsable(const MemoryMap& map)
    {
        uint64_t largest = 0;
        for (const auto& r : map) {
            if (r.mr_type == RegionType::Usable && r.mr_length > largest)
                largest = r.mr_length;
        }
        return largest;
    }

    addr_t LowestUsable(const MemoryMap& map)
    {
        auto it = util::find_if(map, [](const MemoryRegion& r) { return r.mr_type == RegionType::Usable; });
        return it != map.end() ? it->mr_base : 0;
    }

    Statistics GetStatistics(const MemoryMap& map)
    {
        Statistics s;
        for (const auto& r : map) {
            s.s_total += r.mr_length;
            switch (r.mr_type) {
                case RegionType::Usable:
                    s.s_usable += r.mr_length;
                    break;
                case RegionType::Bootloader:
                    s.s_bootloader += r.mr_length;
                    break;
                default:
                    s.s_reserved += r.mr_length;
                    break;
            }
        }
        return s;
    }

    bool Validate(const MemoryMap& map)
    {
        for (size_t n = 0; n < map.size(); n++) {
            const auto& r = map[n];
            addr_t end;
            if (r.mr_length == 0 || !util::checked_add(r.mr_base, r.mr_length, end))
                return false;
            if (n == 0)
                continue;
            const auto& prev = map[n - 1];
            if (prev.End() > r.mr_base)
                return false; // unsorted or overlapping
            if (CanMerge(prev, r))
                return false;
        }
        return true;
    }

    void Dump(const MemoryMap& map)
    {
        for (const auto& r : map) {
            kprintf(
                "  %016llx-%016llx %-12s attr %x\n", static_cast<unsigned long long>(r.mr_base),
                static_cast<unsigned long long>(r.End()), RegionTypeName(r.mr_type), r.mr_attributes);
        }
        const auto s = GetStatistics(map);
        kprintf(
            "  %llu KB total, %llu KB usable, %llu KB bootloader\n",
            static_cast<unsigned long long>(s.s_total / 1024),
            static_cast<unsigned long long>(s.s_usable / 1024),
            static_cast<unsigned long long>(s.s_bootloader / 1024));
    }

} // namespace memmap
