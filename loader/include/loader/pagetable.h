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
#include <ferry/util/utility.h>
#include "loader/lib.h"
#include "loader/memorymap.h"
#include "loader/physmem.h"
#include "loader/result.h"

/*
 * Translation tables for the kernel. All three architectures use the same
 * shape: four levels of 512 entries indexing a 48-bit virtual address, with
 * 2MB blocks at the third level. Only the descriptor encoding differs, which
 * is what a Format provides:
 *
 *   static uint64_t MakeTable(addr_t pa);
 *   static uint64_t MakeBlock(addr_t pa, pagetable::Memory memory);
 *   static bool IsValid(uint64_t entry);
 *   static bool IsTable(uint64_t entry);
 *   static addr_t GetAddress(uint64_t entry);
 *   static constexpr bool SeparateHighRoot;
 */
namespace pagetable
{
    static constexpr addr_t HighHalfBase = 0xffff800000000000;
    static constexpr uint64_t BlockSize = 2 * 1024 * 1024;
    static constexpr uint64_t EntriesPerTable = 512;
    // Identity mappings must stay within the lower half
    static constexpr addr_t IdentityLimit = 1ull << 47;
    static constexpr size_t MaxAliases = 4;

    enum class Memory { Normal, Framebuffer };

    // What the kernel gets to see
    struct Layout {
        const memmap::MemoryMap* l_map = nullptr;
        // Ranges that are also mapped at HighHalfBase + physical address
        util::fixed_vector<util::interval<addr_t>, MaxAliases> l_aliases;
    };

    struct Tables {
        addr_t t_root = 0;      // CR3, TTBR0 or satp root
        addr_t t_root_high = 0; // TTBR1; equal to t_root elsewhere
        unsigned int t_pages_used = 0;
        // Control register values; zero where not applicable
        uint64_t t_mair = 0;
        uint64_t t_tcr = 0;
        uint64_t t_satp = 0;
    };

    // Hands out zeroed pages from a reserved range
    class TablePool
    {
      public:
        TablePool(const PhysicalMemory& physmem, addr_t base, uint64_t size)
            : tp_PhysMem(physmem), tp_Base(base), tp_Pages(size / PAGE_SIZE)
        {
        }

        bool Allocate(addr_t& pa)
        {
            if (tp_Used == tp_Pages)
                return false;
            pa = tp_Base + tp_Used * PAGE_SIZE;
            if (!tp_PhysMem.Fill(pa, 0, PAGE_SIZE))
                return false;
            ++tp_Used;
            return true;
        }

        unsigned int GetUsed() const { return static_cast<unsigned int>(tp_Used); }

      private:
        const PhysicalMemory& tp_PhysMem;
        addr_t tp_Base;
        uint64_t tp_Pages;
        uint64_t tp_Used = 0;
    };

    namespace detail
    {
        inline unsigned int GetIndex(addr_t virt, int level)
        {
            return static_cast<unsigned int>((virt >> (21 + 9 * level)) & (EntriesPerTable - 1));
        }

        inline bool ShouldIdentityMap(const memmap::MemoryRegion& r)
        {
            using memmap::RegionType;
            if (r.mr_type == RegionType::Bootloader)
                return true;
            return (r.mr_type == RegionType::Usable || r.mr_type == RegionType::Framebuffer) && r.mr_base < GiB(4);
        }

        template<typename Format>
        class Builder
        {
          public:
            Builder(const PhysicalMemory& physmem, TablePool& pool) : b_PhysMem(physmem), b_Pool(pool) {}

            bool Init()
            {
                if (!b_Pool.Allocate(b_Root))
                    return false;
                b_RootHigh = b_Root;
                if constexpr (Format::SeparateHighRoot) {
                    if (!b_Pool.Allocate(b_RootHigh))
                        return false;
                }
                return true;
            }

            // Maps [phys, phys + length) at 'virt'; both are rounded outwards to blocks
            bool MapRange(addr_t virt, addr_t phys, uint64_t length, Memory memory)
            {
                const uint64_t offset = phys % BlockSize;
                phys -= offset;
                virt -= offset;
                length = ROUND_UP(length + offset, BlockSize);
                for (uint64_t n = 0; n < length; n += BlockSize) {
                    if (!MapBlock(virt + n, phys + n, memory))
                        return false;
                }
                return true;
            }

            addr_t GetRoot() const { return b_Root; }
            addr_t GetRootHigh() const { return b_RootHigh; }

          private:
            bool MapBlock(addr_t virt, addr_t phys, Memory memory)
            {
                addr_t table = virt >= HighHalfBase ? b_RootHigh : b_Root;
                for (int level = 2; level > 0; level--) {
                    auto entry = b_PhysMem.MapAs<uint64_t>(table + GetIndex(virt, level) * sizeof(uint64_t));
                    if (entry == nullptr)
                        return false;
                    if (!Format::IsValid(*entry)) {
                        addr_t next;
                        if (!b_Pool.Allocate(next))
                            return false;
                        *entry = Format::MakeTable(next);
                    } else if (!Format::IsTable(*entry)) {
                        return false;
                    }
                    table = Format::GetAddress(*entry);
                }

                auto entry = b_PhysMem.MapAs<uint64_t>(table + GetIndex(virt, 0) * sizeof(uint64_t));
                if (entry == nullptr)
                    return false;
                // The first mapping of a block wins
                if (!Format::IsValid(*entry))
                    *entry = Format::MakeBlock(phys, memory);
                return true;
            }

            const PhysicalMemory& b_PhysMem;
            TablePool& b_Pool;
            addr_t b_Root = 0;
            addr_t b_RootHigh = 0;
        };

    } // namespace detail

    template<typename Format>
    Result BuildTables(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables)
    {
        detail::Builder<Format> builder(physmem, pool);
        if (!builder.Init())
            return RESULT_MAKE_FAILURE(PagingSetupFailed);

        for (const auto& r : *layout.l_map) {
            if (!detail::ShouldIdentityMap(r))
                continue;
            const addr_t end = r.mr_type == memmap::RegionType::Bootloader ? r.End() : util::min(r.End(), GiB(4));
            if (end > IdentityLimit)
                return RESULT_MAKE_FAILURE(PagingSetupFailed);
            const auto memory =
                r.mr_type == memmap::RegionType::Framebuffer ? Memory::Framebuffer : Memory::Normal;
            if (!builder.MapRange(r.mr_base, r.mr_base, end - r.mr_base, memory))
                return RESULT_MAKE_FAILURE(PagingSetupFailed);
        }

        for (const auto& alias : layout.l_aliases) {
            if (alias.end > IdentityLimit ||
                !builder.MapRange(HighHalfBase + alias.begin, alias.begin, alias.length(), Memory::Normal))
                return RESULT_MAKE_FAILURE(PagingSetupFailed);
        }

        tables.t_root = builder.GetRoot();
        tables.t_root_high = builder.GetRootHigh();
        tables.t_pages_used = pool.GetUsed();
        return Result::Success();
    }

    // Resolves 'virt' the way the MMU would
    template<typename Format>
    bool TranslateAddress(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys)
    {
        addr_t table = virt >= HighHalfBase ? tables.t_root_high : tables.t_root;
        for (int level = 2; level >= 0; level--) {
            auto entry = physmem.MapAs<uint64_t>(table + detail::GetIndex(virt, level) * sizeof(uint64_t));
            if (entry == nullptr || !Format::IsValid(*entry))
                return false;
            if (level == 0) {
                if (Format::IsTable(*entry))
                    return false;
                phys = Format::GetAddress(*entry) + virt % BlockSize;
                return true;
            }
            if (!Format::IsTable(*entry))
                return false;
            table = Format::GetAddress(*entry);
        }
        return false;
    }

    // Per-architecture instantiations, see loader/arch/<arch>/pagetable.cpp
    Result BuildAmd64(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables);
    Result BuildArm64(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables);
    Result BuildRiscv64(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables);

    bool TranslateAmd64(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys);
    bool TranslateArm64(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys);
    bool TranslateRiscv64(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys);

} // namespace pagetable
