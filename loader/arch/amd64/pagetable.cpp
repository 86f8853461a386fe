/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/pagetable.h"

namespace pagetable
{
    namespace
    {
        constexpr uint64_t PE_P = (1 << 0);   /* present */
        constexpr uint64_t PE_RW = (1 << 1);  /* read/write */
        constexpr uint64_t PE_PWT = (1 << 3); /* write-through */
        constexpr uint64_t PE_PS = (1 << 7);  /* 2MB page */

        constexpr uint64_t AddressMask = 0xffffffffff000; /* bits 12 .. 51 */

        // 4-level long mode paging
        struct Format {
            static constexpr bool SeparateHighRoot = false;

            static uint64_t MakeTable(addr_t pa) { return pa | PE_RW | PE_P; }

            static uint64_t MakeBlock(addr_t pa, Memory memory)
            {
                uint64_t flags = PE_PS | PE_RW | PE_P;
                if (memory == Memory::Framebuffer)
                    flags |= PE_PWT;
                return pa | flags;
            }

            static bool IsValid(uint64_t entry) { return (entry & PE_P) != 0; }
            static bool IsTable(uint64_t entry) { return (entry & PE_PS) == 0; }
            static addr_t GetAddress(uint64_t entry) { return entry & AddressMask; }
        };

    } // unnamed namespace

    Result BuildAmd64(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables)
    {
        return BuildTables<Format>(physmem, layout, pool, tables);
    }

    bool TranslateAmd64(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys)
    {
        return TranslateAddress<Format>(physmem, tables, virt, phys);
    }

} // namespace pagetable
