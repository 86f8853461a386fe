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
        constexpr uint64_t PTE_V = (1 << 0);
        constexpr uint64_t PTE_R = (1 << 1);
        constexpr uint64_t PTE_W = (1 << 2);
        constexpr uint64_t PTE_X = (1 << 3);
        constexpr uint64_t PTE_A = (1 << 6);
        constexpr uint64_t PTE_D = (1 << 7);
        constexpr uint64_t PpnMask = (1ull << 44) - 1;

        constexpr uint64_t SatpModeSv48 = 9ull << 60;

        uint64_t MakePte(addr_t pa) { return (pa >> 12) << 10; }

        // Sv48; a leaf is any entry with R, W or X set
        struct Format {
            static constexpr bool SeparateHighRoot = false;

            static uint64_t MakeTable(addr_t pa) { return MakePte(pa) | PTE_V; }
            static uint64_t MakeBlock(addr_t pa, Memory) { return MakePte(pa) | PTE_V | PTE_R | PTE_W | PTE_X | PTE_A | PTE_D; }
            static bool IsValid(uint64_t entry) { return (entry & PTE_V) != 0; }
            static bool IsTable(uint64_t entry) { return (entry & (PTE_R | PTE_W | PTE_X)) == 0; }
            static addr_t GetAddress(uint64_t entry) { return ((entry >> 10) & PpnMask) << 12; }
        };

    } // unnamed namespace

    Result BuildRiscv64(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables)
    {
        RESULT_PROPAGATE_FAILURE(BuildTables<Format>(physmem, layout, pool, tables));
        tables.t_satp = SatpModeSv48 | (tables.t_root >> 12);
        return Result::Success();
    }

    bool TranslateRiscv64(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys)
    {
        return TranslateAddress<Format>(physmem, tables, virt, phys);
    }

} // namespace pagetable
