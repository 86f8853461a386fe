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
        // MAIR_EL1 attribute indices
        constexpr uint64_t AttrNormal = 0;      // 0xff: write-back, read/write allocate
        constexpr uint64_t AttrDevice = 1;      // 0x04: device nGnRE
        constexpr uint64_t AttrNonCacheable = 2; // 0x44: normal, non-cacheable
        constexpr uint64_t Mair = (0xffull << (8 * AttrNormal)) | (0x04ull << (8 * AttrDevice)) |
                                  (0x44ull << (8 * AttrNonCacheable));

        // TCR_EL1 for 48-bit halves with a 4KB granule
        constexpr uint64_t TcrT0SZ = 16;
        constexpr uint64_t TcrIRGN0 = 1ull << 8;
        constexpr uint64_t TcrORGN0 = 1ull << 10;
        constexpr uint64_t TcrSH0 = 3ull << 12;
        constexpr uint64_t TcrT1SZ = 16ull << 16;
        constexpr uint64_t TcrIRGN1 = 1ull << 24;
        constexpr uint64_t TcrORGN1 = 1ull << 26;
        constexpr uint64_t TcrSH1 = 3ull << 28;
        constexpr uint64_t TcrTG1_4K = 2ull << 30;
        constexpr uint64_t TcrIPS_48 = 5ull << 32;
        constexpr uint64_t Tcr = TcrT0SZ | TcrIRGN0 | TcrORGN0 | TcrSH0 | TcrT1SZ | TcrIRGN1 | TcrORGN1 |
                                 TcrSH1 | TcrTG1_4K | TcrIPS_48;

        constexpr uint64_t DescValid = (1 << 0);
        constexpr uint64_t DescTable = (1 << 1);
        constexpr uint64_t DescAF = (1 << 10);
        constexpr uint64_t DescSHInner = (3 << 8);
        constexpr uint64_t AddressMask = 0x0000fffffffff000;

        struct Format {
            static constexpr bool SeparateHighRoot = true;

            static uint64_t MakeTable(addr_t pa) { return pa | DescTable | DescValid; }

            static uint64_t MakeBlock(addr_t pa, Memory memory)
            {
                const uint64_t attr = memory == Memory::Framebuffer ? AttrNonCacheable : AttrNormal;
                return pa | DescAF | DescSHInner | (attr << 2) | DescValid;
            }

            static bool IsValid(uint64_t entry) { return (entry & DescValid) != 0; }
            static bool IsTable(uint64_t entry) { return (entry & DescTable) != 0; }
            static addr_t GetAddress(uint64_t entry) { return entry & AddressMask; }
        };

    } // unnamed namespace

    Result BuildArm64(const PhysicalMemory& physmem, const Layout& layout, TablePool& pool, Tables& tables)
    {
        RESULT_PROPAGATE_FAILURE(BuildTables<Format>(physmem, layout, pool, tables));
        tables.t_mair = Mair;
        tables.t_tcr = Tcr;
        return Result::Success();
    }

    bool TranslateArm64(const PhysicalMemory& physmem, const Tables& tables, addr_t virt, addr_t& phys)
    {
        return TranslateAddress<Format>(physmem, tables, virt, phys);
    }

} // namespace pagetable
