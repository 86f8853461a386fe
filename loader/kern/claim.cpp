/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/memorymap.h"
#include "loader/lib.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"

namespace memmap
{
    namespace
    {
        bool IsUefi(const LoaderContext& lc) { return lc.lc_platform.pd_mode == FirmwareMode::UEFI; }

        bool Reclassify(MemoryMap& map, addr_t base, uint64_t length, RegionType type)
        {
            MemoryMap out;
            if (auto result = Reserve(map, base, length, type, out); result.IsFailure())
                return false;
            map = out;
            return true;
        }

    } // unnamed namespace

    bool Claim(const LoaderContext& lc, MemoryMap& map, addr_t base, uint64_t length)
    {
        if (!IsWithinRegionOfType(map, base, length, RegionType::Usable)) {
            TRACE(
                MEMMAP, ERROR, "%llx (%llu bytes) is not usable memory", static_cast<unsigned long long>(base),
                static_cast<unsigned long long>(length));
            return false;
        }

        if (IsUefi(lc)) {
            auto& claims = lc.lc_scratch.s_claims;
            if (claims.full()) {
                TRACE(MEMMAP, ERROR, "too many firmware claims");
                return false;
            }
            if (!firmware::efi::ClaimPages(lc.lc_platform.pd_efi_system_table, base, length))
                return false;
            const bool ok = claims.push_back({ base, base + length });
            KASSERT(ok, "claim list full");
        }

        if (!Reclassify(map, base, length, RegionType::Bootloader)) {
            if (IsUefi(lc)) {
                lc.lc_scratch.s_claims.pop_back();
                if (!firmware::efi::ReleasePages(lc.lc_platform.pd_efi_system_table, base, length))
                    TRACE(MEMMAP, WARN, "firmware refused to take back %llx", static_cast<unsigned long long>(base));
            }
            return false;
        }
        return true;
    }

    bool Release(const LoaderContext& lc, MemoryMap& map, addr_t base, uint64_t length)
    {
        if (!Reclassify(map, base, length, RegionType::Usable))
            return false;
        if (!IsUefi(lc))
            return true;

        auto& claims = lc.lc_scratch.s_claims;
        const util::interval<addr_t> range{ base, base + length };
        for (auto it = claims.begin(); it != claims.end(); ++it) {
            if (*it != range)
                continue;
            claims.erase(it);
            break;
        }
        if (!firmware::efi::ReleasePages(lc.lc_platform.pd_efi_system_table, base, length))
            TRACE(
                MEMMAP, WARN, "firmware refused to take back %llx", static_cast<unsigned long long>(base));
        return true;
    }

    void ReleaseAllClaims(const LoaderContext& lc)
    {
        auto& claims = lc.lc_scratch.s_claims;
        if (IsUefi(lc)) {
            for (const auto& claim : claims) {
                if (!firmware::efi::ReleasePages(lc.lc_platform.pd_efi_system_table, claim.begin, claim.length()))
                    TRACE(
                        MEMMAP, WARN, "firmware refused to take back %llx",
                        static_cast<unsigned long long>(claim.begin));
            }
        }
        claims.clear();
    }

    void ForgetClaims(const LoaderContext& lc) { lc.lc_scratch.s_claims.clear(); }

} // namespace memmap
