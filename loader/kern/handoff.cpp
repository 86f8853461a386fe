/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/handoff.h"
#include "loader/console.h"
#include "loader/firmware/efi.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/scratch.h"
#include "loader/trace.h"
#include <ferry/util/checked.h>

namespace handoff
{
    namespace
    {
        constexpr uint64_t ArenaSize = HandoffArena::StackSize + HandoffArena::TablePoolSize;

        bool AddAlias(pagetable::Layout& layout, addr_t base, uint64_t length)
        {
            addr_t end;
            if (length == 0 || !util::checked_add(base, length, end))
                return false;
            return layout.l_aliases.push_back({ base, end });
        }

    } // unnamed namespace

    Result ReserveArena(const LoaderContext& lc, memmap::MemoryMap& map, HandoffArena& arena)
    {
        addr_t base;
        if (!memmap::FindFree(
                map, ArenaSize, PAGE_SIZE, platform::GetAllocationMinimum(lc.lc_platform), GiB(4), true, base) ||
            !memmap::Claim(lc, map, base, ArenaSize)) {
            TRACE(HANDOFF, ERROR, "no room for the stack and page tables");
            return RESULT_MAKE_FAILURE(StackAllocationFailed);
        }

        // Tables first, so that a stack overflow does not run into them
        arena.ha_tables_base = base;
        arena.ha_stack_base = base + HandoffArena::TablePoolSize;
        TRACE(
            HANDOFF, INFO, "tables at %llx, stack at %llx", static_cast<unsigned long long>(arena.ha_tables_base),
            static_cast<unsigned long long>(arena.ha_stack_base));
        return Result::Success();
    }

    Result Prepare(
        const LoaderContext& lc, const KernelImage& image, const BootInfo& boot_info, const HandoffArena& arena,
        const memmap::MemoryMap& map, HandoffContext& context)
    {
        context = HandoffContext{};
        context.hc_arch = lc.lc_platform.pd_arch;

        if (arena.ha_stack_base == 0 ||
            !memmap::IsWithinRegionOfType(
                map, arena.ha_stack_base, HandoffArena::StackSize, memmap::RegionType::Bootloader))
            return RESULT_MAKE_FAILURE(StackAllocationFailed);
        context.hc_stack_top = (arena.ha_stack_base + HandoffArena::StackSize) & ~static_cast<addr_t>(15);

        if (image.ki_entry_offset >= image.ki_length ||
            !util::checked_add(image.ki_base, image.ki_entry_offset, context.hc_entry) ||
            context.hc_entry >= pagetable::IdentityLimit ||
            !memmap::IsWithinRegionOfType(map, image.ki_base, image.ki_length, memmap::RegionType::Bootloader)) {
            TRACE(HANDOFF, ERROR, "kernel entry point %llx is unusable", static_cast<unsigned long long>(context.hc_entry));
            return RESULT_MAKE_FAILURE(PagingSetupFailed);
        }
        context.hc_argument = boot_info.bi_base;

        pagetable::Layout layout;
        layout.l_map = &map;
        if (!AddAlias(layout, image.ki_base, image.ki_length) ||
            !AddAlias(layout, boot_info.bi_base, boot_info.bi_region_size) ||
            !AddAlias(layout, arena.ha_stack_base, HandoffArena::StackSize))
            return RESULT_MAKE_FAILURE(PagingSetupFailed);

        pagetable::TablePool pool(lc.lc_physmem, arena.ha_tables_base, HandoffArena::TablePoolSize);
        auto& tables = context.hc_tables;
        switch (context.hc_arch) {
            case Architecture::X86_64:
                RESULT_PROPAGATE_FAILURE(pagetable::BuildAmd64(lc.lc_physmem, layout, pool, tables));
                break;
            case Architecture::ARM64:
                RESULT_PROPAGATE_FAILURE(pagetable::BuildArm64(lc.lc_physmem, layout, pool, tables));
                break;
            case Architecture::RISCV64:
                RESULT_PROPAGATE_FAILURE(pagetable::BuildRiscv64(lc.lc_physmem, layout, pool, tables));
                break;
        }

        TRACE(
            HANDOFF, INFO, "entry %llx, stack %llx, root %llx, %u table pages",
            static_cast<unsigned long long>(context.hc_entry), static_cast<unsigned long long>(context.hc_stack_top),
            static_cast<unsigned long long>(tables.t_root), tables.t_pages_used);
        return Result::Success();
    }

    bool Translate(const LoaderContext& lc, const HandoffContext& context, addr_t virt, addr_t& phys)
    {
        switch (context.hc_arch) {
            case Architecture::X86_64:
                return pagetable::TranslateAmd64(lc.lc_physmem, context.hc_tables, virt, phys);
            case Architecture::ARM64:
                return pagetable::TranslateArm64(lc.lc_physmem, context.hc_tables, virt, phys);
            case Architecture::RISCV64:
                return pagetable::TranslateRiscv64(lc.lc_physmem, context.hc_tables, virt, phys);
        }
        return false;
    }

    Result ExitFirmware(const LoaderContext& lc)
    {
        const auto& pd = lc.lc_platform;
        if (pd.pd_mode != FirmwareMode::UEFI)
            return Result::Success();

        if (!firmware::efi::ExitBootServices(
                pd.pd_efi_system_table, pd.pd_efi_image, lc.lc_scratch.s_firmware, sizeof(lc.lc_scratch.s_firmware))) {
            TRACE(HANDOFF, ERROR, "ExitBootServices() failed");
            return RESULT_MAKE_FAILURE(FirmwareExitFailed);
        }

        // ConOut is gone along with boot services
        console::SetOutput(console::Output{});
        return Result::Success();
    }

} // namespace handoff
