/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include "loader/bootinfo.h"
#include "loader/image.h"
#include "loader/memorymap.h"
#include "loader/pagetable.h"
#include "loader/platform.h"
#include "loader/result.h"

struct LoaderContext;

// Kernel stack and translation table pages, reserved in one go
struct HandoffArena {
    static constexpr uint64_t StackSize = 64 * 1024;
    static constexpr uint64_t TablePoolSize = 256 * 1024;

    addr_t ha_stack_base = 0;
    addr_t ha_tables_base = 0;
};

// Everything md::Jump() needs; built by Prepare() and used exactly once
struct HandoffContext {
    Architecture hc_arch = Architecture::X86_64;
    addr_t hc_entry = 0;
    addr_t hc_stack_top = 0;
    // Physical address of the boot information; first argument register
    addr_t hc_argument = 0;
    pagetable::Tables hc_tables;
    bool hc_mask_interrupts = true;
};

namespace handoff
{
    /*
     * Reserves the arena below 4GB as Bootloader. This must happen before the
     * boot information is built, so that its memory map is final.
     */
    Result ReserveArena(const LoaderContext& lc, memmap::MemoryMap& map, HandoffArena& arena);

    // Builds the translation tables and fills out 'context'
    Result Prepare(
        const LoaderContext& lc, const KernelImage& image, const BootInfo& boot_info, const HandoffArena& arena,
        const memmap::MemoryMap& map, HandoffContext& context);

    // Resolves 'virt' through the tables in 'context'
    bool Translate(const LoaderContext& lc, const HandoffContext& context, addr_t virt, addr_t& phys);

    // Leaves UEFI boot services; nothing to do elsewhere
    Result ExitFirmware(const LoaderContext& lc);

} // namespace handoff
