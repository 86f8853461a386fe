/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include "loader/image.h"
#include "loader/memorymap.h"
#include "loader/result.h"

struct LoaderContext;

struct StagingRegion {
    addr_t sr_base = 0;
    uint64_t sr_capacity = 0;
};

namespace decompress
{
    /*
     * Picks the region the kernel is expanded into and claims it as
     * Bootloader. A raw image that already lies suitably aligned in Usable
     * memory is staged where it is.
     */
    Result AllocateStaging(
        const LoaderContext& lc, memmap::MemoryMap& map, const KernelImage& image, StagingRegion& staging);

    /*
     * Places the expanded kernel at the start of 'staging'; afterwards 'image'
     * describes the expanded kernel. A source range we reserved ourselves is
     * returned to Usable.
     */
    Result Expand(
        const LoaderContext& lc, memmap::MemoryMap& map, KernelImage& image, const StagingRegion& staging);

} // namespace decompress
