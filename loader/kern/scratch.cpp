/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/scratch.h"
#include "loader/trace.h"

void* ScratchArena::Allocate(size_t size)
{
    constexpr size_t Alignment = 16;
    const size_t aligned = (size + Alignment - 1) & ~(Alignment - 1);
    if (aligned < size || aligned > sa_Size - sa_Used) {
        TRACE(DECOMPRESS, ERROR, "scratch arena exhausted (%zu bytes requested, %zu in use)", size, sa_Used);
        return nullptr;
    }
    void* p = sa_Base + sa_Used;
    sa_Used += aligned;
    return p;
}
