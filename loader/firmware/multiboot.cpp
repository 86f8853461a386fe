/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/firmware/multiboot.h"

namespace firmware::multiboot
{
    const MULTIBOOT2_INFO* MapInfo(const PhysicalMemory& physmem, addr_t info)
    {
        auto mi = physmem.MapAs<const MULTIBOOT2_INFO>(info);
        if (mi == nullptr)
            return nullptr;
        if (mi->mi_total_size < sizeof(MULTIBOOT2_INFO) + sizeof(MULTIBOOT2_TAG) ||
            mi->mi_total_size > MaxInfoSize)
            return nullptr;
        // Now ensure we can reach all of it
        return physmem.MapAs<const MULTIBOOT2_INFO>(info, mi->mi_total_size);
    }

    const MULTIBOOT2_TAG* FindTag(const PhysicalMemory& physmem, addr_t info, uint32_t type)
    {
        const MULTIBOOT2_TAG* found = nullptr;
        ForEachTag(physmem, info, [&](const MULTIBOOT2_TAG& tag) {
            if (found == nullptr && tag.mt_type == type)
                found = &tag;
        });
        return found;
    }

    const MULTIBOOT2_TAG_MODULE* FindModule(const PhysicalMemory& physmem, addr_t info, unsigned int n)
    {
        const MULTIBOOT2_TAG_MODULE* found = nullptr;
        unsigned int index = 0;
        ForEachTag(physmem, info, [&](const MULTIBOOT2_TAG& tag) {
            if (tag.mt_type != MULTIBOOT2_TAG_TYPE_MODULE || tag.mt_size < sizeof(MULTIBOOT2_TAG_MODULE))
                return;
            if (index++ == n)
                found = reinterpret_cast<const MULTIBOOT2_TAG_MODULE*>(&tag);
        });
        return found;
    }

} // namespace firmware::multiboot
