/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/physmem.h"
#include "loader/lib.h"
#include <ferry/util/checked.h>

bool PhysicalMemory::AddAperture(addr_t phys, uint64_t length, void* host)
{
    addr_t end;
    if (length == 0 || host == nullptr || !util::checked_add(phys, length, end))
        return false;
    return pm_Apertures.push_back(Aperture{ phys, length, static_cast<uint8_t*>(host) });
}

void* PhysicalMemory::Map(addr_t phys, uint64_t length) const
{
    addr_t end;
    if (!util::checked_add(phys, length, end))
        return nullptr;

    if (pm_Apertures.empty()) {
        if (end - 1 > static_cast<addr_t>(UINTPTR_MAX) && length > 0)
            return nullptr;
        return reinterpret_cast<void*>(static_cast<uintptr_t>(phys));
    }

    for (const auto& a : pm_Apertures) {
        if (phys >= a.a_phys && end <= a.a_phys + a.a_length)
            return a.a_host + (phys - a.a_phys);
    }
    return nullptr;
}

bool PhysicalMemory::Read(addr_t phys, void* dest, uint64_t length) const
{
    auto p = Map(phys, length);
    if (p == nullptr)
        return false;
    memcpy(dest, p, length);
    return true;
}

bool PhysicalMemory::Write(addr_t phys, const void* src, uint64_t length) const
{
    auto p = Map(phys, length);
    if (p == nullptr)
        return false;
    memcpy(p, src, length);
    return true;
}

bool PhysicalMemory::Fill(addr_t phys, int value, uint64_t length) const
{
    auto p = Map(phys, length);
    if (p == nullptr)
        return false;
    memset(p, value, length);
    return true;
}
