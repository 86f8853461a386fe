/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <ferry/util/fixed_vector.h>

/*
 * Translates physical addresses to pointers the loader can dereference. The
 * loader runs identity mapped, so without apertures this is a plain cast; once
 * an aperture is added, only ranges inside one aperture can be reached.
 */
class PhysicalMemory
{
  public:
    static constexpr size_t MaxApertures = 16;

    [[nodiscard]] bool AddAperture(addr_t phys, uint64_t length, void* host);

    void* Map(addr_t phys, uint64_t length) const;

    template<typename T>
    T* MapAs(addr_t phys, uint64_t length = sizeof(T)) const
    {
        return static_cast<T*>(Map(phys, length));
    }

    bool Read(addr_t phys, void* dest, uint64_t length) const;
    bool Write(addr_t phys, const void* src, uint64_t length) const;
    bool Fill(addr_t phys, int value, uint64_t length) const;

  private:
    struct Aperture {
        addr_t a_phys;
        uint64_t a_length;
        uint8_t* a_host;
    };
    util::fixed_vector<Aperture, MaxApertures> pm_Apertures;
};
