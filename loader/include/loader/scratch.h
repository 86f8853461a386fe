/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include "loader/memorymap.h"

class PhysicalMemory;
struct PlatformDescriptor;

/*
 * Bump allocator over a fixed buffer; everything is released at once by
 * Reset(). This is what zlib allocates its state and window from.
 */
class ScratchArena
{
  public:
    ScratchArena(void* base, size_t size) : sa_Base(static_cast<uint8_t*>(base)), sa_Size(size) {}

    void* Allocate(size_t size);
    void Reset() { sa_Used = 0; }
    size_t GetUsed() const { return sa_Used; }

  private:
    uint8_t* sa_Base;
    size_t sa_Size;
    size_t sa_Used = 0;
};

/*
 * All working storage of the loader. The loader never allocates; this is
 * placed in .bss by the entry code and handed down by reference.
 */
struct Scratch {
    static constexpr size_t MaxBlockSize = 4096;
    static constexpr size_t FirmwareBufferSize = 32 * 1024;
    static constexpr size_t ArenaSize = 64 * 1024;
    static constexpr size_t MaxClaims = 64;

    alignas(16) uint8_t s_sector[MaxBlockSize];
    alignas(16) uint8_t s_firmware[FirmwareBufferSize];
    alignas(16) uint8_t s_arena[ArenaSize];
    memmap::RawMemoryMap s_raw_map;
    // Firmware allocations made by the current boot attempt
    util::fixed_vector<util::interval<addr_t>, MaxClaims> s_claims;
};

// What every stage needs to reach the firmware and physical memory
struct LoaderContext {
    const PlatformDescriptor& lc_platform;
    PhysicalMemory& lc_physmem;
    Scratch& lc_scratch;
};
