/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <ferry/kernelimage.h>
#include "loader/memorymap.h"
#include "loader/result.h"

struct LoaderContext;

namespace bootdevice
{
    class Stream;
}

enum class Compression { None, Gzip, Xz, Zstd, Lz4, Lzma };

struct KernelImage {
    // Where the (possibly compressed) payload currently resides
    addr_t ki_base = 0;
    uint64_t ki_length = 0;
    // Set if we reserved [ki_base, ki_base + ki_length) ourselves
    bool ki_owned = false;

    Compression ki_compression = Compression::None;
    uint32_t ki_flags = 0;
    uint64_t ki_payload_size = 0;
    uint64_t ki_image_size = 0;
    uint64_t ki_entry_offset = 0;
    uint64_t ki_alignment = FERRY_KERNEL_MIN_ALIGNMENT;
};

enum class ModuleType : uint32_t { Generic = 0, Ramdisk = 1, Symbols = 2 };

struct Module {
    static constexpr size_t NameLength = 64;

    char m_name[NameLength] = {};
    addr_t m_base = 0;
    uint64_t m_length = 0;
    ModuleType m_type = ModuleType::Generic;
};

namespace image
{
    static constexpr size_t MaxModules = 16;
    using ModuleList = util::fixed_vector<Module, MaxModules>;

    Compression DetectCompression(const uint8_t* payload, size_t length);
    const char* CompressionName(Compression compression);
    // Whether we carry a decoder for 'compression'
    bool CanDecode(Compression compression);

    /*
     * Validates a kernel header and the start of the payload that follows it;
     * 'length' is the number of bytes available at 'data'.
     */
    Result ParseHeader(const uint8_t* data, size_t length, KernelImage& image);

    // Reads and validates the header at the start of 'stream'
    Result Inspect(
        const LoaderContext& lc, bootdevice::Stream& stream, bool no_decompress, KernelImage& image);

    // Rejects images whose sizes cannot possibly fit in 'map'
    Result CheckFits(const KernelImage& image, const memmap::MemoryMap& map);

    uint64_t RequiredStagingBytes(const KernelImage& image);

    // Reads the payload to 'destination'; updates ki_base and ki_length
    Result Load(const LoaderContext& lc, bootdevice::Stream& stream, addr_t destination, KernelImage& image);

    ModuleType ModuleTypeFromName(const char* name);

    // Reads all of 'stream' into a fresh Bootloader region of 'map'
    Result LoadModule(
        const LoaderContext& lc, bootdevice::Stream& stream, const char* name, memmap::MemoryMap& map,
        Module& module);

} // namespace image
