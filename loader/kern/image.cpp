/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/image.h"
#include "loader/bootdevice.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"
#include <ferry/util/checked.h>
#include <ferry/util/endian.h>
#include <ferry/util/utf8.h>
#include <ferry/util/utility.h>
#include <zlib.h>

namespace image
{
    namespace
    {
        constexpr uint64_t MaxAlignment = 1ull << 30;
        constexpr size_t HeaderCrcLength = 0x3c;

        struct Signature {
            Compression s_compression;
            uint8_t s_magic[6];
            size_t s_length;
        };

        constexpr Signature signatures[] = {
            { Compression::Gzip, { 0x1f, 0x8b }, 2 },
            { Compression::Xz, { 0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00 }, 6 },
            { Compression::Zstd, { 0x28, 0xb5, 0x2f, 0xfd }, 4 },
            { Compression::Lz4, { 0x04, 0x22, 0x4d, 0x18 }, 4 },
            { Compression::Lzma, { 0x5d, 0x00, 0x00 }, 3 },
        };

        bool EndsWith(const char* s, const char* suffix)
        {
            const size_t len = strlen(s), suffix_len = strlen(suffix);
            return len >= suffix_len && strcmp(s + len - suffix_len, suffix) == 0;
        }

    } // unnamed namespace

    Compression DetectCompression(const uint8_t* payload, size_t length)
    {
        for (const auto& sig : signatures) {
            if (length >= sig.s_length && memcmp(payload, sig.s_magic, sig.s_length) == 0)
                return sig.s_compression;
        }
        return Compression::None;
    }

    const char* CompressionName(Compression compression)
    {
        switch (compression) {
            case Compression::None:
                return "none";
            case Compression::Gzip:
                return "gzip";
            case Compression::Xz:
                return "xz";
            case Compression::Zstd:
                return "zstd";
            case Compression::Lz4:
                return "lz4";
            case Compression::Lzma:
                return "lzma";
        }
        return "?";
    }

    bool CanDecode(Compression compression)
    {
        return compression == Compression::None || compression == Compression::Gzip;
    }

    Result ParseHeader(const uint8_t* data, size_t length, KernelImage& image)
    {
        image = KernelImage{};
        if (length < sizeof(FERRY_KERNEL_HEADER) || util::get_le32(data + 0x00) != FERRY_KERNEL_MAGIC) {
            TRACE(IMAGE, ERROR, "not a kernel image");
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }

        const uint32_t crc = crc32(crc32(0L, Z_NULL, 0), data, HeaderCrcLength);
        if (crc != util::get_le32(data + HeaderCrcLength)) {
            TRACE(
                IMAGE, ERROR, "header checksum %x, expected %x", static_cast<unsigned int>(crc),
                util::get_le32(data + HeaderCrcLength));
            return RESULT_MAKE_FAILURE(HeaderChecksumMismatch);
        }

        const uint16_t version = util::get_le16(data + 0x04);
        const uint16_t header_size = util::get_le16(data + 0x06);
        if (version != FERRY_KERNEL_HEADER_VERSION || header_size != sizeof(FERRY_KERNEL_HEADER)) {
            TRACE(IMAGE, ERROR, "unsupported header version %u, size %u", version, header_size);
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }

        image.ki_flags = util::get_le32(data + 0x08);
        image.ki_payload_size = util::get_le64(data + 0x10);
        image.ki_image_size = util::get_le64(data + 0x18);
        image.ki_entry_offset = util::get_le64(data + 0x20);
        image.ki_alignment = util::get_le64(data + 0x28);
        if (!util::is_power_of_2(image.ki_alignment) || image.ki_alignment < FERRY_KERNEL_MIN_ALIGNMENT ||
            image.ki_alignment > MaxAlignment) {
            TRACE(IMAGE, ERROR, "bad load alignment %llx", static_cast<unsigned long long>(image.ki_alignment));
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }
        if (image.ki_payload_size == 0) {
            TRACE(IMAGE, ERROR, "empty payload");
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }

        const uint8_t* payload = data + sizeof(FERRY_KERNEL_HEADER);
        const size_t available = util::min(
            static_cast<uint64_t>(length - sizeof(FERRY_KERNEL_HEADER)), image.ki_payload_size);
        image.ki_compression = DetectCompression(payload, available);

        // The entry point must lie within what we end up staging
        if (image.ki_entry_offset >= RequiredStagingBytes(image)) {
            TRACE(
                IMAGE, ERROR, "entry offset %llx beyond the image", static_cast<unsigned long long>(image.ki_entry_offset));
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }
        return Result::Success();
    }

    Result Inspect(const LoaderContext& lc, bootdevice::Stream& stream, bool no_decompress, KernelImage& image)
    {
        uint8_t* block = lc.lc_scratch.s_sector;
        const size_t length = util::min(stream.GetSize(), static_cast<uint64_t>(Scratch::MaxBlockSize));
        if (length < sizeof(FERRY_KERNEL_HEADER)) {
            TRACE(IMAGE, ERROR, "blob too small for a kernel header");
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }
        RESULT_PROPAGATE_FAILURE(stream.Read(0, block, length));
        RESULT_PROPAGATE_FAILURE(ParseHeader(block, length, image));

        if (image.ki_payload_size > stream.GetSize() - sizeof(FERRY_KERNEL_HEADER)) {
            TRACE(
                IMAGE, ERROR, "payload of %llu bytes exceeds the blob", static_cast<unsigned long long>(image.ki_payload_size));
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }
        if (!CanDecode(image.ki_compression)) {
            TRACE(IMAGE, ERROR, "no decoder for %s", CompressionName(image.ki_compression));
            return RESULT_MAKE_FAILURE(UnsupportedCompression);
        }
        if (no_decompress && image.ki_compression != Compression::None) {
            TRACE(IMAGE, ERROR, "%s image refused (no_decompress)", CompressionName(image.ki_compression));
            return RESULT_MAKE_FAILURE(UnsupportedCompression);
        }

        TRACE(
            IMAGE, INFO, "kernel: %s, payload %llu bytes, image %llu bytes, entry +%llx",
            CompressionName(image.ki_compression), static_cast<unsigned long long>(image.ki_payload_size),
            static_cast<unsigned long long>(image.ki_image_size),
            static_cast<unsigned long long>(image.ki_entry_offset));
        return Result::Success();
    }

    Result CheckFits(const KernelImage& image, const memmap::MemoryMap& map)
    {
        const uint64_t largest = memmap::LargestUsable(map);
        if (image.ki_payload_size > largest || RequiredStagingBytes(image) > largest) {
            TRACE(
                IMAGE, ERROR, "declared sizes exceed the largest usable region (%llu bytes)",
                static_cast<unsigned long long>(largest));
            return RESULT_MAKE_FAILURE(InvalidKernelFormat);
        }
        return Result::Success();
    }

    uint64_t RequiredStagingBytes(const KernelImage& image)
    {
        return image.ki_compression == Compression::None ? image.ki_payload_size : image.ki_image_size;
    }

    Result Load(const LoaderContext& lc, bootdevice::Stream& stream, addr_t destination, KernelImage& image)
    {
        auto dest = lc.lc_physmem.Map(destination, image.ki_payload_size);
        if (dest == nullptr)
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        RESULT_PROPAGATE_FAILURE(stream.Read(sizeof(FERRY_KERNEL_HEADER), dest, image.ki_payload_size));

        image.ki_base = destination;
        image.ki_length = image.ki_payload_size;
        TRACE(
            IMAGE, INFO, "payload at %llx-%llx", static_cast<unsigned long long>(destination),
            static_cast<unsigned long long>(destination + image.ki_length));
        return Result::Success();
    }

    ModuleType ModuleTypeFromName(const char* name)
    {
        if (strstr(name, "initrd") != nullptr || EndsWith(name, ".cpio") || EndsWith(name, ".img"))
            return ModuleType::Ramdisk;
        if (EndsWith(name, ".sym") || EndsWith(name, ".map"))
            return ModuleType::Symbols;
        return ModuleType::Generic;
    }

    Result LoadModule(
        const LoaderContext& lc, bootdevice::Stream& stream, const char* name, memmap::MemoryMap& map,
        Module& module)
    {
        module = Module{};
        const uint64_t length = stream.GetSize();
        uint64_t rounded;
        if (length == 0 || !util::checked_align_up(length, static_cast<uint64_t>(PAGE_SIZE), rounded))
            return RESULT_MAKE_FAILURE(DeviceReadFailed);

        addr_t base;
        if (!memmap::FindFree(
                map, rounded, PAGE_SIZE, platform::GetAllocationMinimum(lc.lc_platform), ~static_cast<addr_t>(0),
                true, base) ||
            !memmap::Claim(lc, map, base, rounded)) {
            TRACE(IMAGE, ERROR, "no room for module '%s' (%llu bytes)", name, static_cast<unsigned long long>(length));
            return RESULT_MAKE_FAILURE(InsufficientStagingMemory);
        }

        auto dest = lc.lc_physmem.Map(base, length);
        if (dest == nullptr)
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        RESULT_PROPAGATE_FAILURE(stream.Read(0, dest, length));

        util::copy_utf8(module.m_name, sizeof(module.m_name), name, strlen(name));
        module.m_base = base;
        module.m_length = length;
        module.m_type = ModuleTypeFromName(module.m_name);
        TRACE(
            IMAGE, INFO, "module '%s' at %llx, %llu bytes", module.m_name, static_cast<unsigned long long>(base),
            static_cast<unsigned long long>(length));
        return Result::Success();
    }

} // namespace image
