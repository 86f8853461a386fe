/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/decompress.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"
#include <ferry/util/checked.h>
#include <ferry/util/utility.h>
#include <zlib.h>

namespace decompress
{
    namespace
    {
        // zlib counts in 32-bit quantities; feed it at most this much at once
        constexpr uint64_t MaxChunk = 1u << 30;

        voidpf ArenaAlloc(voidpf opaque, uInt items, uInt size)
        {
            auto arena = static_cast<ScratchArena*>(opaque);
            const uint64_t total = static_cast<uint64_t>(items) * size;
            if (total > Scratch::ArenaSize)
                return Z_NULL;
            return arena->Allocate(static_cast<size_t>(total));
        }

        // Everything goes at once when the arena is reset
        void ArenaFree(voidpf, voidpf) {}

        bool IsStagedInPlace(const memmap::MemoryMap& map, const KernelImage& image, addr_t minimum)
        {
            return image.ki_compression == Compression::None && image.ki_base != 0 &&
                   image.ki_base >= minimum && (image.ki_base & (image.ki_alignment - 1)) == 0 &&
                   memmap::IsWithinRegionOfType(map, image.ki_base, image.ki_length, memmap::RegionType::Usable);
        }

        Result CopyRaw(const LoaderContext& lc, KernelImage& image, const StagingRegion& staging)
        {
            if (image.ki_length > staging.sr_capacity)
                return RESULT_MAKE_FAILURE(StagingOverflow);
            auto src = lc.lc_physmem.Map(image.ki_base, image.ki_length);
            auto dst = lc.lc_physmem.Map(staging.sr_base, image.ki_length);
            if (src == nullptr || dst == nullptr)
                return RESULT_MAKE_FAILURE(DecompressionFailed);
            memmove(dst, src, image.ki_length);
            return Result::Success();
        }

        Result Inflate(const LoaderContext& lc, const KernelImage& image, const StagingRegion& staging, uint64_t& produced)
        {
            auto src = static_cast<uint8_t*>(lc.lc_physmem.Map(image.ki_base, image.ki_length));
            auto dst = static_cast<uint8_t*>(lc.lc_physmem.Map(staging.sr_base, staging.sr_capacity));
            if (src == nullptr || dst == nullptr)
                return RESULT_MAKE_FAILURE(DecompressionFailed);

            ScratchArena arena(lc.lc_scratch.s_arena, sizeof(lc.lc_scratch.s_arena));
            z_stream zs{};
            zs.zalloc = ArenaAlloc;
            zs.zfree = ArenaFree;
            zs.opaque = &arena;
            // 16 + MAX_WBITS: expect a gzip wrapper
            if (int zerr = inflateInit2(&zs, 16 + MAX_WBITS); zerr != Z_OK) {
                TRACE(DECOMPRESS, ERROR, "inflateInit2() error %d", zerr);
                return RESULT_MAKE_FAILURE(DecompressionFailed);
            }

            // Never produce more than the header promised
            uint64_t in_left = image.ki_length;
            uint64_t out_left = util::min(staging.sr_capacity, image::RequiredStagingBytes(image));
            uint8_t probe;
            bool probing = false;
            int zerr = Z_OK;
            while (zerr == Z_OK) {
                if (zs.avail_in == 0 && in_left > 0) {
                    const uint64_t chunk = util::min(in_left, MaxChunk);
                    zs.next_in = src;
                    zs.avail_in = static_cast<uInt>(chunk);
                    src += chunk;
                    in_left -= chunk;
                }
                if (zs.avail_out == 0) {
                    if (probing) {
                        // The stream has more to give than staging can hold
                        inflateEnd(&zs);
                        TRACE(DECOMPRESS, ERROR, "kernel expands beyond %llu bytes",
                            static_cast<unsigned long long>(zs.total_out - 1));
                        return RESULT_MAKE_FAILURE(StagingOverflow);
                    }
                    if (out_left > 0) {
                        const uint64_t chunk = util::min(out_left, MaxChunk);
                        zs.next_out = dst;
                        zs.avail_out = static_cast<uInt>(chunk);
                        dst += chunk;
                        out_left -= chunk;
                    } else {
                        // Staging is full; a single byte tells whether the stream ends here
                        zs.next_out = &probe;
                        zs.avail_out = 1;
                        probing = true;
                    }
                }
                zerr = inflate(&zs, in_left == 0 ? Z_FINISH : Z_NO_FLUSH);
                if (zerr == Z_BUF_ERROR && (zs.avail_out == 0 || (zs.avail_in == 0 && in_left > 0)))
                    zerr = Z_OK; // more room or input will be supplied
            }

            produced = zs.total_out;
            inflateEnd(&zs);
            if (zerr != Z_STREAM_END) {
                TRACE(
                    DECOMPRESS, ERROR, "inflate() error %d after %llu bytes", zerr,
                    static_cast<unsigned long long>(produced));
                return RESULT_MAKE_FAILURE(DecompressionFailed);
            }
            return Result::Success();
        }

        // Never leave partial kernel contents behind
        void WipeStaging(const LoaderContext& lc, const StagingRegion& staging)
        {
            if (!lc.lc_physmem.Fill(staging.sr_base, 0, staging.sr_capacity))
                TRACE(DECOMPRESS, WARN, "unable to wipe staging");
        }

    } // unnamed namespace

    Result AllocateStaging(
        const LoaderContext& lc, memmap::MemoryMap& map, const KernelImage& image, StagingRegion& staging)
    {
        const addr_t minimum = platform::GetStagingMinimum(lc.lc_platform, memmap::LowestUsable(map));
        uint64_t size;
        if (!util::checked_align_up(image::RequiredStagingBytes(image), static_cast<uint64_t>(PAGE_SIZE), size) ||
            size == 0)
            return RESULT_MAKE_FAILURE(InsufficientStagingMemory);

        addr_t base;
        if (IsStagedInPlace(map, image, minimum)) {
            base = image.ki_base;
            size = image.ki_length;
        } else if (!memmap::FindFree(map, size, image.ki_alignment, minimum, ~static_cast<addr_t>(0), false, base)) {
            TRACE(
                DECOMPRESS, ERROR, "no %llu bytes of staging memory above %llx", static_cast<unsigned long long>(size),
                static_cast<unsigned long long>(minimum));
            return RESULT_MAKE_FAILURE(InsufficientStagingMemory);
        }

        if (!memmap::Claim(lc, map, base, size))
            return RESULT_MAKE_FAILURE(InsufficientStagingMemory);
        staging.sr_base = base;
        staging.sr_capacity = size;
        TRACE(
            DECOMPRESS, INFO, "staging at %llx, %llu bytes", static_cast<unsigned long long>(base),
            static_cast<unsigned long long>(size));
        return Result::Success();
    }

    Result Expand(const LoaderContext& lc, memmap::MemoryMap& map, KernelImage& image, const StagingRegion& staging)
    {
        uint64_t produced = 0;
        switch (image.ki_compression) {
            case Compression::None:
                if (image.ki_base == staging.sr_base) {
                    TRACE(DECOMPRESS, INFO, "raw kernel staged in place");
                    return Result::Success();
                }
                RESULT_PROPAGATE_FAILURE(CopyRaw(lc, image, staging));
                produced = image.ki_length;
                break;
            case Compression::Gzip:
                if (auto result = Inflate(lc, image, staging, produced); result.IsFailure()) {
                    WipeStaging(lc, staging);
                    return result;
                }
                // The entry point must be among the bytes the stream produced
                if (produced <= image.ki_entry_offset) {
                    TRACE(
                        DECOMPRESS, ERROR, "entry offset %llx beyond the %llu expanded bytes",
                        static_cast<unsigned long long>(image.ki_entry_offset),
                        static_cast<unsigned long long>(produced));
                    WipeStaging(lc, staging);
                    return RESULT_MAKE_FAILURE(DecompressionFailed);
                }
                break;
            case Compression::Xz:
            case Compression::Zstd:
            case Compression::Lz4:
            case Compression::Lzma:
                // Refused by the image loader already
                return RESULT_MAKE_FAILURE(UnsupportedCompression);
        }

        if (image.ki_owned && !memmap::Release(lc, map, image.ki_base, ROUND_UP(image.ki_length, PAGE_SIZE)))
            TRACE(DECOMPRESS, WARN, "could not return the compressed image to usable memory");

        TRACE(
            DECOMPRESS, INFO, "%s: %llu bytes became %llu bytes", image::CompressionName(image.ki_compression),
            static_cast<unsigned long long>(image.ki_length), static_cast<unsigned long long>(produced));
        image.ki_base = staging.sr_base;
        image.ki_length = produced;
        image.ki_owned = true;
        image.ki_compression = Compression::None;
        return Result::Success();
    }

} // namespace decompress
