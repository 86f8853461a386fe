/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <vector>
#include "loader/decompress.h"
#include "loader/lib.h"
#include "loader/fake-kernel.h"
#include "loader/fake-memory.h"

using namespace memmap;

namespace
{
    constexpr addr_t SourceAddress = MiB(2);

    struct DecompressTest : ::testing::Test {
        DecompressTest() : d_Context(d_Machine) {}

        void SetUp() override
        {
            ASSERT_TRUE(d_Map.push_back(MemoryRegion{ 0, MiB(1), RegionType::Reserved, 0 }));
            ASSERT_TRUE(d_Map.push_back(MemoryRegion{ MiB(1), MiB(63), RegionType::Usable, 0 }));
            d_Source = d_Machine.AddMemory(SourceAddress, MiB(1));
            d_Staging = d_Machine.AddMemory(MiB(16), MiB(1), 0xcc);
        }

        // Describes 'blob' as loaded at SourceAddress in a range we claimed
        KernelImage Place(const std::vector<uint8_t>& blob, Compression compression, uint64_t image_size)
        {
            d_Machine.Write(SourceAddress, blob);
            EXPECT_TRUE(Claim(d_Context.c_Context, d_Map, SourceAddress, ROUND_UP(blob.size(), PAGE_SIZE)));
            KernelImage image;
            image.ki_base = SourceAddress;
            image.ki_length = blob.size();
            image.ki_owned = true;
            image.ki_compression = compression;
            image.ki_payload_size = blob.size();
            image.ki_image_size = image_size;
            return image;
        }

        std::vector<uint8_t> GetStaging(size_t length) const
        {
            return std::vector<uint8_t>(d_Staging, d_Staging + length);
        }

        const LoaderContext& Context() const { return d_Context.c_Context; }

        fake::Machine d_Machine;
        fake::Context d_Context;
        MemoryMap d_Map;
        uint8_t* d_Source = nullptr;
        uint8_t* d_Staging = nullptr;
    };
} // unnamed namespace

TEST_F(DecompressTest, StagesRawKernelsInPlace)
{
    KernelImage image;
    image.ki_base = MiB(16);
    image.ki_length = 0x8000;
    image.ki_payload_size = 0x8000;
    image.ki_image_size = 0x8000;

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(MiB(16), staging.sr_base);
    EXPECT_EQ(0x8000u, staging.sr_capacity);
    EXPECT_TRUE(IsWithinRegionOfType(d_Map, MiB(16), 0x8000, RegionType::Bootloader));

    ASSERT_TRUE(decompress::Expand(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(MiB(16), image.ki_base);
    EXPECT_EQ(0x8000u, image.ki_length);
    // Nothing was copied
    EXPECT_EQ(0xcc, d_Staging[0]);
}

TEST_F(DecompressTest, CopiesRawKernelsBelowTheStagingMinimum)
{
    const auto payload = fake::MakePayload(0x5800);
    auto image = Place(payload, Compression::None, payload.size());

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(MiB(16), staging.sr_base);
    EXPECT_EQ(0x6000u, staging.sr_capacity);

    ASSERT_TRUE(decompress::Expand(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(MiB(16), image.ki_base);
    EXPECT_EQ(payload.size(), image.ki_length);
    EXPECT_TRUE(image.ki_owned);
    EXPECT_EQ(payload, GetStaging(payload.size()));

    // The source range went back to the pool; staging did not
    EXPECT_TRUE(IsWithinRegionOfType(d_Map, SourceAddress, 0x6000, RegionType::Usable));
    EXPECT_TRUE(IsWithinRegionOfType(d_Map, MiB(16), 0x6000, RegionType::Bootloader));
}

TEST_F(DecompressTest, HonoursTheLoadAlignment)
{
    d_Map.clear();
    ASSERT_TRUE(d_Map.push_back(MemoryRegion{ MiB(17) + 0x1000, MiB(40), RegionType::Usable, 0 }));

    KernelImage image;
    image.ki_compression = Compression::Gzip;
    image.ki_image_size = 0x3001;
    image.ki_alignment = MiB(2);
    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(MiB(18), staging.sr_base);
    EXPECT_EQ(0x4000u, staging.sr_capacity);
}

TEST_F(DecompressTest, StagesFromTheStartOfRamElsewhere)
{
    d_Context.c_Platform.pd_arch = Architecture::ARM64;
    d_Map.clear();
    ASSERT_TRUE(d_Map.push_back(MemoryRegion{ 0x40000000, MiB(64), RegionType::Usable, 0 }));

    KernelImage image;
    image.ki_compression = Compression::Gzip;
    image.ki_image_size = MiB(4);
    image.ki_alignment = MiB(2);
    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(0x40000000u, staging.sr_base);
    EXPECT_EQ(MiB(4), staging.sr_capacity);
}

TEST_F(DecompressTest, FailsWithoutRoom)
{
    KernelImage image;
    image.ki_compression = Compression::Gzip;
    image.ki_image_size = MiB(60);
    StagingRegion staging;
    EXPECT_EQ(
        ErrorKind::InsufficientStagingMemory,
        decompress::AllocateStaging(Context(), d_Map, image, staging).AsErrorKind());

    image.ki_image_size = 0;
    EXPECT_EQ(
        ErrorKind::InsufficientStagingMemory,
        decompress::AllocateStaging(Context(), d_Map, image, staging).AsErrorKind());
    ASSERT_EQ(2u, d_Map.size());
    EXPECT_EQ(RegionType::Usable, d_Map[1].mr_type);
}

TEST_F(DecompressTest, InflatesGzipKernels)
{
    const auto payload = fake::MakePayload(0x20000);
    auto image = Place(fake::Gzip(payload), Compression::Gzip, payload.size());

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(MiB(16), staging.sr_base);
    EXPECT_EQ(0x20000u, staging.sr_capacity);

    ASSERT_TRUE(decompress::Expand(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(Compression::None, image.ki_compression);
    EXPECT_EQ(MiB(16), image.ki_base);
    EXPECT_EQ(payload.size(), image.ki_length);
    EXPECT_EQ(payload, GetStaging(payload.size()));
    EXPECT_TRUE(IsWithinRegionOfType(d_Map, SourceAddress, PAGE_SIZE, RegionType::Usable));
}

TEST_F(DecompressTest, InflatesShorterThanDeclared)
{
    // The declared size is an upper bound
    const auto payload = fake::MakePayload(0x18000);
    auto image = Place(fake::Gzip(payload), Compression::Gzip, 0x20000);

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    ASSERT_TRUE(decompress::Expand(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(payload.size(), image.ki_length);
    EXPECT_EQ(payload, GetStaging(payload.size()));
}

TEST_F(DecompressTest, RefusesToOverflowStaging)
{
    const auto payload = fake::MakePayload(0x20000);
    auto image = Place(fake::Gzip(payload), Compression::Gzip, 0x10000);

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(0x10000u, staging.sr_capacity);
    EXPECT_EQ(ErrorKind::StagingOverflow, decompress::Expand(Context(), d_Map, image, staging).AsErrorKind());

    // Staging is wiped; the byte after it is untouched
    EXPECT_EQ(std::vector<uint8_t>(0x10000, 0), GetStaging(0x10000));
    EXPECT_EQ(0xcc, d_Staging[0x10000]);
    EXPECT_EQ(Compression::Gzip, image.ki_compression);
    EXPECT_EQ(SourceAddress, image.ki_base);
}

TEST_F(DecompressTest, RejectsTruncatedStreams)
{
    const auto payload = fake::MakePayload(0x20000);
    auto gz = fake::Gzip(payload);
    gz.resize(gz.size() - 100);
    auto image = Place(gz, Compression::Gzip, payload.size());

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(ErrorKind::DecompressionFailed, decompress::Expand(Context(), d_Map, image, staging).AsErrorKind());
    EXPECT_EQ(std::vector<uint8_t>(payload.size(), 0), GetStaging(payload.size()));
}

TEST_F(DecompressTest, RejectsNonGzipData)
{
    auto image = Place(fake::MakePayload(0x1000), Compression::Gzip, 0x4000);
    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(ErrorKind::DecompressionFailed, decompress::Expand(Context(), d_Map, image, staging).AsErrorKind());
}

TEST_F(DecompressTest, RefusesFormatsWithoutADecoder)
{
    auto image = Place(fake::MakePayload(0x1000), Compression::Xz, 0x4000);
    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(ErrorKind::UnsupportedCompression, decompress::Expand(Context(), d_Map, image, staging).AsErrorKind());
}

TEST_F(DecompressTest, EntryPointMustBeProduced)
{
    // Entry lies within the declared size, but past what the stream gives
    const auto payload = fake::MakePayload(0x8000);
    auto image = Place(fake::Gzip(payload), Compression::Gzip, 0x20000);
    image.ki_entry_offset = 0x10000;

    StagingRegion staging;
    ASSERT_TRUE(decompress::AllocateStaging(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(ErrorKind::DecompressionFailed, decompress::Expand(Context(), d_Map, image, staging).AsErrorKind());
    EXPECT_EQ(std::vector<uint8_t>(0x20000, 0), GetStaging(0x20000));
    EXPECT_EQ(0xcc, d_Staging[0x20000]);
    EXPECT_EQ(Compression::Gzip, image.ki_compression);

    // The last produced byte is a valid entry point
    image.ki_entry_offset = payload.size() - 1;
    ASSERT_TRUE(decompress::Expand(Context(), d_Map, image, staging).IsSuccess());
    EXPECT_EQ(payload.size(), image.ki_length);
}
