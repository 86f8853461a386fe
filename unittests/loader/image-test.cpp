/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <cstdio>
#include <iterator>
#include <string>
#include <vector>
#include "loader/image.h"
#include "loader/bootdevice.h"
#include "loader/lib.h"
#include "loader/fake-kernel.h"
#include "loader/fake-memory.h"

using namespace image;

namespace
{
    constexpr addr_t WindowAddress = 0xfe000000;
    constexpr size_t WindowSize = 0x40000;

    struct ImageTest : ::testing::Test {
        ImageTest() : i_Context(i_Machine) {}

        void SetUp() override { i_Window = i_Machine.AddMemory(WindowAddress, WindowSize); }

        // Places 'blob' at the start of an MMIO window and opens it
        void Open(bootdevice::Stream& stream, const std::vector<uint8_t>& blob, uint64_t length = 0)
        {
            i_Machine.Write(WindowAddress, blob);
            BootDevice device;
            device.bd_source.bs_type = BlockSource::Type::MmioWindow;
            device.bd_source.bs_base = WindowAddress;
            device.bd_source.bs_length = length != 0 ? length : blob.size();
            snprintf(device.bd_name, sizeof(device.bd_name), "window");
            ASSERT_TRUE(stream.Open(device, Locator{}).IsSuccess());
        }

        Result Inspect(const std::vector<uint8_t>& blob, KernelImage& image, bool no_decompress = false)
        {
            bootdevice::Stream stream(i_Context.c_Context);
            Open(stream, blob);
            return image::Inspect(i_Context.c_Context, stream, no_decompress, image);
        }

        fake::Machine i_Machine;
        fake::Context i_Context;
        uint8_t* i_Window = nullptr;
    };

    Result Parse(const std::vector<uint8_t>& blob, KernelImage& image)
    {
        return ParseHeader(blob.data(), blob.size(), image);
    }
} // unnamed namespace

TEST(Image, ParsesAValidHeader)
{
    fake::KernelSpec spec;
    spec.ks_entry_offset = 0x2000;
    spec.ks_alignment = 0x200000;
    spec.ks_flags = FERRY_KERNEL_FLAG_NO_FRAMEBUFFER;
    const auto blob = fake::MakeKernel(fake::MakePayload(0x3000), spec);

    KernelImage image;
    ASSERT_TRUE(Parse(blob, image).IsSuccess());
    EXPECT_EQ(Compression::None, image.ki_compression);
    EXPECT_EQ(0x3000u, image.ki_payload_size);
    EXPECT_EQ(0x3000u, image.ki_image_size);
    EXPECT_EQ(0x2000u, image.ki_entry_offset);
    EXPECT_EQ(0x200000u, image.ki_alignment);
    EXPECT_EQ(static_cast<uint32_t>(FERRY_KERNEL_FLAG_NO_FRAMEBUFFER), image.ki_flags);
    EXPECT_EQ(0u, image.ki_base);
    EXPECT_FALSE(image.ki_owned);
}

TEST(Image, RejectsForeignData)
{
    KernelImage image;
    fake::KernelSpec spec;
    spec.ks_magic = 0x464c457f; // ELF
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, Parse(fake::MakeKernel(fake::MakePayload(0x2000), spec), image).AsErrorKind());

    const auto blob = fake::MakeKernel(fake::MakePayload(0x2000));
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, ParseHeader(blob.data(), 32, image).AsErrorKind());
}

TEST(Image, RejectsBadChecksums)
{
    KernelImage image;
    fake::KernelSpec spec;
    spec.ks_corrupt_crc = true;
    EXPECT_EQ(
        ErrorKind::HeaderChecksumMismatch, Parse(fake::MakeKernel(fake::MakePayload(0x2000), spec), image).AsErrorKind());

    // Any change to the covered bytes is noticed
    auto blob = fake::MakeKernel(fake::MakePayload(0x2000));
    blob[0x30] = 1;
    EXPECT_EQ(ErrorKind::HeaderChecksumMismatch, Parse(blob, image).AsErrorKind());
}

TEST(Image, RejectsUnknownVersions)
{
    KernelImage image;
    fake::KernelSpec spec;
    spec.ks_version = FERRY_KERNEL_HEADER_VERSION + 1;
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, Parse(fake::MakeKernel(fake::MakePayload(0x2000), spec), image).AsErrorKind());
}

TEST(Image, ValidatesAlignment)
{
    const auto payload = fake::MakePayload(0x2000);
    KernelImage image;
    for (uint64_t alignment : { 0x0ull, 0x800ull, 0x1800ull, 0x80000000ull }) {
        fake::KernelSpec spec;
        spec.ks_alignment = alignment;
        EXPECT_EQ(ErrorKind::InvalidKernelFormat, Parse(fake::MakeKernel(payload, spec), image).AsErrorKind())
            << alignment;
    }
    for (uint64_t alignment : { 0x1000ull, 0x200000ull, 0x40000000ull }) {
        fake::KernelSpec spec;
        spec.ks_alignment = alignment;
        EXPECT_TRUE(Parse(fake::MakeKernel(payload, spec), image).IsSuccess()) << alignment;
    }
}

TEST(Image, RejectsEmptyPayloads)
{
    KernelImage image;
    fake::KernelSpec spec;
    spec.ks_entry_offset = 0;
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, Parse(fake::MakeKernel({}, spec), image).AsErrorKind());
}

TEST(Image, EntryPointMustLieWithinTheImage)
{
    KernelImage image;
    fake::KernelSpec spec;
    spec.ks_entry_offset = 0x2000;
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, Parse(fake::MakeKernel(fake::MakePayload(0x2000), spec), image).AsErrorKind());

    spec.ks_entry_offset = 0x1fff;
    EXPECT_TRUE(Parse(fake::MakeKernel(fake::MakePayload(0x2000), spec), image).IsSuccess());

    // For compressed images, the decompressed size counts
    spec.ks_entry_offset = 0x8000;
    spec.ks_image_size = 0x10000;
    const auto gz = fake::Gzip(fake::MakePayload(0x10000));
    ASSERT_LT(gz.size(), 0x8000u);
    ASSERT_TRUE(Parse(fake::MakeKernel(gz, spec), image).IsSuccess());
    EXPECT_EQ(Compression::Gzip, image.ki_compression);
    EXPECT_EQ(gz.size(), image.ki_payload_size);
    EXPECT_EQ(0x10000u, RequiredStagingBytes(image));
}

TEST(Image, DetectsCompression)
{
    const uint8_t gzip[] = { 0x1f, 0x8b, 0x08 };
    const uint8_t xz[] = { 0xfd, 0x37, 0x7a, 0x58, 0x5a, 0x00, 0x00 };
    const uint8_t zstd[] = { 0x28, 0xb5, 0x2f, 0xfd };
    const uint8_t lz4[] = { 0x04, 0x22, 0x4d, 0x18, 0x64 };
    const uint8_t lzma[] = { 0x5d, 0x00, 0x00, 0x80 };
    const uint8_t plain[] = { 0x7f, 'E', 'L', 'F' };
    EXPECT_EQ(Compression::Gzip, DetectCompression(gzip, sizeof(gzip)));
    EXPECT_EQ(Compression::Xz, DetectCompression(xz, sizeof(xz)));
    EXPECT_EQ(Compression::Zstd, DetectCompression(zstd, sizeof(zstd)));
    EXPECT_EQ(Compression::Lz4, DetectCompression(lz4, sizeof(lz4)));
    EXPECT_EQ(Compression::Lzma, DetectCompression(lzma, sizeof(lzma)));
    EXPECT_EQ(Compression::None, DetectCompression(plain, sizeof(plain)));

    // A truncated signature does not count
    EXPECT_EQ(Compression::None, DetectCompression(xz, 5));
    EXPECT_EQ(Compression::None, DetectCompression(gzip, 1));
}

TEST(Image, KnowsItsDecoders)
{
    EXPECT_TRUE(CanDecode(Compression::None));
    EXPECT_TRUE(CanDecode(Compression::Gzip));
    EXPECT_FALSE(CanDecode(Compression::Xz));
    EXPECT_FALSE(CanDecode(Compression::Zstd));
    EXPECT_FALSE(CanDecode(Compression::Lz4));
    EXPECT_FALSE(CanDecode(Compression::Lzma));
    EXPECT_STREQ("gzip", CompressionName(Compression::Gzip));
    EXPECT_STREQ("zstd", CompressionName(Compression::Zstd));
    EXPECT_STREQ("none", CompressionName(Compression::None));
}

TEST(Image, ChecksDeclaredSizesAgainstTheMap)
{
    memmap::MemoryMap map;
    ASSERT_TRUE(map.push_back(memmap::MemoryRegion{ 0, 0x9f000, memmap::RegionType::Usable, 0 }));
    ASSERT_TRUE(map.push_back(memmap::MemoryRegion{ MiB(1), MiB(15), memmap::RegionType::Usable, 0 }));
    EXPECT_EQ(MiB(15), memmap::LargestUsable(map));

    KernelImage image;
    image.ki_payload_size = MiB(4);
    image.ki_image_size = MiB(4);
    EXPECT_TRUE(CheckFits(image, map).IsSuccess());

    image.ki_compression = Compression::Gzip;
    image.ki_image_size = MiB(16);
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, CheckFits(image, map).AsErrorKind());

    image.ki_compression = Compression::None;
    image.ki_payload_size = MiB(16);
    EXPECT_EQ(ErrorKind::InvalidKernelFormat, CheckFits(image, map).AsErrorKind());
}

TEST(Image, ClassifiesModulesByName)
{
    EXPECT_EQ(ModuleType::Ramdisk, ModuleTypeFromName("initrd"));
    EXPECT_EQ(ModuleType::Ramdisk, ModuleTypeFromName("boot/initrd-6.1.gz"));
    EXPECT_EQ(ModuleType::Ramdisk, ModuleTypeFromName("root.cpio"));
    EXPECT_EQ(ModuleType::Ramdisk, ModuleTypeFromName("disk.img"));
    EXPECT_EQ(ModuleType::Symbols, ModuleTypeFromName("kernel.sym"));
    EXPECT_EQ(ModuleType::Symbols, ModuleTypeFromName("System.map"));
    EXPECT_EQ(ModuleType::Generic, ModuleTypeFromName("firmware.bin"));
    EXPECT_EQ(ModuleType::Generic, ModuleTypeFromName("map"));
    EXPECT_EQ(ModuleType::Generic, ModuleTypeFromName(""));
}

TEST_F(ImageTest, InspectsAKernel)
{
    const auto blob = fake::MakeKernel(fake::MakePayload(0x8000));
    KernelImage image;
    ASSERT_TRUE(Inspect(blob, image).IsSuccess());
    EXPECT_EQ(0x8000u, image.ki_payload_size);
    EXPECT_EQ(Compression::None, image.ki_compression);
}

TEST_F(ImageTest, InspectRejectsTinyBlobs)
{
    const auto blob = fake::MakeKernel(fake::MakePayload(0x8000));
    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, blob, 48);
    KernelImage image;
    EXPECT_EQ(
        ErrorKind::InvalidKernelFormat, image::Inspect(i_Context.c_Context, stream, false, image).AsErrorKind());
}

TEST_F(ImageTest, InspectRejectsTruncatedPayloads)
{
    const auto blob = fake::MakeKernel(fake::MakePayload(0x8000));
    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, blob, blob.size() - 1);
    KernelImage image;
    EXPECT_EQ(
        ErrorKind::InvalidKernelFormat, image::Inspect(i_Context.c_Context, stream, false, image).AsErrorKind());
}

TEST_F(ImageTest, InspectReportsReadErrors)
{
    // The window claims more than is backed by memory
    const auto blob = fake::MakeKernel(fake::MakePayload(0x8000));
    bootdevice::Stream stream(i_Context.c_Context);
    i_Machine.Write(WindowAddress, blob);
    BootDevice device;
    device.bd_source.bs_type = BlockSource::Type::MmioWindow;
    device.bd_source.bs_base = WindowAddress + WindowSize - 0x800;
    device.bd_source.bs_length = 0x10000;
    ASSERT_TRUE(stream.Open(device, Locator{}).IsSuccess());
    KernelImage image;
    EXPECT_EQ(ErrorKind::DeviceReadFailed, image::Inspect(i_Context.c_Context, stream, false, image).AsErrorKind());
}

TEST_F(ImageTest, InspectRefusesUnsupportedCompression)
{
    auto payload = fake::MakePayload(0x4000);
    const uint8_t zstd[] = { 0x28, 0xb5, 0x2f, 0xfd };
    std::copy(std::begin(zstd), std::end(zstd), payload.begin());
    fake::KernelSpec spec;
    spec.ks_image_size = 0x10000;
    KernelImage image;
    EXPECT_EQ(ErrorKind::UnsupportedCompression, Inspect(fake::MakeKernel(payload, spec), image).AsErrorKind());
    EXPECT_EQ(Compression::Zstd, image.ki_compression);
}

TEST_F(ImageTest, InspectHonoursNoDecompress)
{
    fake::KernelSpec spec;
    spec.ks_image_size = 0x10000;
    const auto blob = fake::MakeKernel(fake::Gzip(fake::MakePayload(0x10000)), spec);
    KernelImage image;
    EXPECT_EQ(ErrorKind::UnsupportedCompression, Inspect(blob, image, true).AsErrorKind());
    EXPECT_TRUE(Inspect(blob, image, false).IsSuccess());

    // Uncompressed images are fine either way
    EXPECT_TRUE(Inspect(fake::MakeKernel(fake::MakePayload(0x4000)), image, true).IsSuccess());
}

TEST_F(ImageTest, LoadsThePayload)
{
    constexpr addr_t Destination = 0x1000000;
    auto dest = i_Machine.AddMemory(Destination, 0x10000, 0xcc);
    const auto payload = fake::MakePayload(0x8000);
    const auto blob = fake::MakeKernel(payload);

    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, blob);
    KernelImage image;
    ASSERT_TRUE(image::Inspect(i_Context.c_Context, stream, false, image).IsSuccess());
    ASSERT_TRUE(Load(i_Context.c_Context, stream, Destination, image).IsSuccess());
    EXPECT_EQ(Destination, image.ki_base);
    EXPECT_EQ(0x8000u, image.ki_length);
    EXPECT_EQ(payload, std::vector<uint8_t>(dest, dest + payload.size()));
    // Nothing beyond the payload is touched
    EXPECT_EQ(0xcc, dest[payload.size()]);
}

TEST_F(ImageTest, LoadFailsOnUnreachableDestinations)
{
    const auto blob = fake::MakeKernel(fake::MakePayload(0x8000));
    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, blob);
    KernelImage image;
    ASSERT_TRUE(image::Inspect(i_Context.c_Context, stream, false, image).IsSuccess());
    EXPECT_EQ(ErrorKind::DeviceReadFailed, Load(i_Context.c_Context, stream, 0x20000000, image).AsErrorKind());
    EXPECT_EQ(0u, image.ki_base);
}

TEST_F(ImageTest, LoadsModulesHighInMemory)
{
    i_Machine.AddMemory(MiB(4) - 0x2000, 0x2000);
    memmap::MemoryMap map;
    ASSERT_TRUE(map.push_back(memmap::MemoryRegion{ 0, MiB(1), memmap::RegionType::Reserved, 0 }));
    ASSERT_TRUE(map.push_back(memmap::MemoryRegion{ MiB(1), MiB(3), memmap::RegionType::Usable, 0 }));

    const auto contents = fake::MakePayload(0x1800, 0x11);
    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, contents);

    Module module;
    ASSERT_TRUE(LoadModule(i_Context.c_Context, stream, "initrd", map, module).IsSuccess());
    EXPECT_STREQ("initrd", module.m_name);
    EXPECT_EQ(MiB(4) - 0x2000, module.m_base);
    EXPECT_EQ(0x1800u, module.m_length);
    EXPECT_EQ(ModuleType::Ramdisk, module.m_type);

    auto p = i_Machine.At(module.m_base, contents.size());
    EXPECT_EQ(contents, std::vector<uint8_t>(p, p + contents.size()));

    // The pages holding the module are no longer up for grabs
    ASSERT_EQ(3u, map.size());
    EXPECT_EQ(MiB(4) - MiB(1) - 0x2000, map[1].mr_length);
    EXPECT_EQ(memmap::RegionType::Bootloader, map[2].mr_type);
    EXPECT_EQ(0x2000u, map[2].mr_length);
}

TEST_F(ImageTest, ModuleNamesAreCutAtCodePoints)
{
    i_Machine.AddMemory(MiB(4) - 0x1000, 0x1000);
    memmap::MemoryMap map;
    ASSERT_TRUE(map.push_back(memmap::MemoryRegion{ MiB(1), MiB(3), memmap::RegionType::Usable, 0 }));

    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, fake::MakePayload(0x800));
    // 61 characters, then a euro sign that does not fit
    const std::string name = std::string(Module::NameLength - 3, 'm') + "\xe2\x82\xac";
    Module module;
    ASSERT_TRUE(LoadModule(i_Context.c_Context, stream, name.c_str(), map, module).IsSuccess());
    EXPECT_EQ(std::string(Module::NameLength - 3, 'm'), module.m_name);
}

TEST_F(ImageTest, LoadModuleNeedsRoom)
{
    memmap::MemoryMap map;
    ASSERT_TRUE(map.push_back(memmap::MemoryRegion{ MiB(1), 0x1000, memmap::RegionType::Usable, 0 }));

    bootdevice::Stream stream(i_Context.c_Context);
    Open(stream, fake::MakePayload(0x1800));
    Module module;
    EXPECT_EQ(
        ErrorKind::InsufficientStagingMemory,
        LoadModule(i_Context.c_Context, stream, "big.sym", map, module).AsErrorKind());
    EXPECT_EQ(memmap::RegionType::Usable, map[0].mr_type);
}
