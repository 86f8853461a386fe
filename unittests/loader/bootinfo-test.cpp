/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include <vector>
#include "loader/bootinfo.h"
#include "loader/lib.h"
#include "loader/fake-memory.h"

using namespace bootinfo;
using memmap::MemoryRegion;
using memmap::RegionType;

namespace
{
    struct BootInfoTest : ::testing::Test {
        BootInfoTest() : b_Context(b_Machine) {}

        void SetUp() override
        {
            b_Memory = b_Machine.AddMemory(MiB(1), MiB(1));
            ASSERT_TRUE(b_Map.push_back(MemoryRegion{ 0, MiB(1), RegionType::Reserved, 0 }));
            ASSERT_TRUE(b_Map.push_back(MemoryRegion{ MiB(1), MiB(63), RegionType::Usable, 0 }));
        }

        bool ParseBuilt(const BootInfo& info, BootInfoView& view)
        {
            return Parse(b_Machine.At(info.bi_base, info.bi_length), info.bi_length, view);
        }

        fake::Machine b_Machine;
        fake::Context b_Context;
        memmap::MemoryMap b_Map;
        uint8_t* b_Memory = nullptr;
    };

    Module MakeModule(const char* name, addr_t base, uint64_t length, ModuleType type)
    {
        Module m;
        strncpy(m.m_name, name, sizeof(m.m_name) - 1);
        m.m_base = base;
        m.m_length = length;
        m.m_type = type;
        return m;
    }

    std::vector<uint8_t> SerializeView(const BootInfoView& view)
    {
        std::vector<uint8_t> out(GetSerializedSize(view));
        size_t length = 0;
        EXPECT_TRUE(Serialize(view, out.data(), out.size(), length).IsSuccess());
        EXPECT_EQ(out.size(), length);
        return out;
    }

    // A view holding only an opaque section
    std::vector<uint8_t> MakeBlob(uint32_t tag, const std::vector<uint8_t>& payload)
    {
        BootInfoView view;
        Section s;
        s.s_tag = tag;
        s.s_payload = payload.data();
        s.s_length = static_cast<uint32_t>(payload.size());
        EXPECT_TRUE(view.bv_sections.push_back(s));
        return SerializeView(view);
    }

    void SetTotalLength(std::vector<uint8_t>& blob, uint32_t length) { memcpy(&blob[8], &length, sizeof(length)); }
} // unnamed namespace

TEST_F(BootInfoTest, BuildsBootInformation)
{
    image::ModuleList modules;
    ASSERT_TRUE(modules.push_back(MakeModule("initrd", 0x3000000, 0x12345, ModuleType::Ramdisk)));
    ASSERT_TRUE(modules.push_back(MakeModule("kernel.sym", 0x3100000, 0x800, ModuleType::Symbols)));

    BootInfo info;
    ASSERT_TRUE(Build(b_Context.c_Context, b_Map, "root=/dev/sda1 verbose", modules, nullptr, info).IsSuccess());
    EXPECT_EQ(MiB(1), info.bi_base);
    EXPECT_EQ(static_cast<uint64_t>(PAGE_SIZE), info.bi_region_size);
    EXPECT_EQ(0u, info.bi_length % FERRY_BOOTINFO_SECTION_ALIGN);

    BootInfoView view;
    ASSERT_TRUE(ParseBuilt(info, view));
    EXPECT_EQ(FERRY_BOOTINFO_VERSION_MAJOR, view.bv_version_major);
    EXPECT_EQ(FERRY_BOOTINFO_VERSION_MINOR, view.bv_version_minor);
    ASSERT_EQ(3u, view.bv_sections.size());
    EXPECT_EQ(static_cast<uint32_t>(FERRY_BOOTINFO_TAG_MEMORY_MAP), view.bv_sections[0].s_tag);
    EXPECT_EQ(static_cast<uint32_t>(FERRY_BOOTINFO_TAG_COMMAND_LINE), view.bv_sections[1].s_tag);
    EXPECT_EQ(static_cast<uint32_t>(FERRY_BOOTINFO_TAG_MODULES), view.bv_sections[2].s_tag);

    // The map describes the region holding it
    ASSERT_EQ(3u, view.bv_memory_map.size());
    EXPECT_EQ((MemoryRegion{ 0, MiB(1), RegionType::Reserved, 0 }), view.bv_memory_map[0]);
    EXPECT_EQ((MemoryRegion{ MiB(1), PAGE_SIZE, RegionType::Bootloader, 0 }), view.bv_memory_map[1]);
    EXPECT_EQ((MemoryRegion{ MiB(1) + PAGE_SIZE, MiB(63) - PAGE_SIZE, RegionType::Usable, 0 }), view.bv_memory_map[2]);
    ASSERT_EQ(3u, b_Map.size());
    EXPECT_EQ(view.bv_memory_map[1], b_Map[1]);

    EXPECT_STREQ("root=/dev/sda1 verbose", view.bv_command_line);

    ASSERT_EQ(2u, view.bv_modules.size());
    EXPECT_STREQ("initrd", view.bv_modules[0].m_name);
    EXPECT_EQ(0x3000000u, view.bv_modules[0].m_base);
    EXPECT_EQ(0x12345u, view.bv_modules[0].m_length);
    EXPECT_EQ(ModuleType::Ramdisk, view.bv_modules[0].m_type);
    EXPECT_STREQ("kernel.sym", view.bv_modules[1].m_name);
    EXPECT_EQ(ModuleType::Symbols, view.bv_modules[1].m_type);

    // No framebuffer given; BIOS has nothing to hand over
    EXPECT_FALSE(view.bv_has_framebuffer);
    EXPECT_FALSE(view.bv_has_firmware);
}

TEST_F(BootInfoTest, IncludesTheFramebufferAndDeviceTree)
{
    auto& pd = b_Context.c_Platform;
    pd.pd_arch = Architecture::ARM64;
    pd.pd_mode = FirmwareMode::DeviceTree;
    pd.pd_dtb = 0x48000000;

    Framebuffer fb;
    fb.fb_base = 0x3c000000;
    fb.fb_width = 1024;
    fb.fb_height = 768;
    fb.fb_pitch = 4096;
    fb.fb_bpp = 32;
    fb.fb_red_size = fb.fb_green_size = fb.fb_blue_size = 8;
    fb.fb_red_shift = 16;
    fb.fb_green_shift = 8;

    BootInfo info;
    ASSERT_TRUE(Build(b_Context.c_Context, b_Map, "", image::ModuleList{}, &fb, info).IsSuccess());
    // The lowest usable page
    EXPECT_EQ(MiB(1), info.bi_base);

    BootInfoView view;
    ASSERT_TRUE(ParseBuilt(info, view));
    ASSERT_EQ(5u, view.bv_sections.size());
    EXPECT_STREQ("", view.bv_command_line);
    EXPECT_TRUE(view.bv_modules.empty());

    ASSERT_TRUE(view.bv_has_framebuffer);
    EXPECT_EQ(0x3c000000u, view.bv_framebuffer.fb_base);
    EXPECT_EQ(1024u, view.bv_framebuffer.fb_width);
    EXPECT_EQ(768u, view.bv_framebuffer.fb_height);
    EXPECT_EQ(4096u, view.bv_framebuffer.fb_pitch);
    EXPECT_EQ(32, view.bv_framebuffer.fb_bpp);
    EXPECT_EQ(16, view.bv_framebuffer.fb_red_shift);
    EXPECT_EQ(8, view.bv_framebuffer.fb_green_shift);
    EXPECT_EQ(0, view.bv_framebuffer.fb_blue_shift);

    ASSERT_TRUE(view.bv_has_firmware);
    EXPECT_EQ(static_cast<uint32_t>(FERRY_FIRMWARE_DEVICE_TREE), view.bv_firmware_kind);
    EXPECT_EQ(0x48000000u, view.bv_firmware_address);
}

TEST_F(BootInfoTest, ReproducesBuiltInformationExactly)
{
    auto& pd = b_Context.c_Platform;
    pd.pd_arch = Architecture::ARM64;
    pd.pd_mode = FirmwareMode::DeviceTree;
    pd.pd_dtb = 0x48000000;

    image::ModuleList modules;
    ASSERT_TRUE(modules.push_back(MakeModule("initrd", 0x3000000, 0x12345, ModuleType::Ramdisk)));
    Framebuffer fb;
    fb.fb_base = 0x3c000000;
    fb.fb_width = 800;
    fb.fb_height = 600;
    fb.fb_pitch = 3200;
    fb.fb_bpp = 32;

    BootInfo info;
    ASSERT_TRUE(Build(b_Context.c_Context, b_Map, "console=ttyAMA0 debug", modules, &fb, info).IsSuccess());
    const auto built = b_Machine.At(info.bi_base, info.bi_length);
    ASSERT_NE(nullptr, built);

    BootInfoView view;
    ASSERT_TRUE(Parse(built, info.bi_length, view));
    ASSERT_EQ(b_Map.size(), view.bv_memory_map.size());
    for (size_t n = 0; n < b_Map.size(); n++)
        EXPECT_EQ(b_Map[n], view.bv_memory_map[n]) << "entry " << n;

    EXPECT_EQ(std::vector<uint8_t>(built, built + info.bi_length), SerializeView(view));
}

TEST_F(BootInfoTest, RefusesOversizedInformation)
{
    const std::string cmdline(FERRY_BOOTINFO_MAX_LENGTH, 'x');
    BootInfo info;
    EXPECT_EQ(
        ErrorKind::BootInfoTooLarge,
        Build(b_Context.c_Context, b_Map, cmdline.c_str(), image::ModuleList{}, nullptr, info).AsErrorKind());
    // Nothing was claimed
    EXPECT_EQ(2u, b_Map.size());
}

TEST_F(BootInfoTest, NeedsRoomBelow4GiB)
{
    b_Map.clear();
    ASSERT_TRUE(b_Map.push_back(MemoryRegion{ 0, 0x9f000, RegionType::Usable, 0 }));
    ASSERT_TRUE(b_Map.push_back(MemoryRegion{ GiB(4), GiB(4), RegionType::Usable, 0 }));
    BootInfo info;
    EXPECT_EQ(
        ErrorKind::BootInfoTooLarge,
        Build(b_Context.c_Context, b_Map, "", image::ModuleList{}, nullptr, info).AsErrorKind());
}

TEST(BootInfo, KeepsUnknownSections)
{
    const std::vector<uint8_t> payload{ 1, 2, 3, 4, 5 };
    const auto blob = MakeBlob(0x1234, payload);
    // Header, a padded section and the terminator
    EXPECT_EQ(16u + 16u + 8u, blob.size());

    BootInfoView view;
    ASSERT_TRUE(Parse(blob.data(), blob.size(), view));
    ASSERT_EQ(1u, view.bv_sections.size());
    EXPECT_EQ(0x1234u, view.bv_sections[0].s_tag);
    ASSERT_EQ(payload.size(), view.bv_sections[0].s_length);
    EXPECT_EQ(0, memcmp(payload.data(), view.bv_sections[0].s_payload, payload.size()));

    EXPECT_EQ(blob, SerializeView(view));
}

TEST(BootInfo, AcceptsNewerMinorVersions)
{
    auto blob = MakeBlob(0x1234, { 0 });
    blob[6] = FERRY_BOOTINFO_VERSION_MINOR + 1;
    BootInfoView view;
    ASSERT_TRUE(Parse(blob.data(), blob.size(), view));
    EXPECT_EQ(FERRY_BOOTINFO_VERSION_MINOR + 1, view.bv_version_minor);
    EXPECT_EQ(blob, SerializeView(view));
}

TEST(BootInfo, RejectsMalformedInformation)
{
    BootInfoView view;
    const auto good = MakeBlob(0x1234, { 1, 2, 3 });
    ASSERT_TRUE(Parse(good.data(), good.size(), view));

    auto blob = good;
    blob[0] ^= 1; // magic
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    blob = good;
    blob[4] = FERRY_BOOTINFO_VERSION_MAJOR + 1;
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    // Shorter than the header says
    EXPECT_FALSE(Parse(good.data(), good.size() - 8, view));
    EXPECT_FALSE(Parse(good.data(), 8, view));

    // No terminator
    blob = good;
    blob.resize(blob.size() - 8);
    SetTotalLength(blob, static_cast<uint32_t>(blob.size()));
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    // Bytes after the terminator
    blob = good;
    blob.resize(blob.size() + 8);
    SetTotalLength(blob, static_cast<uint32_t>(blob.size()));
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    // Padding must be zero
    blob = good;
    blob[16 + 8 + 3] = 0xff;
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    // Section extending beyond the total length
    blob = good;
    blob[16 + 4] = 0x80;
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));
}

TEST(BootInfo, RejectsMalformedKnownSections)
{
    BootInfoView view;
    // Command line without terminator
    auto blob = MakeBlob(FERRY_BOOTINFO_TAG_COMMAND_LINE, { 'a', 'b' });
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    // Memory map claiming more entries than it holds
    std::vector<uint8_t> mm(8 + 24, 0);
    mm[0] = 2;
    mm[4] = 24;
    blob = MakeBlob(FERRY_BOOTINFO_TAG_MEMORY_MAP, mm);
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));

    mm[0] = 1;
    blob = MakeBlob(FERRY_BOOTINFO_TAG_MEMORY_MAP, mm);
    EXPECT_TRUE(Parse(blob.data(), blob.size(), view));
    EXPECT_EQ(1u, view.bv_memory_map.size());

    // Framebuffer section too short
    blob = MakeBlob(FERRY_BOOTINFO_TAG_FRAMEBUFFER, std::vector<uint8_t>(16, 0));
    EXPECT_FALSE(Parse(blob.data(), blob.size(), view));
}

TEST(BootInfo, SerializeNeedsEnoughSpace)
{
    const std::vector<uint8_t> payload(100, 0x55);
    BootInfoView view;
    Section s;
    s.s_tag = 0x77;
    s.s_payload = payload.data();
    s.s_length = static_cast<uint32_t>(payload.size());
    ASSERT_TRUE(view.bv_sections.push_back(s));

    std::vector<uint8_t> out(GetSerializedSize(view) - 1);
    size_t length;
    EXPECT_EQ(ErrorKind::BootInfoTooLarge, Serialize(view, out.data(), out.size(), length).AsErrorKind());
}
