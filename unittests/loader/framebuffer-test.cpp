/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include "loader/framebuffer.h"
#include "loader/lib.h"
#include "loader/fake-bios.h"
#include "loader/fake-fdt.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"
#include "loader/fake-uefi.h"

namespace
{
    constexpr addr_t DtbAddress = 0x40000000;
    constexpr addr_t InfoAddress = 0x9000;

    Framebuffer MakeFramebuffer(uint32_t width, uint32_t height)
    {
        Framebuffer fb;
        fb.fb_base = 0xe0000000;
        fb.fb_width = width;
        fb.fb_height = height;
        fb.fb_pitch = width * 4;
        fb.fb_bpp = 32;
        return fb;
    }

    struct UefiFramebufferTest : ::testing::Test {
        UefiFramebufferTest() : u_Context(u_Machine)
        {
            u_Context.c_Platform.pd_mode = FirmwareMode::UEFI;
            u_Context.c_Platform.pd_efi_system_table = u_Uefi.GetSystemTable();
        }

        fake::Machine u_Machine;
        fake::Context u_Context;
        fake::Uefi u_Uefi;
        Framebuffer u_Framebuffer;
    };

    // A device tree with a single simple-framebuffer under /chosen
    struct DeviceTreeFramebufferTest : ::testing::Test {
        DeviceTreeFramebufferTest() : d_Context(d_Machine)
        {
            d_Machine.AddMemory(DtbAddress, 0x10000);
            d_Context.c_Platform.pd_arch = Architecture::ARM64;
            d_Context.c_Platform.pd_mode = FirmwareMode::DeviceTree;
            d_Context.c_Platform.pd_dtb = DtbAddress;
        }

        bool Discover(const char* format, const char* status = nullptr)
        {
            fake::FdtBuilder fdt;
            fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
            fdt.BeginNode("chosen").Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
            fdt.BeginNode("framebuffer@3e000000").Strings("compatible", { "simple-framebuffer" });
            fdt.Reg64({ 0x3e000000, 0x400000 });
            fdt.Cells("width", { 1280 }).Cells("height", { 720 }).Cells("stride", { 5120 });
            fdt.String("format", format);
            if (status != nullptr)
                fdt.String("status", status);
            fdt.EndNode().EndNode();
            d_Machine.Write(DtbAddress, fdt.Build());
            return framebuffer::Discover(d_Context.c_Context, d_Framebuffer);
        }

        fake::Machine d_Machine;
        fake::Context d_Context;
        Framebuffer d_Framebuffer;
    };
} // unnamed namespace

TEST(Framebuffer, IsUsable)
{
    EXPECT_TRUE(framebuffer::IsUsable(MakeFramebuffer(1024, 768)));

    auto fb = MakeFramebuffer(1024, 768);
    fb.fb_base = 0;
    EXPECT_FALSE(framebuffer::IsUsable(fb));

    fb = MakeFramebuffer(1024, 768);
    fb.fb_bpp = 16;
    EXPECT_FALSE(framebuffer::IsUsable(fb));

    EXPECT_FALSE(framebuffer::IsUsable(MakeFramebuffer(0, 768)));
    EXPECT_FALSE(framebuffer::IsUsable(MakeFramebuffer(1024, 0)));

    // Rows may be padded, never short
    fb = MakeFramebuffer(1024, 768);
    fb.fb_pitch = 4096 + 64;
    EXPECT_TRUE(framebuffer::IsUsable(fb));
    fb.fb_pitch = 4092;
    EXPECT_FALSE(framebuffer::IsUsable(fb));
}

TEST(Framebuffer, Size)
{
    auto fb = MakeFramebuffer(800, 600);
    EXPECT_EQ(800u * 4 * 600, fb.GetSize());
}

TEST_F(UefiFramebufferTest, NothingWithoutGop)
{
    EXPECT_FALSE(framebuffer::Discover(u_Context.c_Context, u_Framebuffer));
}

TEST_F(UefiFramebufferTest, DescribesBgrModes)
{
    u_Uefi.SetGop(0x80000000, 1920, 1080, firmware::efi::PixelBlueGreenRedReserved8BitPerColor);
    ASSERT_TRUE(framebuffer::Discover(u_Context.c_Context, u_Framebuffer));
    EXPECT_EQ(0x80000000u, u_Framebuffer.fb_base);
    EXPECT_EQ(1920u, u_Framebuffer.fb_width);
    EXPECT_EQ(1080u, u_Framebuffer.fb_height);
    EXPECT_EQ(1920u * 4, u_Framebuffer.fb_pitch);
    EXPECT_EQ(32, u_Framebuffer.fb_bpp);
    EXPECT_EQ(8, u_Framebuffer.fb_red_size);
    EXPECT_EQ(16, u_Framebuffer.fb_red_shift);
    EXPECT_EQ(8, u_Framebuffer.fb_green_shift);
    EXPECT_EQ(0, u_Framebuffer.fb_blue_shift);
}

TEST_F(UefiFramebufferTest, DescribesRgbModes)
{
    u_Uefi.SetGop(0x80000000, 640, 480, firmware::efi::PixelRedGreenBlueReserved8BitPerColor);
    ASSERT_TRUE(framebuffer::Discover(u_Context.c_Context, u_Framebuffer));
    EXPECT_EQ(0, u_Framebuffer.fb_red_shift);
    EXPECT_EQ(16, u_Framebuffer.fb_blue_shift);
    EXPECT_EQ(8, u_Framebuffer.fb_blue_size);
}

TEST_F(UefiFramebufferTest, IgnoresBltOnlyModes)
{
    u_Uefi.SetGop(0x80000000, 640, 480, firmware::efi::PixelBltOnly);
    EXPECT_FALSE(framebuffer::Discover(u_Context.c_Context, u_Framebuffer));
}

TEST(Framebuffer, FromMultiboot)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddFramebuffer(0xfd000000, 1024, 768);
    mb.AddMemory(0, 0x9fc00, 1);
    machine.Write(InfoAddress, mb.Build());

    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::DirectLongMode;
    ctx.c_Platform.pd_multiboot_info = InfoAddress;
    Framebuffer fb;
    ASSERT_TRUE(framebuffer::Discover(ctx.c_Context, fb));
    EXPECT_EQ(0xfd000000u, fb.fb_base);
    EXPECT_EQ(1024u, fb.fb_width);
    EXPECT_EQ(768u, fb.fb_height);
    EXPECT_EQ(4096u, fb.fb_pitch);
    EXPECT_EQ(16, fb.fb_red_shift);
    EXPECT_EQ(8, fb.fb_green_size);
}

TEST(Framebuffer, MultibootWithoutFramebuffer)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddMemory(0, 0x9fc00, 1);
    machine.Write(InfoAddress, mb.Build());

    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::DirectLongMode;
    ctx.c_Platform.pd_multiboot_info = InfoAddress;
    Framebuffer fb;
    EXPECT_FALSE(framebuffer::Discover(ctx.c_Context, fb));
}

TEST(Framebuffer, BiosWithoutVbe)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::Bios bios(machine.GetPhysicalMemory());
    bios.WriteStage1(0x80);

    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(bios.MakeEntryState(), machine.GetPhysicalMemory(), ctx.c_Platform).IsSuccess());
    Framebuffer fb;
    EXPECT_FALSE(framebuffer::Discover(ctx.c_Context, fb));
}

TEST_F(DeviceTreeFramebufferTest, FindsSimpleFramebuffers)
{
    ASSERT_TRUE(Discover("a8r8g8b8"));
    EXPECT_EQ(0x3e000000u, d_Framebuffer.fb_base);
    EXPECT_EQ(1280u, d_Framebuffer.fb_width);
    EXPECT_EQ(720u, d_Framebuffer.fb_height);
    EXPECT_EQ(5120u, d_Framebuffer.fb_pitch);
    EXPECT_EQ(16, d_Framebuffer.fb_red_shift);
    EXPECT_EQ(0, d_Framebuffer.fb_blue_shift);
}

TEST_F(DeviceTreeFramebufferTest, HonoursTheChannelOrder)
{
    ASSERT_TRUE(Discover("x8b8g8r8", "okay"));
    EXPECT_EQ(0, d_Framebuffer.fb_red_shift);
    EXPECT_EQ(16, d_Framebuffer.fb_blue_shift);
}

TEST_F(DeviceTreeFramebufferTest, SkipsDisabledNodes)
{
    EXPECT_FALSE(Discover("a8r8g8b8", "disabled"));
}

TEST_F(DeviceTreeFramebufferTest, SkipsOtherFormats)
{
    EXPECT_FALSE(Discover("r5g6b5"));
}
