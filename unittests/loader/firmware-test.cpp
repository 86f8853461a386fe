/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "loader/firmware/fdt.h"
#include "loader/firmware/multiboot.h"
#include "loader/fake-fdt.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"

using namespace firmware;

namespace
{
    constexpr addr_t DtbAddress = 0x80000000;
    constexpr addr_t InfoAddress = 0x9000;

    std::vector<uint8_t> MakeTree()
    {
        fake::FdtBuilder fdt;
        fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 1 });
        fdt.String("model", "test board");
        fdt.BeginNode("chosen").String("bootargs", "debug kernel=lba:64").EndNode();
        fdt.BeginNode("soc").Cells("#address-cells", { 1 }).Cells("#size-cells", { 1 });
        fdt.BeginNode("mmc@fe300000").Strings("compatible", { "brcm,bcm2835-sdhci", "generic-sdhci" }).EndNode();
        fdt.BeginNode("spi@fe204000").Strings("compatible", { "jedec,spi-nor" }).EndNode();
        fdt.EndNode();
        fdt.AddReservation(0x1000, 0x2000);
        fdt.AddReservation(0x8000, 0x1000);
        return fdt.Build();
    }

    struct FdtTest : ::testing::Test {
        void SetUp() override
        {
            f_Machine.AddMemory(DtbAddress, 0x10000);
            f_Machine.Write(DtbAddress, MakeTree());
            ASSERT_TRUE(f_Blob.Attach(f_Machine.GetPhysicalMemory(), DtbAddress));
        }

        fake::Machine f_Machine;
        fdt::Blob f_Blob;
    };
} // unnamed namespace

TEST_F(FdtTest, FindsNodesByPath)
{
    EXPECT_EQ(f_Blob.GetRoot(), f_Blob.FindNode("/"));
    const auto chosen = f_Blob.FindNode("/chosen");
    ASSERT_NE(fdt::InvalidNode, chosen);
    EXPECT_STREQ("chosen", f_Blob.GetName(chosen));

    // A path component without unit address matches any unit address
    const auto mmc = f_Blob.FindNode("/soc/mmc");
    ASSERT_NE(fdt::InvalidNode, mmc);
    EXPECT_STREQ("mmc@fe300000", f_Blob.GetName(mmc));
    EXPECT_EQ(mmc, f_Blob.FindNode("/soc/mmc@fe300000"));

    EXPECT_EQ(fdt::InvalidNode, f_Blob.FindNode("/soc/mmc@0"));
    EXPECT_EQ(fdt::InvalidNode, f_Blob.FindNode("/nonexistent"));
    EXPECT_EQ(fdt::InvalidNode, f_Blob.FindNode("chosen"));
}

TEST_F(FdtTest, ReadsProperties)
{
    const auto root = f_Blob.GetRoot();
    EXPECT_STREQ("test board", f_Blob.GetProperty(root, "model").AsString());
    EXPECT_FALSE(f_Blob.GetProperty(root, "mod").IsValid());
    EXPECT_EQ(2u, f_Blob.GetAddressCells(root));
    EXPECT_EQ(1u, f_Blob.GetSizeCells(root));

    const auto chosen = f_Blob.FindNode("/chosen");
    EXPECT_STREQ("debug kernel=lba:64", f_Blob.GetProperty(chosen, "bootargs").AsString());
    // Defaults apply when the node does not say
    EXPECT_EQ(2u, f_Blob.GetAddressCells(chosen));
    EXPECT_EQ(1u, f_Blob.GetSizeCells(chosen));
}

TEST_F(FdtTest, MatchesStringLists)
{
    const auto compatible = f_Blob.GetProperty(f_Blob.FindNode("/soc/mmc"), "compatible");
    EXPECT_TRUE(compatible.ContainsString("generic-sdhci"));
    EXPECT_FALSE(compatible.ContainsString("sdhci"));
    EXPECT_TRUE(compatible.ContainsSubstring("sdhci"));
    EXPECT_FALSE(compatible.ContainsSubstring("emmc"));
}

TEST_F(FdtTest, WalksChildren)
{
    std::vector<std::string> names;
    f_Blob.ForEachChild(f_Blob.FindNode("/soc"), [&](fdt::Node node) { names.push_back(f_Blob.GetName(node)); });
    EXPECT_EQ((std::vector<std::string>{ "mmc@fe300000", "spi@fe204000" }), names);

    names.clear();
    f_Blob.ForEachChild(f_Blob.GetRoot(), [&](fdt::Node node) { names.push_back(f_Blob.GetName(node)); });
    EXPECT_EQ((std::vector<std::string>{ "chosen", "soc" }), names);
}

TEST_F(FdtTest, WalksReservations)
{
    std::vector<std::pair<uint64_t, uint64_t>> reservations;
    f_Blob.ForEachReservation([&](uint64_t address, uint64_t size) { reservations.push_back({ address, size }); });
    ASSERT_EQ(2u, reservations.size());
    EXPECT_EQ(0x1000u, reservations[0].first);
    EXPECT_EQ(0x2000u, reservations[0].second);
    EXPECT_EQ(0x8000u, reservations[1].first);
}

TEST(Fdt, PropertyCells)
{
    const uint8_t data[] = { 0x00, 0x00, 0x00, 0x01, 0x80, 0x00, 0x00, 0x00, 0x00, 0x10, 0x00, 0x00 };
    fdt::Property prop{ data, sizeof(data) };
    EXPECT_EQ(1u, prop.GetCell(0));
    EXPECT_EQ(0x80000000u, prop.GetCell(1));
    EXPECT_EQ(0x180000000u, prop.GetCells(0, 2));
    EXPECT_EQ(0x100000u, prop.GetCells(2, 1));
    // Out of range cells read as zero
    EXPECT_EQ(0u, prop.GetCell(3));

    const uint8_t unterminated[] = { 'o', 'k' };
    EXPECT_EQ(nullptr, (fdt::Property{ unterminated, sizeof(unterminated) }.AsString()));
}

TEST(Fdt, RejectsBadHeaders)
{
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    fdt::Blob blob;

    auto dtb = MakeTree();
    dtb[0x17] = 15; // version
    machine.Write(DtbAddress, dtb);
    EXPECT_FALSE(blob.Attach(machine.GetPhysicalMemory(), DtbAddress));

    dtb = MakeTree();
    dtb[0x04] = 0x7f; // total size beyond the maximum
    machine.Write(DtbAddress, dtb);
    EXPECT_FALSE(blob.Attach(machine.GetPhysicalMemory(), DtbAddress));

    dtb = MakeTree();
    dtb[0x0a] = 0x7f; // structure block beyond the blob
    machine.Write(DtbAddress, dtb);
    EXPECT_FALSE(blob.Attach(machine.GetPhysicalMemory(), DtbAddress));

    EXPECT_FALSE(blob.Attach(machine.GetPhysicalMemory(), DtbAddress + 0x20000));
}

TEST(Multiboot, WalksTags)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddCommandLine("kernel=mod:0");
    mb.AddModule(0x200000, 0x300000, "kernel.img");
    mb.AddModule(0x300000, 0x380000, "initrd");
    mb.AddMemory(0, 0x9fc00, 1);
    machine.Write(InfoAddress, mb.Build());
    const auto& physmem = machine.GetPhysicalMemory();

    std::vector<uint32_t> types;
    multiboot::ForEachTag(physmem, InfoAddress, [&](const MULTIBOOT2_TAG& tag) { types.push_back(tag.mt_type); });
    EXPECT_EQ(
        (std::vector<uint32_t>{ MULTIBOOT2_TAG_TYPE_CMDLINE, MULTIBOOT2_TAG_TYPE_MODULE, MULTIBOOT2_TAG_TYPE_MODULE,
            MULTIBOOT2_TAG_TYPE_MMAP }),
        types);

    auto cmdline = multiboot::FindTag(physmem, InfoAddress, MULTIBOOT2_TAG_TYPE_CMDLINE);
    ASSERT_NE(nullptr, cmdline);
    EXPECT_STREQ("kernel=mod:0", reinterpret_cast<const char*>(cmdline) + sizeof(MULTIBOOT2_TAG));
    EXPECT_EQ(nullptr, multiboot::FindTag(physmem, InfoAddress, MULTIBOOT2_TAG_TYPE_FRAMEBUFFER));

    auto mod = multiboot::FindModule(physmem, InfoAddress, 1);
    ASSERT_NE(nullptr, mod);
    EXPECT_EQ(0x300000u, mod->mm_mod_start);
    EXPECT_EQ(0x380000u, mod->mm_mod_end);
    EXPECT_STREQ("initrd", mod->mm_string);
    EXPECT_EQ(nullptr, multiboot::FindModule(physmem, InfoAddress, 2));
}

TEST(Multiboot, RejectsImplausibleSizes)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    const uint32_t tiny[2] = { 8, 0 };
    machine.Write(InfoAddress, tiny, sizeof(tiny));
    EXPECT_EQ(nullptr, multiboot::MapInfo(machine.GetPhysicalMemory(), InfoAddress));

    const uint32_t huge[2] = { multiboot::MaxInfoSize + 8, 0 };
    machine.Write(InfoAddress, huge, sizeof(huge));
    EXPECT_EQ(nullptr, multiboot::MapInfo(machine.GetPhysicalMemory(), InfoAddress));

    // Claims to extend beyond what is mapped
    const uint32_t partial[2] = { 0x8000, 0 };
    machine.Write(0xc000, partial, sizeof(partial));
    EXPECT_EQ(nullptr, multiboot::MapInfo(machine.GetPhysicalMemory(), 0xc000));
}
