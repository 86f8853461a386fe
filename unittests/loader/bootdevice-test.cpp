/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>
#include "loader/bootdevice.h"
#include "loader/lib.h"
#include "loader/platform.h"
#include "loader/fake-bios.h"
#include "loader/fake-fdt.h"
#include "loader/fake-kernel.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"
#include "loader/fake-uefi.h"

using namespace bootdevice;

namespace
{
    constexpr addr_t InfoAddress = 0x9000;
    constexpr addr_t DtbAddress = 0x80000000;

    Locator MakeLocator(const char* s)
    {
        Locator locator;
        EXPECT_TRUE(ParseLocator(s, locator)) << s;
        return locator;
    }

    std::vector<std::string> GetNames(const DeviceList& devices)
    {
        std::vector<std::string> names;
        for (const auto& d : devices)
            names.push_back(d.bd_name);
        return names;
    }

    const BootDevice* FindDevice(const DeviceList& devices, const char* name)
    {
        for (const auto& d : devices)
            if (strcmp(d.bd_name, name) == 0)
                return &d;
        return nullptr;
    }

    void FillPattern(std::vector<uint8_t>& data)
    {
        const auto pattern = fake::MakePayload(data.size(), 0x31);
        data = pattern;
    }

    // Legacy BIOS machine with the low 64KB backed
    struct BiosTest : ::testing::Test {
        BiosTest() : b_Bios(b_Machine.GetPhysicalMemory()), b_Context(b_Machine) { b_Machine.AddMemory(0, 0x10000); }

        void Probe(uint8_t boot_drive)
        {
            b_Bios.WriteStage1(boot_drive);
            ASSERT_TRUE(platform::Probe(b_Bios.MakeEntryState(), b_Machine.GetPhysicalMemory(), b_Context.c_Platform)
                            .IsSuccess());
        }

        fake::Machine b_Machine;
        fake::Bios b_Bios;
        fake::Context b_Context;
    };

    struct UefiTest : ::testing::Test {
        UefiTest() : u_Context(u_Machine) {}

        void Probe()
        {
            ASSERT_TRUE(platform::Probe(u_Uefi.MakeEntryState(), u_Machine.GetPhysicalMemory(), u_Context.c_Platform)
                            .IsSuccess());
        }

        fake::Machine u_Machine;
        fake::Uefi u_Uefi;
        fake::Context u_Context;
    };
} // unnamed namespace

TEST(BootDevice, DefaultPriorities)
{
    EXPECT_EQ(0, DefaultPriority(DeviceKind::Firmware));
    EXPECT_EQ(10, DefaultPriority(DeviceKind::HardDisk));
    EXPECT_EQ(10, DefaultPriority(DeviceKind::SSD));
    EXPECT_EQ(10, DefaultPriority(DeviceKind::eMMC));
    EXPECT_EQ(20, DefaultPriority(DeviceKind::SDCard));
    EXPECT_EQ(20, DefaultPriority(DeviceKind::USB));
    EXPECT_EQ(30, DefaultPriority(DeviceKind::SPI));
    EXPECT_EQ(30, DefaultPriority(DeviceKind::CDROM));
    EXPECT_EQ(40, DefaultPriority(DeviceKind::Network));
}

TEST(BootDevice, KindNames)
{
    EXPECT_STREQ("Hard Disk", KindName(DeviceKind::HardDisk));
    EXPECT_STREQ("CD-ROM", KindName(DeviceKind::CDROM));
    EXPECT_STREQ("Network Boot", KindName(DeviceKind::Network));
    EXPECT_STREQ("SPI Flash", KindName(DeviceKind::SPI));
}

TEST(BootDevice, ParsesPathLocators)
{
    auto locator = MakeLocator("\\EFI\\kernel.img");
    EXPECT_EQ(Locator::Type::Path, locator.l_type);
    EXPECT_STREQ("\\EFI\\kernel.img", locator.l_path);

    locator = MakeLocator("/boot/kernel");
    EXPECT_EQ(Locator::Type::Path, locator.l_type);
    EXPECT_STREQ("/boot/kernel", locator.l_path);

    const std::string long_path = "/" + std::string(Locator::MaxPathLength, 'a');
    EXPECT_FALSE(ParseLocator(long_path.c_str(), locator));
}

TEST(BootDevice, ParsesLbaLocators)
{
    auto locator = MakeLocator("lba:2048");
    EXPECT_EQ(Locator::Type::Lba, locator.l_type);
    EXPECT_EQ(2048u, locator.l_lba);
    EXPECT_EQ(0u, locator.l_length);

    locator = MakeLocator("lba:0x800+4096");
    EXPECT_EQ(0x800u, locator.l_lba);
    EXPECT_EQ(4096u, locator.l_length);

    for (auto s : { "lba:", "lba:12x", "lba:-1", "lba:10+0", "lba:10+", "lba:1+2+3", "LBA:1" })
        EXPECT_FALSE(ParseLocator(s, locator)) << s;
}

TEST(BootDevice, ParsesModuleLocators)
{
    auto locator = MakeLocator("mod:3");
    EXPECT_EQ(Locator::Type::Module, locator.l_type);
    EXPECT_EQ(3u, locator.l_module);

    for (auto s : { "mod:", "mod:32", "mod:1x", "kernel.img", "" })
        EXPECT_FALSE(ParseLocator(s, locator)) << s;
}

TEST(BootDevice, DefaultLocators)
{
    PlatformDescriptor pd;
    Locator locator;

    pd.pd_mode = FirmwareMode::UEFI;
    GetDefaultLocator(pd, locator);
    EXPECT_EQ(Locator::Type::Path, locator.l_type);
    EXPECT_STREQ("\\EFI\\kernel.img", locator.l_path);

    pd.pd_mode = FirmwareMode::LegacyBIOS;
    GetDefaultLocator(pd, locator);
    EXPECT_EQ(Locator::Type::Lba, locator.l_type);
    EXPECT_EQ(2048u, locator.l_lba);

    pd.pd_mode = FirmwareMode::DirectLongMode;
    GetDefaultLocator(pd, locator);
    EXPECT_EQ(Locator::Type::Module, locator.l_type);
    EXPECT_EQ(0u, locator.l_module);

    pd.pd_mode = FirmwareMode::DeviceTree;
    GetDefaultLocator(pd, locator);
    EXPECT_EQ(Locator::Type::Lba, locator.l_type);
    EXPECT_EQ(0u, locator.l_lba);
}

TEST(BootDevice, LocatorsOnlyApplyToMatchingSources)
{
    BootDevice blob;
    blob.bd_source.bs_type = BlockSource::Type::FirmwareBlob;
    blob.bd_source.bs_module = 1;
    BootDevice disk;
    disk.bd_source.bs_type = BlockSource::Type::BiosDisk;
    BootDevice volume;
    volume.bd_source.bs_type = BlockSource::Type::UefiBlockIo;
    volume.bd_source.bs_file_system = reinterpret_cast<firmware::efi::EFI_SIMPLE_FILE_SYSTEM_PROTOCOL*>(0x1000);

    const auto path = MakeLocator("\\kernel");
    const auto lba = MakeLocator("lba:0");
    EXPECT_FALSE(CanLocate(blob, path));
    EXPECT_FALSE(CanLocate(disk, path));
    EXPECT_TRUE(CanLocate(volume, path));

    EXPECT_TRUE(CanLocate(blob, lba));
    EXPECT_TRUE(CanLocate(disk, lba));
    EXPECT_FALSE(CanLocate(volume, lba)); // no block I/O

    EXPECT_FALSE(CanLocate(blob, MakeLocator("mod:0")));
    EXPECT_TRUE(CanLocate(blob, MakeLocator("mod:1")));
    EXPECT_FALSE(CanLocate(disk, MakeLocator("mod:1")));
}

TEST(BootDevice, DeviceIdentity)
{
    BootDevice a, b;
    a.bd_source.bs_type = BlockSource::Type::BiosDisk;
    a.bd_source.bs_drive = 0x80;
    b = a;
    strcpy(b.bd_name, "different");
    EXPECT_TRUE(GetId(a) == GetId(b));
    b.bd_source.bs_drive = 0x81;
    EXPECT_FALSE(GetId(a) == GetId(b));

    BootDevice m;
    m.bd_source.bs_type = BlockSource::Type::MmioWindow;
    m.bd_source.bs_base = 0x80;
    EXPECT_FALSE(GetId(a) == GetId(m));
}

TEST_F(BiosTest, EnumeratesDrives)
{
    b_Bios.AddDisk(0x80, MiB(1));
    b_Bios.AddDisk(0x81, MiB(1));
    b_Bios.AddDisk(0xe0, MiB(1));
    b_Bios.FindDisk(0x81)->d_removable = true;
    b_Bios.FindDisk(0xe0)->d_sector_size = 2048;
    Probe(0xe0);

    DeviceList devices;
    ASSERT_TRUE(Enumerate(b_Context.c_Context, devices).IsSuccess());
    EXPECT_EQ((std::vector<std::string>{ "bios80", "bios81", "biose0" }), GetNames(devices));

    EXPECT_EQ(DeviceKind::HardDisk, devices[0].bd_kind);
    EXPECT_EQ(10, devices[0].bd_priority);
    EXPECT_FALSE(devices[0].bd_removable);
    EXPECT_EQ(MiB(1) / 512, devices[0].bd_source.bs_block_count);
    EXPECT_EQ(ModeBit(FirmwareMode::LegacyBIOS), devices[0].bd_modes);

    EXPECT_EQ(DeviceKind::USB, devices[1].bd_kind);
    EXPECT_EQ(20, devices[1].bd_priority);
    EXPECT_TRUE(devices[1].bd_removable);

    // The boot drive is preferred
    EXPECT_EQ(DeviceKind::CDROM, devices[2].bd_kind);
    EXPECT_EQ(0, devices[2].bd_priority);
    EXPECT_TRUE(devices[2].bd_removable);
    EXPECT_EQ(2048u, devices[2].bd_source.bs_block_size);
}

TEST_F(BiosTest, NoDrivesMeansNoBootableDevice)
{
    Probe(0x80);
    DeviceList devices;
    EXPECT_EQ(ErrorKind::NoBootableDevice, Enumerate(b_Context.c_Context, devices).AsErrorKind());
}

TEST_F(BiosTest, SelectPrefersLowerPriorityAndKeepsOrderOnTies)
{
    b_Bios.AddDisk(0x80, MiB(1));
    b_Bios.AddDisk(0x81, MiB(1));
    b_Bios.AddDisk(0x82, MiB(1));
    b_Bios.FindDisk(0x80)->d_removable = true;
    Probe(0x00);

    DeviceList devices;
    ASSERT_TRUE(Enumerate(b_Context.c_Context, devices).IsSuccess());
    ASSERT_EQ(3u, devices.size());

    const auto lba = MakeLocator("lba:0");
    ExcludeList exclude;
    size_t index = 99;
    ASSERT_TRUE(Select(b_Context.c_Context, devices, FirmwareMode::LegacyBIOS, lba, exclude, index).IsSuccess());
    EXPECT_EQ(1u, index);

    ASSERT_TRUE(exclude.push_back(GetId(devices[1])));
    ASSERT_TRUE(Select(b_Context.c_Context, devices, FirmwareMode::LegacyBIOS, lba, exclude, index).IsSuccess());
    EXPECT_EQ(2u, index);

    ASSERT_TRUE(exclude.push_back(GetId(devices[2])));
    ASSERT_TRUE(Select(b_Context.c_Context, devices, FirmwareMode::LegacyBIOS, lba, exclude, index).IsSuccess());
    EXPECT_EQ(0u, index);

    ASSERT_TRUE(exclude.push_back(GetId(devices[0])));
    EXPECT_EQ(
        ErrorKind::NoBootableDevice,
        Select(b_Context.c_Context, devices, FirmwareMode::LegacyBIOS, lba, exclude, index).AsErrorKind());
}

TEST_F(BiosTest, SelectSkipsDevicesWithoutDataAtTheLocator)
{
    b_Bios.AddDisk(0x80, MiB(1));
    b_Bios.AddDisk(0x81, MiB(2));
    Probe(0x80);

    DeviceList devices;
    ASSERT_TRUE(Enumerate(b_Context.c_Context, devices).IsSuccess());

    ExcludeList exclude;
    size_t index;
    ASSERT_TRUE(Select(b_Context.c_Context, devices, FirmwareMode::LegacyBIOS, MakeLocator("lba:2048"), exclude, index)
                    .IsSuccess());
    EXPECT_STREQ("bios81", devices[index].bd_name);

    EXPECT_EQ(
        ErrorKind::NoBootableDevice,
        Select(b_Context.c_Context, devices, FirmwareMode::UEFI, MakeLocator("lba:0"), exclude, index).AsErrorKind());
    EXPECT_EQ(
        ErrorKind::NoBootableDevice,
        Select(b_Context.c_Context, devices, FirmwareMode::LegacyBIOS, MakeLocator("mod:0"), exclude, index)
            .AsErrorKind());
}

TEST_F(BiosTest, StreamReadsUnalignedRanges)
{
    b_Bios.AddDisk(0x80, MiB(1));
    auto& data = b_Bios.FindDisk(0x80)->d_data;
    FillPattern(data);
    Probe(0x80);

    DeviceList devices;
    ASSERT_TRUE(Enumerate(b_Context.c_Context, devices).IsSuccess());

    Stream stream(b_Context.c_Context);
    ASSERT_TRUE(stream.Open(devices[0], MakeLocator("lba:1")).IsSuccess());
    EXPECT_EQ(MiB(1) - 512, stream.GetSize());
    addr_t address;
    EXPECT_FALSE(stream.GetDirectAddress(address));

    std::vector<uint8_t> buffer(1000);
    ASSERT_TRUE(stream.Read(100, buffer.data(), buffer.size()).IsSuccess());
    EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), data.begin() + 512 + 100));

    // Spans several bounce buffer loads
    buffer.resize(KiB(100) + 17);
    ASSERT_TRUE(stream.Read(511, buffer.data(), buffer.size()).IsSuccess());
    EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), data.begin() + 512 + 511));
    EXPECT_GT(b_Bios.GetReadCalls(), 4u);

    EXPECT_EQ(ErrorKind::DeviceReadFailed, stream.Read(stream.GetSize() - 10, buffer.data(), 11).AsErrorKind());
    EXPECT_TRUE(stream.Read(stream.GetSize() - 10, buffer.data(), 10).IsSuccess());
}

TEST_F(BiosTest, StreamHonoursLength)
{
    b_Bios.AddDisk(0x80, MiB(1));
    Probe(0x80);

    DeviceList devices;
    ASSERT_TRUE(Enumerate(b_Context.c_Context, devices).IsSuccess());

    Stream stream(b_Context.c_Context);
    ASSERT_TRUE(stream.Open(devices[0], MakeLocator("lba:2+1000")).IsSuccess());
    EXPECT_EQ(1000u, stream.GetSize());
    EXPECT_EQ(ErrorKind::DeviceReadFailed, stream.Open(devices[0], MakeLocator("lba:2048")).AsErrorKind());
}

TEST_F(BiosTest, StreamReportsReadErrors)
{
    b_Bios.AddDisk(0x80, MiB(1));
    Probe(0x80);

    DeviceList devices;
    ASSERT_TRUE(Enumerate(b_Context.c_Context, devices).IsSuccess());
    b_Bios.FindDisk(0x80)->d_fail_reads = true;

    Stream stream(b_Context.c_Context);
    ASSERT_TRUE(stream.Open(devices[0], MakeLocator("lba:0")).IsSuccess());
    uint8_t buffer[16];
    EXPECT_EQ(ErrorKind::DeviceReadFailed, stream.Read(0, buffer, sizeof(buffer)).AsErrorKind());
}

TEST_F(UefiTest, EnumeratesHandles)
{
    auto& hdd = u_Uefi.AddDisk(512, 2048);
    u_Uefi.AddDisk(512, 1024, true);
    u_Uefi.AddDisk(2048, 100, true);
    auto& bare_partition = u_Uefi.AddDisk(512, 100);
    bare_partition.d_media.LogicalPartition = 1;
    auto& esp = u_Uefi.AddDisk(512, 100);
    esp.d_media.LogicalPartition = 1;
    u_Uefi.AddFile(esp, "\\EFI\\kernel.img", { 1, 2, 3 });
    auto& empty = u_Uefi.AddDisk(512, 100, true);
    empty.d_media.MediaPresent = 0;
    u_Uefi.AddVolume();
    u_Uefi.AddNetwork();
    u_Uefi.SetBootDisk(esp);
    Probe();

    DeviceList devices;
    ASSERT_TRUE(Enumerate(u_Context.c_Context, devices).IsSuccess());
    EXPECT_EQ((std::vector<std::string>{ "blk0", "blk1", "blk2", "blk4", "fs1", "net0" }), GetNames(devices));

    auto d = FindDevice(devices, "blk0");
    EXPECT_EQ(DeviceKind::HardDisk, d->bd_kind);
    EXPECT_EQ(10, d->bd_priority);
    EXPECT_EQ(fake::Uefi::GetHandle(hdd), d->bd_source.bs_handle);
    EXPECT_EQ(2048u, d->bd_source.bs_block_count);
    EXPECT_EQ(nullptr, d->bd_source.bs_file_system);

    d = FindDevice(devices, "blk1");
    EXPECT_EQ(DeviceKind::USB, d->bd_kind);
    EXPECT_TRUE(d->bd_removable);

    d = FindDevice(devices, "blk2");
    EXPECT_EQ(DeviceKind::CDROM, d->bd_kind);
    EXPECT_EQ(30, d->bd_priority);

    d = FindDevice(devices, "blk4");
    EXPECT_EQ(0, d->bd_priority);
    EXPECT_NE(nullptr, d->bd_source.bs_file_system);

    d = FindDevice(devices, "fs1");
    EXPECT_EQ(nullptr, d->bd_source.bs_block_io);
    EXPECT_NE(nullptr, d->bd_source.bs_file_system);

    d = FindDevice(devices, "net0");
    EXPECT_EQ(DeviceKind::Network, d->bd_kind);
    EXPECT_FALSE(d->bd_bootable);
}

TEST_F(UefiTest, SelectsByPath)
{
    const auto kernel = fake::MakePayload(5000);
    u_Uefi.AddDisk(512, 2048);
    auto& usb = u_Uefi.AddDisk(512, 1024, true);
    u_Uefi.AddFile(usb, "\\EFI\\kernel.img", kernel);
    auto& volume = u_Uefi.AddVolume();
    u_Uefi.AddFile(volume, "\\EFI\\kernel.img", kernel);
    auto& other = u_Uefi.AddVolume();
    u_Uefi.AddFile(other, "\\EFI\\other.img", kernel);
    Probe();

    DeviceList devices;
    ASSERT_TRUE(Enumerate(u_Context.c_Context, devices).IsSuccess());

    ExcludeList exclude;
    size_t index;
    const auto path = MakeLocator("\\EFI\\kernel.img");
    ASSERT_TRUE(Select(u_Context.c_Context, devices, FirmwareMode::UEFI, path, exclude, index).IsSuccess());
    EXPECT_EQ(fake::Uefi::GetHandle(volume), devices[index].bd_source.bs_handle);

    ASSERT_TRUE(exclude.push_back(GetId(devices[index])));
    ASSERT_TRUE(Select(u_Context.c_Context, devices, FirmwareMode::UEFI, path, exclude, index).IsSuccess());
    EXPECT_EQ(fake::Uefi::GetHandle(usb), devices[index].bd_source.bs_handle);
    EXPECT_EQ(0, u_Uefi.GetOpenFiles());
}

TEST_F(UefiTest, StreamReadsFilesInChunks)
{
    const auto kernel = fake::MakePayload(KiB(20) + 3);
    auto& volume = u_Uefi.AddVolume();
    u_Uefi.AddFile(volume, "\\EFI\\kernel.img", kernel);
    u_Uefi.SetMaxReadChunk(1000);
    Probe();

    DeviceList devices;
    ASSERT_TRUE(Enumerate(u_Context.c_Context, devices).IsSuccess());
    {
        Stream stream(u_Context.c_Context);
        // Forward slashes are accepted as well
        ASSERT_TRUE(stream.Open(devices[0], MakeLocator("/EFI/kernel.img")).IsSuccess());
        EXPECT_EQ(kernel.size(), stream.GetSize());

        std::vector<uint8_t> buffer(kernel.size() - 100);
        ASSERT_TRUE(stream.Read(100, buffer.data(), buffer.size()).IsSuccess());
        EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), kernel.begin() + 100));
        EXPECT_EQ(ErrorKind::DeviceReadFailed, stream.Read(101, buffer.data(), buffer.size()).AsErrorKind());

        EXPECT_EQ(ErrorKind::DeviceReadFailed, stream.Open(devices[0], MakeLocator("\\EFI\\missing")).AsErrorKind());
        ASSERT_TRUE(stream.Open(devices[0], MakeLocator("\\EFI\\kernel.img")).IsSuccess());
        volume.d_fail_reads = true;
        EXPECT_EQ(ErrorKind::DeviceReadFailed, stream.Read(0, buffer.data(), 16).AsErrorKind());
    }
    EXPECT_EQ(0, u_Uefi.GetOpenFiles());
}

TEST_F(UefiTest, StreamReadsBlocks)
{
    auto& disk = u_Uefi.AddDisk(4096, 256);
    FillPattern(disk.d_data);
    Probe();

    DeviceList devices;
    ASSERT_TRUE(Enumerate(u_Context.c_Context, devices).IsSuccess());

    Stream stream(u_Context.c_Context);
    ASSERT_TRUE(stream.Open(devices[0], MakeLocator("lba:3")).IsSuccess());
    EXPECT_EQ(MiB(1) - 3 * 512, stream.GetSize());

    std::vector<uint8_t> buffer(10000);
    ASSERT_TRUE(stream.Read(1000, buffer.data(), buffer.size()).IsSuccess());
    EXPECT_TRUE(std::equal(buffer.begin(), buffer.end(), disk.d_data.begin() + 3 * 512 + 1000));

    ASSERT_TRUE(stream.Read(0, buffer.data(), 100).IsSuccess());
    EXPECT_TRUE(std::equal(buffer.begin(), buffer.begin() + 100, disk.d_data.begin() + 3 * 512));
}

TEST(BootDevice, MultibootModulesAreDevices)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    auto modules = machine.AddMemory(0x200000, 0x100000);
    fake::MultibootInfo mb;
    mb.AddModule(0x200000, 0x280000, "kernel.img");
    mb.AddModule(0x280000, 0x280000, "empty");
    mb.AddModule(0x280000, 0x2c0000, "initrd");
    mb.AddMemory(0, 0x9fc00, 1);
    machine.Write(InfoAddress, mb.Build());
    for (size_t n = 0; n < 0x100000; n++)
        modules[n] = static_cast<uint8_t>(n * 3);

    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(
                    fake::MultibootInfo::MakeEntryState(InfoAddress), machine.GetPhysicalMemory(), ctx.c_Platform)
                    .IsSuccess());

    DeviceList devices;
    ASSERT_TRUE(Enumerate(ctx.c_Context, devices).IsSuccess());
    EXPECT_EQ((std::vector<std::string>{ "mod0", "mod2" }), GetNames(devices));
    EXPECT_EQ(DeviceKind::Firmware, devices[1].bd_kind);
    EXPECT_EQ(0, devices[1].bd_priority);
    EXPECT_EQ(2u, devices[1].bd_source.bs_module);
    EXPECT_EQ(0x40000u, devices[1].bd_source.bs_length);

    ExcludeList exclude;
    size_t index;
    ASSERT_TRUE(Select(ctx.c_Context, devices, FirmwareMode::DirectLongMode, MakeLocator("mod:2"), exclude, index)
                    .IsSuccess());
    EXPECT_EQ(1u, index);
    EXPECT_EQ(
        ErrorKind::NoBootableDevice,
        Select(ctx.c_Context, devices, FirmwareMode::DirectLongMode, MakeLocator("mod:1"), exclude, index)
            .AsErrorKind());

    Stream stream(ctx.c_Context);
    ASSERT_TRUE(stream.Open(devices[1], MakeLocator("mod:2")).IsSuccess());
    EXPECT_EQ(0x40000u, stream.GetSize());
    addr_t address;
    ASSERT_TRUE(stream.GetDirectAddress(address));
    EXPECT_EQ(0x280000u, address);
    uint8_t buffer[5];
    ASSERT_TRUE(stream.Read(7, buffer, sizeof(buffer)).IsSuccess());
    EXPECT_EQ(0, memcmp(buffer, modules + 0x80000 + 7, sizeof(buffer)));
}

TEST(BootDevice, DeviceTreeSocNodesAreDevices)
{
    fake::FdtBuilder fdt;
    fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
    fdt.BeginNode("soc").Cells("#address-cells", { 1 }).Cells("#size-cells", { 1 });
    fdt.BeginNode("mmc@fe300000").Strings("compatible", { "brcm,bcm2835-sdhci" }).Cells("reg", { 0xfe300000, 0x10000 });
    fdt.EndNode();
    fdt.BeginNode("emmc2@fe340000").Strings("compatible", { "brcm,bcm2711-emmc2" }).String("status", "okay");
    fdt.Cells("reg", { 0xfe340000, 0x10000 }).EndNode();
    fdt.BeginNode("spi@fe204000").Strings("compatible", { "jedec,spi-nor" }).String("status", "disabled");
    fdt.Cells("reg", { 0xfe204000, 0x1000 }).EndNode();
    fdt.BeginNode("serial@fe201000").Strings("compatible", { "arm,pl011", "arm,primecell" });
    fdt.Cells("reg", { 0xfe201000, 0x200 }).EndNode();
    fdt.BeginNode("mshc@fe320000").Strings("compatible", { "rockchip,dw-mshc" }).String("status", "ok").EndNode();
    fdt.EndNode();

    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    machine.Write(DtbAddress, fdt.Build());
    auto window = machine.AddMemory(0xfe340000, 0x10000, 0x5a);

    fake::Context ctx(machine);
    ASSERT_TRUE(
        platform::Probe(fake::FdtBuilder::MakeEntryState(DtbAddress), machine.GetPhysicalMemory(), ctx.c_Platform)
            .IsSuccess());

    DeviceList devices;
    ASSERT_TRUE(Enumerate(ctx.c_Context, devices).IsSuccess());
    // The disabled node, the UART and the node without 'reg' are left out
    EXPECT_EQ((std::vector<std::string>{ "mmc@fe300000", "emmc2@fe340000" }), GetNames(devices));
    EXPECT_EQ(DeviceKind::SDCard, devices[0].bd_kind);
    EXPECT_TRUE(devices[0].bd_removable);
    EXPECT_EQ(DeviceKind::eMMC, devices[1].bd_kind);
    EXPECT_EQ(BlockSource::Type::MmioWindow, devices[1].bd_source.bs_type);
    EXPECT_EQ(0xfe340000u, devices[1].bd_source.bs_base);
    EXPECT_EQ(0x10000u, devices[1].bd_source.bs_length);

    ExcludeList exclude;
    size_t index;
    ASSERT_TRUE(Select(ctx.c_Context, devices, FirmwareMode::DeviceTree, MakeLocator("lba:1"), exclude, index)
                    .IsSuccess());
    EXPECT_EQ(1u, index);

    Stream stream(ctx.c_Context);
    ASSERT_TRUE(stream.Open(devices[index], MakeLocator("lba:1")).IsSuccess());
    window[512] = 0xa5;
    uint8_t buffer[2];
    ASSERT_TRUE(stream.Read(0, buffer, sizeof(buffer)).IsSuccess());
    EXPECT_EQ(0xa5, buffer[0]);
    EXPECT_EQ(0x5a, buffer[1]);
}
