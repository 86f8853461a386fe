/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include "loader/platform.h"
#include "loader/physmem.h"
#include "loader/scratch.h"
#include "loader/lib.h"
#include "loader/fake-bios.h"
#include "loader/fake-fdt.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"
#include "loader/fake-uefi.h"

namespace
{
    constexpr addr_t InfoAddress = 0x9000;
    constexpr addr_t DtbAddress = 0x40000000;

    std::vector<uint8_t> MakeMinimalDtb()
    {
        fake::FdtBuilder fdt;
        fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
        return fdt.Build();
    }
} // unnamed namespace

TEST(Platform, DetectsUefi)
{
    fake::Machine machine;
    fake::Uefi uefi;
    PlatformDescriptor pd;
    ASSERT_TRUE(platform::Probe(uefi.MakeEntryState(), machine.GetPhysicalMemory(), pd).IsSuccess());
    EXPECT_EQ(Architecture::X86_64, pd.pd_arch);
    EXPECT_EQ(FirmwareMode::UEFI, pd.pd_mode);
    EXPECT_EQ(64u, pd.pd_pointer_width);
    EXPECT_EQ(Endianness::Little, pd.pd_endian);
    EXPECT_EQ(uefi.GetSystemTable(), pd.pd_efi_system_table);
    EXPECT_EQ(uefi.GetImageHandle(), pd.pd_efi_image);
}

TEST(Platform, UefiOnArmKeepsTheDeviceTree)
{
    fake::Machine machine;
    fake::Uefi uefi;
    auto entry = uefi.MakeEntryState(ENTRY_MACHINE_AARCH64);
    entry.es_dtb = DtbAddress;
    PlatformDescriptor pd;
    ASSERT_TRUE(platform::Probe(entry, machine.GetPhysicalMemory(), pd).IsSuccess());
    EXPECT_EQ(Architecture::ARM64, pd.pd_arch);
    EXPECT_EQ(FirmwareMode::UEFI, pd.pd_mode);
    EXPECT_EQ(DtbAddress, pd.pd_dtb);
}

TEST(Platform, UefiWithoutBootServicesIsIgnored)
{
    fake::Machine machine;
    fake::Uefi uefi;
    uefi.GetSystemTable()->BootServices = nullptr;
    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware,
              platform::Probe(uefi.MakeEntryState(), machine.GetPhysicalMemory(), pd).AsErrorKind());
}

TEST(Platform, UefiWinsOverMultiboot)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddMemory(0, 0x9fc00, 1);
    machine.Write(InfoAddress, mb.Build());

    fake::Uefi uefi;
    auto entry = uefi.MakeEntryState();
    entry.es_multiboot_magic = MULTIBOOT2_BOOTLOADER_MAGIC;
    entry.es_multiboot_info = InfoAddress;
    PlatformDescriptor pd;
    ASSERT_TRUE(platform::Probe(entry, machine.GetPhysicalMemory(), pd).IsSuccess());
    EXPECT_EQ(FirmwareMode::UEFI, pd.pd_mode);
}

TEST(Platform, DetectsMultiboot)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddCommandLine("quiet");
    machine.Write(InfoAddress, mb.Build());

    PlatformDescriptor pd;
    ASSERT_TRUE(platform::Probe(
                    fake::MultibootInfo::MakeEntryState(InfoAddress), machine.GetPhysicalMemory(), pd)
                    .IsSuccess());
    EXPECT_EQ(FirmwareMode::DirectLongMode, pd.pd_mode);
    EXPECT_EQ(InfoAddress, pd.pd_multiboot_info);
    EXPECT_EQ(0x10000u, pd.pd_loader_base);
    EXPECT_EQ(0x10000u, pd.pd_loader_size);
}

TEST(Platform, MultibootNeedsTheMagic)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    machine.Write(InfoAddress, mb.Build());

    auto entry = fake::MultibootInfo::MakeEntryState(InfoAddress);
    entry.es_multiboot_magic = 0x2badb002;
    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware, platform::Probe(entry, machine.GetPhysicalMemory(), pd).AsErrorKind());
}

TEST(Platform, MultibootNeedsAReadableInformationBlock)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware,
              platform::Probe(fake::MultibootInfo::MakeEntryState(0x80000), machine.GetPhysicalMemory(), pd)
                  .AsErrorKind());
}

TEST(Platform, MultibootIsNotAcceptedOnArm)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    machine.Write(InfoAddress, mb.Build());

    auto entry = fake::MultibootInfo::MakeEntryState(InfoAddress);
    entry.es_machine = ENTRY_MACHINE_AARCH64;
    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware, platform::Probe(entry, machine.GetPhysicalMemory(), pd).AsErrorKind());
}

TEST(Platform, DetectsDeviceTree)
{
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    machine.Write(DtbAddress, MakeMinimalDtb());

    PlatformDescriptor pd;
    ASSERT_TRUE(
        platform::Probe(fake::FdtBuilder::MakeEntryState(DtbAddress), machine.GetPhysicalMemory(), pd).IsSuccess());
    EXPECT_EQ(Architecture::ARM64, pd.pd_arch);
    EXPECT_EQ(FirmwareMode::DeviceTree, pd.pd_mode);
    EXPECT_EQ(DtbAddress, pd.pd_dtb);
}

TEST(Platform, DetectsDeviceTreeOnRiscV)
{
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    machine.Write(DtbAddress, MakeMinimalDtb());

    PlatformDescriptor pd;
    ASSERT_TRUE(platform::Probe(
                    fake::FdtBuilder::MakeEntryState(DtbAddress, ENTRY_MACHINE_RISCV), machine.GetPhysicalMemory(),
                    pd)
                    .IsSuccess());
    EXPECT_EQ(Architecture::RISCV64, pd.pd_arch);
    EXPECT_EQ(FirmwareMode::DeviceTree, pd.pd_mode);
}

TEST(Platform, DeviceTreeIsNotAcceptedOnX86)
{
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    machine.Write(DtbAddress, MakeMinimalDtb());

    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware,
              platform::Probe(
                  fake::FdtBuilder::MakeEntryState(DtbAddress, ENTRY_MACHINE_X86_64), machine.GetPhysicalMemory(), pd)
                  .AsErrorKind());
}

TEST(Platform, CorruptDeviceTreeIsRejected)
{
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    auto dtb = MakeMinimalDtb();
    dtb[0] ^= 0xff;
    machine.Write(DtbAddress, dtb);

    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware,
              platform::Probe(fake::FdtBuilder::MakeEntryState(DtbAddress), machine.GetPhysicalMemory(), pd)
                  .AsErrorKind());
}

TEST(Platform, DetectsLegacyBios)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::Bios bios(machine.GetPhysicalMemory());
    bios.WriteStage1(0x81, "debug");

    PlatformDescriptor pd;
    ASSERT_TRUE(platform::Probe(bios.MakeEntryState(), machine.GetPhysicalMemory(), pd).IsSuccess());
    EXPECT_EQ(FirmwareMode::LegacyBIOS, pd.pd_mode);
    EXPECT_EQ(0x81, pd.pd_boot_drive);
    EXPECT_EQ(fake::Bios::CommandLine, pd.pd_stage1_cmdline);
    EXPECT_EQ(fake::Bios::BounceBuffer, pd.pd_bounce_buffer);
    EXPECT_EQ(fake::Bios::BounceSize, pd.pd_bounce_size);
    EXPECT_NE(nullptr, pd.pd_realmode_call);
}

TEST(Platform, LegacyBiosNeedsTheStage1Signature)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::Bios bios(machine.GetPhysicalMemory());

    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware,
              platform::Probe(bios.MakeEntryState(), machine.GetPhysicalMemory(), pd).AsErrorKind());
}

TEST(Platform, NothingIsUnknownFirmware)
{
    fake::Machine machine;
    EntryState entry;
    entry.es_machine = ENTRY_MACHINE_X86_64;
    entry.es_xlen = 64;
    PlatformDescriptor pd;
    EXPECT_EQ(ErrorKind::UnknownFirmware, platform::Probe(entry, machine.GetPhysicalMemory(), pd).AsErrorKind());
}

TEST(Platform, RejectsUnsupportedArchitectures)
{
    fake::Machine machine;
    fake::Uefi uefi;
    PlatformDescriptor pd;

    auto entry = uefi.MakeEntryState();
    entry.es_xlen = 32;
    EXPECT_EQ(ErrorKind::UnsupportedArchitecture,
              platform::Probe(entry, machine.GetPhysicalMemory(), pd).AsErrorKind());

    entry = uefi.MakeEntryState(ENTRY_MACHINE_AARCH64);
    entry.es_big_endian = true;
    EXPECT_EQ(ErrorKind::UnsupportedArchitecture,
              platform::Probe(entry, machine.GetPhysicalMemory(), pd).AsErrorKind());

    entry = uefi.MakeEntryState(8 /* MIPS */);
    EXPECT_EQ(ErrorKind::UnsupportedArchitecture,
              platform::Probe(entry, machine.GetPhysicalMemory(), pd).AsErrorKind());
}

TEST(Platform, ProbeResetsTheDescriptor)
{
    fake::Machine machine;
    PlatformDescriptor pd;
    pd.pd_mode = FirmwareMode::DeviceTree;
    pd.pd_dtb = DtbAddress;

    fake::Uefi uefi;
    ASSERT_TRUE(platform::Probe(uefi.MakeEntryState(), machine.GetPhysicalMemory(), pd).IsSuccess());
    EXPECT_EQ(0u, pd.pd_dtb);
}

TEST(Platform, ModeSupportMatrix)
{
    EXPECT_TRUE(platform::SupportsMode(Architecture::X86_64, FirmwareMode::LegacyBIOS));
    EXPECT_TRUE(platform::SupportsMode(Architecture::X86_64, FirmwareMode::UEFI));
    EXPECT_TRUE(platform::SupportsMode(Architecture::X86_64, FirmwareMode::DirectLongMode));
    EXPECT_FALSE(platform::SupportsMode(Architecture::X86_64, FirmwareMode::DeviceTree));
    for (auto arch : { Architecture::ARM64, Architecture::RISCV64 }) {
        EXPECT_FALSE(platform::SupportsMode(arch, FirmwareMode::LegacyBIOS));
        EXPECT_TRUE(platform::SupportsMode(arch, FirmwareMode::UEFI));
        EXPECT_FALSE(platform::SupportsMode(arch, FirmwareMode::DirectLongMode));
        EXPECT_TRUE(platform::SupportsMode(arch, FirmwareMode::DeviceTree));
        EXPECT_TRUE(platform::RequiresDeviceTree(arch));
    }
    EXPECT_FALSE(platform::RequiresDeviceTree(Architecture::X86_64));
}

TEST(Platform, PlacementMinimums)
{
    PlatformDescriptor pd;
    pd.pd_arch = Architecture::X86_64;
    EXPECT_EQ(MiB(16), platform::GetStagingMinimum(pd, 0));
    EXPECT_EQ(MiB(1), platform::GetAllocationMinimum(pd));

    pd.pd_arch = Architecture::ARM64;
    EXPECT_EQ(0x40000000u, platform::GetStagingMinimum(pd, 0x40000000));
    EXPECT_EQ(0u, platform::GetAllocationMinimum(pd));
}

TEST(Platform, Names)
{
    EXPECT_STREQ("x86_64", platform::ArchitectureName(Architecture::X86_64));
    EXPECT_STREQ("arm64", platform::ArchitectureName(Architecture::ARM64));
    EXPECT_STREQ("riscv64", platform::ArchitectureName(Architecture::RISCV64));
    EXPECT_STREQ("bios", platform::FirmwareModeName(FirmwareMode::LegacyBIOS));
    EXPECT_STREQ("uefi", platform::FirmwareModeName(FirmwareMode::UEFI));
    EXPECT_STREQ("multiboot2", platform::FirmwareModeName(FirmwareMode::DirectLongMode));
    EXPECT_STREQ("device-tree", platform::FirmwareModeName(FirmwareMode::DeviceTree));
}

TEST(PhysicalMemory, WithoutAperturesAddressesAreIdentityMapped)
{
    PhysicalMemory physmem;
    uint32_t value = 0x12345678;
    const auto phys = static_cast<addr_t>(reinterpret_cast<uintptr_t>(&value));
    EXPECT_EQ(&value, physmem.MapAs<uint32_t>(phys));
}

TEST(PhysicalMemory, OnlyRangesWithinOneApertureAreReachable)
{
    uint8_t low[0x100]{}, high[0x100]{};
    PhysicalMemory physmem;
    ASSERT_TRUE(physmem.AddAperture(0x1000, sizeof(low), low));
    ASSERT_TRUE(physmem.AddAperture(0x1100, sizeof(high), high));

    EXPECT_EQ(&low[0x10], physmem.Map(0x1010, 0x10));
    EXPECT_EQ(&high[0], physmem.Map(0x1100, 0x100));
    EXPECT_EQ(nullptr, physmem.Map(0x10f8, 0x10)); // straddles both
    EXPECT_EQ(nullptr, physmem.Map(0x2000, 1));
    EXPECT_EQ(nullptr, physmem.Map(~static_cast<addr_t>(0), 2));

    const uint32_t value = 0xdeadbeef;
    ASSERT_TRUE(physmem.Write(0x1104, &value, sizeof(value)));
    uint32_t read = 0;
    ASSERT_TRUE(physmem.Read(0x1104, &read, sizeof(read)));
    EXPECT_EQ(value, read);
    EXPECT_FALSE(physmem.Read(0x11fe, &read, sizeof(read)));

    ASSERT_TRUE(physmem.Fill(0x1000, 0xaa, 4));
    EXPECT_EQ(0xaa, low[3]);
    EXPECT_EQ(0, low[4]);
}

TEST(PhysicalMemory, RejectsBadApertures)
{
    uint8_t buffer[16];
    PhysicalMemory physmem;
    EXPECT_FALSE(physmem.AddAperture(0x1000, 0, buffer));
    EXPECT_FALSE(physmem.AddAperture(0x1000, sizeof(buffer), nullptr));
    EXPECT_FALSE(physmem.AddAperture(~static_cast<addr_t>(0), sizeof(buffer), buffer));
    for (size_t n = 0; n < PhysicalMemory::MaxApertures; n++)
        EXPECT_TRUE(physmem.AddAperture(n * 0x1000, sizeof(buffer), buffer));
    EXPECT_FALSE(physmem.AddAperture(0x100000, sizeof(buffer), buffer));
}

TEST(ScratchArena, AllocatesAlignedUntilExhausted)
{
    alignas(16) uint8_t buffer[64];
    ScratchArena arena(buffer, sizeof(buffer));
    auto a = arena.Allocate(1);
    auto b = arena.Allocate(17);
    EXPECT_EQ(&buffer[0], a);
    EXPECT_EQ(&buffer[16], b);
    EXPECT_EQ(48u, arena.GetUsed());
    EXPECT_EQ(nullptr, arena.Allocate(17));
    EXPECT_EQ(&buffer[48], arena.Allocate(16));

    arena.Reset();
    EXPECT_EQ(0u, arena.GetUsed());
    EXPECT_EQ(&buffer[0], arena.Allocate(64));
}
