/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>
#include "loader/pipeline.h"
#include "loader/console.h"
#include "loader/lib.h"
#include "loader/trace.h"
#include "loader/fake-bios.h"
#include "loader/fake-fdt.h"
#include "loader/fake-kernel.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"
#include "loader/fake-uefi.h"

using memmap::MemoryRegion;
using memmap::RegionType;
using pipeline::Pipeline;
using pipeline::State;

namespace
{
    constexpr addr_t InfoAddress = 0x9000;
    constexpr uint64_t ArenaSize = HandoffArena::StackSize + HandoffArena::TablePoolSize;
    constexpr uint64_t KernelLba = 2048;

    struct PipelineTest : ::testing::Test {
        void SetUp() override { console::ClearBacklog(); }

        void TearDown() override
        {
            trace::SetAll(trace::level::ERROR | trace::level::WARN);
            console::ClearBacklog();
        }

        Pipeline& MakePipeline()
        {
            p_Pipeline = std::make_unique<Pipeline>(p_Machine.GetPhysicalMemory(), p_Machine.GetScratch());
            return *p_Pipeline;
        }

        bool ParseBootInfo(bootinfo::BootInfoView& view)
        {
            const auto& bi = p_Pipeline->GetBootInfo();
            auto data = p_Machine.At(bi.bi_base, bi.bi_length);
            return data != nullptr && bootinfo::Parse(data, bi.bi_length, view);
        }

        bool IsClaimed(addr_t base, uint64_t length) const
        {
            return memmap::IsWithinRegionOfType(p_Pipeline->GetMemoryMap(), base, length, RegionType::Bootloader);
        }

        std::string GetBacklog() const { return console::GetBacklog(); }

        // Real-mode area, the first 16MB of extended memory and the top of RAM
        void AddBiosMemory(fake::Bios& bios)
        {
            p_Machine.AddMemory(0, 0x10000);
            p_Machine.AddMemory(MiB(1), MiB(16));
            p_Machine.AddMemory(0x7ee00000 - MiB(1), MiB(1));
            bios.AddE820(0, 0x9fc00, 1);
            bios.AddE820(MiB(1), 0x7ee00000 - MiB(1), 1);
        }

        static void PutKernel(fake::BiosDisk& disk, const std::vector<uint8_t>& kernel)
        {
            std::copy(kernel.begin(), kernel.end(), disk.d_data.begin() + KernelLba * 512);
        }

        fake::Machine p_Machine;
        std::unique_ptr<Pipeline> p_Pipeline;
    };
} // unnamed namespace

TEST(Pipeline, StateNames)
{
    EXPECT_STREQ("Uninitialized", pipeline::StateName(State::Uninitialized));
    EXPECT_STREQ("MapAcquired", pipeline::StateName(State::MapAcquired));
    EXPECT_STREQ("Prepared", pipeline::StateName(State::Prepared));
    EXPECT_STREQ("Halted", pipeline::StateName(State::Halted));
}

TEST_F(PipelineTest, StartsUninitialized)
{
    auto& p = MakePipeline();
    EXPECT_EQ(State::Uninitialized, p.GetState());
    EXPECT_EQ(ErrorKind::None, p.GetError());
    EXPECT_EQ(0u, p.GetEnumerationCount());
}

TEST_F(PipelineTest, HaltsWithoutFirmware)
{
    EntryState entry;
    entry.es_machine = ENTRY_MACHINE_X86_64;
    entry.es_xlen = 64;

    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::UnknownFirmware, p.Run(entry).AsErrorKind());
    EXPECT_EQ(State::Halted, p.GetState());
    EXPECT_EQ(ErrorKind::UnknownFirmware, p.GetError());
    EXPECT_NE(std::string::npos, GetBacklog().find("BOOT_HALT: UnknownFirmware\n"));
}

TEST_F(PipelineTest, HaltsOnForeignMachines)
{
    EntryState entry;
    entry.es_machine = ENTRY_MACHINE_X86_64;
    entry.es_xlen = 32;

    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::UnsupportedArchitecture, p.Run(entry).AsErrorKind());
    EXPECT_EQ(State::Halted, p.GetState());
    EXPECT_NE(std::string::npos, GetBacklog().find("BOOT_HALT: UnsupportedArchitecture\n"));
}

TEST_F(PipelineTest, BootsARawKernelFromBiosDisk)
{
    fake::Bios bios(p_Machine.GetPhysicalMemory());
    AddBiosMemory(bios);
    const auto payload = fake::MakePayload(MiB(1));
    PutKernel(bios.AddDisk(0x80, MiB(3)), fake::MakeKernel(payload));
    bios.WriteStage1(0x80, "root=/dev/sda1 console=ttyS0");

    auto& p = MakePipeline();
    ASSERT_TRUE(p.Run(bios.MakeEntryState()).IsSuccess());
    EXPECT_EQ(State::Prepared, p.GetState());
    EXPECT_EQ(ErrorKind::None, p.GetError());
    EXPECT_EQ(FirmwareMode::LegacyBIOS, p.GetPlatform().pd_mode);
    EXPECT_EQ(1u, p.GetEnumerationCount());
    EXPECT_STREQ("bios80", p.GetSelectedDevice().bd_name);
    EXPECT_STREQ("root=/dev/sda1 console=ttyS0", p.GetOptions().o_command_line);

    // The payload went straight to where it runs
    const auto& image = p.GetKernelImage();
    EXPECT_EQ(MiB(16), image.ki_base);
    EXPECT_EQ(payload.size(), image.ki_length);
    EXPECT_EQ(Compression::None, image.ki_compression);
    EXPECT_EQ(MiB(16), p.GetStaging().sr_base);
    EXPECT_EQ(payload, std::vector<uint8_t>(p_Machine.At(MiB(16)), p_Machine.At(MiB(16)) + payload.size()));

    const auto& hc = p.GetHandoffContext();
    EXPECT_EQ(Architecture::X86_64, hc.hc_arch);
    EXPECT_EQ(MiB(16) + 0x1000, hc.hc_entry);
    EXPECT_EQ(MiB(1), hc.hc_argument);
    EXPECT_EQ(0x7ee00000u, hc.hc_stack_top);
    EXPECT_EQ(0x7ee00000u - ArenaSize, hc.hc_tables.t_root);

    // The real-mode area and the loader itself are not for the kernel
    const auto& map = p.GetMemoryMap();
    ASSERT_FALSE(map.empty());
    EXPECT_EQ((MemoryRegion{ 0, 0x9fc00, RegionType::Reserved, 0 }), map[0]);
    EXPECT_TRUE(IsClaimed(MiB(16), payload.size()));
    EXPECT_TRUE(IsClaimed(MiB(1), p.GetBootInfo().bi_region_size));
    EXPECT_TRUE(IsClaimed(0x7ee00000 - ArenaSize, ArenaSize));

    bootinfo::BootInfoView view;
    ASSERT_TRUE(ParseBootInfo(view));
    EXPECT_STREQ("root=/dev/sda1 console=ttyS0", view.bv_command_line);
    EXPECT_TRUE(view.bv_modules.empty());
    EXPECT_FALSE(view.bv_has_framebuffer);
    EXPECT_FALSE(view.bv_has_firmware);
    // The kernel gets the final map, byte for byte
    ASSERT_EQ(map.size(), view.bv_memory_map.size());
    for (size_t n = 0; n < map.size(); n++)
        EXPECT_EQ(map[n], view.bv_memory_map[n]) << "entry " << n;
    const auto& bi = p.GetBootInfo();
    const auto built = p_Machine.At(bi.bi_base, bi.bi_length);
    std::vector<uint8_t> serialized(bootinfo::GetSerializedSize(view));
    size_t length = 0;
    ASSERT_TRUE(bootinfo::Serialize(view, serialized.data(), serialized.size(), length).IsSuccess());
    EXPECT_EQ(std::vector<uint8_t>(built, built + bi.bi_length), serialized);
}

TEST_F(PipelineTest, TriesTheNextDeviceOnReadErrors)
{
    fake::Bios bios(p_Machine.GetPhysicalMemory());
    AddBiosMemory(bios);
    const auto kernel = fake::MakeKernel(fake::MakePayload(0x10000));
    fake::KernelSpec corrupt;
    corrupt.ks_corrupt_crc = true;

    auto& broken = bios.AddDisk(0x80, MiB(2));
    PutKernel(broken, kernel);
    broken.d_fail_reads = true;
    PutKernel(bios.AddDisk(0x81, MiB(2)), fake::MakeKernel(fake::MakePayload(0x10000), corrupt));
    PutKernel(bios.AddDisk(0x82, MiB(2)), kernel);
    bios.WriteStage1(0x80);

    auto& p = MakePipeline();
    ASSERT_TRUE(p.Run(bios.MakeEntryState()).IsSuccess());
    EXPECT_EQ(State::Prepared, p.GetState());
    EXPECT_EQ(3u, p.GetEnumerationCount());
    EXPECT_STREQ("bios82", p.GetSelectedDevice().bd_name);
    EXPECT_EQ(MiB(16), p.GetKernelImage().ki_base);

    // Boot information, kernel and arena; failed attempts left nothing behind
    const auto& map = p.GetMemoryMap();
    EXPECT_EQ(3, std::count_if(map.begin(), map.end(), [](const MemoryRegion& r) {
        return r.mr_type == RegionType::Bootloader;
    }));
    bootinfo::BootInfoView view;
    ASSERT_TRUE(ParseBootInfo(view));
    ASSERT_EQ(map.size(), view.bv_memory_map.size());
    for (size_t n = 0; n < map.size(); n++)
        EXPECT_EQ(map[n], view.bv_memory_map[n]);
}

TEST_F(PipelineTest, ReportsTheLastDeviceError)
{
    fake::Bios bios(p_Machine.GetPhysicalMemory());
    AddBiosMemory(bios);
    fake::KernelSpec corrupt;
    corrupt.ks_corrupt_crc = true;
    auto& broken = bios.AddDisk(0x80, MiB(2));
    broken.d_fail_reads = true;
    PutKernel(bios.AddDisk(0x81, MiB(2)), fake::MakeKernel(fake::MakePayload(0x10000), corrupt));
    bios.WriteStage1(0x80);

    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::HeaderChecksumMismatch, p.Run(bios.MakeEntryState()).AsErrorKind());
    EXPECT_EQ(State::Halted, p.GetState());
    // Two failed attempts, then nothing left to select
    EXPECT_EQ(3u, p.GetEnumerationCount());
    EXPECT_NE(std::string::npos, GetBacklog().find("BOOT_HALT: HeaderChecksumMismatch\n"));
}

TEST_F(PipelineTest, OtherErrorsDoNotTryAnotherDevice)
{
    fake::Bios bios(p_Machine.GetPhysicalMemory());
    p_Machine.AddMemory(0, 0x10000);
    p_Machine.AddMemory(MiB(1), MiB(14));
    bios.AddE820(0, 0x9fc00, 1);
    bios.AddE820(MiB(1), MiB(14), 1);
    PutKernel(bios.AddDisk(0x80, MiB(2)), fake::MakeKernel(fake::MakePayload(0x10000)));
    PutKernel(bios.AddDisk(0x81, MiB(2)), fake::MakeKernel(fake::MakePayload(0x10000)));
    bios.WriteStage1(0x80);

    // Everything is below the 16MB staging minimum
    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::InsufficientStagingMemory, p.Run(bios.MakeEntryState()).AsErrorKind());
    EXPECT_EQ(1u, p.GetEnumerationCount());
    EXPECT_EQ(State::Halted, p.GetState());
}

TEST_F(PipelineTest, BootsACompressedKernelFromTheEsp)
{
    p_Machine.AddMemory(MiB(1), MiB(31));
    fake::Uefi uefi;
    uefi.AddDescriptor(firmware::efi::EfiConventionalMemory, MiB(1), (MiB(32) - MiB(1)) / PAGE_SIZE);
    uefi.AddDescriptor(firmware::efi::EfiRuntimeServicesData, MiB(32), 16);

    const auto payload = fake::MakePayload(MiB(3));
    const auto gz = fake::Gzip(payload);
    fake::KernelSpec spec;
    spec.ks_image_size = payload.size();
    spec.ks_alignment = MiB(2);
    auto& esp = uefi.AddVolume();
    uefi.AddFile(esp, "\\EFI\\kernel.img", fake::MakeKernel(gz, spec));
    uefi.SetBootDisk(esp);

    auto& p = MakePipeline();
    ASSERT_TRUE(p.Run(uefi.MakeEntryState()).IsSuccess());
    EXPECT_EQ(State::Prepared, p.GetState());
    EXPECT_EQ(FirmwareMode::UEFI, p.GetPlatform().pd_mode);

    const auto& image = p.GetKernelImage();
    EXPECT_EQ(Compression::None, image.ki_compression);
    EXPECT_EQ(MiB(16), image.ki_base);
    EXPECT_EQ(payload.size(), image.ki_length);
    EXPECT_EQ(payload, std::vector<uint8_t>(p_Machine.At(MiB(16)), p_Machine.At(MiB(16)) + payload.size()));

    // The compressed copy was read low, then handed back once expanded
    const auto& allocations = uefi.GetAllocations();
    ASSERT_EQ(4u, allocations.size());
    EXPECT_EQ(MiB(1), allocations[0].a_address);
    EXPECT_EQ(MiB(16), allocations[1].a_address);
    EXPECT_EQ(payload.size() / PAGE_SIZE, allocations[1].a_pages);
    EXPECT_EQ(MiB(32) - ArenaSize, allocations[2].a_address);
    EXPECT_EQ(MiB(1), allocations[3].a_address);
    ASSERT_EQ(1u, uefi.GetFrees().size());
    EXPECT_EQ(MiB(1), uefi.GetFrees()[0].a_address);
    EXPECT_EQ(allocations[0].a_pages, uefi.GetFrees()[0].a_pages);

    // Claims now belong to the kernel; nothing may give them back
    EXPECT_TRUE(p.GetContext().lc_scratch.s_claims.empty());
    EXPECT_FALSE(uefi.HasExited());

    const auto& hc = p.GetHandoffContext();
    EXPECT_EQ(MiB(16) + 0x1000, hc.hc_entry);
    EXPECT_EQ(MiB(1), hc.hc_argument);
    EXPECT_EQ(MiB(32), hc.hc_stack_top);

    bootinfo::BootInfoView view;
    ASSERT_TRUE(ParseBootInfo(view));
    ASSERT_TRUE(view.bv_has_firmware);
    EXPECT_EQ(static_cast<uint32_t>(FERRY_FIRMWARE_UEFI), view.bv_firmware_kind);
    EXPECT_EQ(reinterpret_cast<addr_t>(uefi.GetSystemTable()), view.bv_firmware_address);
}

TEST_F(PipelineTest, HaltsWhenTheEntryPointIsNotProduced)
{
    p_Machine.AddMemory(MiB(1), MiB(31));
    fake::Uefi uefi;
    uefi.AddDescriptor(firmware::efi::EfiConventionalMemory, MiB(1), (MiB(32) - MiB(1)) / PAGE_SIZE);

    // Declared large enough for the entry point, but the stream is short
    const auto payload = fake::MakePayload(MiB(1));
    fake::KernelSpec spec;
    spec.ks_image_size = MiB(8);
    spec.ks_entry_offset = MiB(6);
    auto& esp = uefi.AddVolume();
    uefi.AddFile(esp, "\\EFI\\kernel.img", fake::MakeKernel(fake::Gzip(payload), spec));
    uefi.SetBootDisk(esp);

    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::DecompressionFailed, p.Run(uefi.MakeEntryState()).AsErrorKind());
    EXPECT_EQ(State::Halted, p.GetState());
    EXPECT_EQ(1u, p.GetEnumerationCount());
    const auto& staging = p.GetStaging();
    EXPECT_EQ(MiB(16), staging.sr_base);
    // Nothing of the partial kernel is left behind
    auto staged = p_Machine.At(MiB(16), MiB(8));
    EXPECT_EQ(std::vector<uint8_t>(MiB(8), 0), std::vector<uint8_t>(staged, staged + MiB(8)));
    EXPECT_NE(std::string::npos, GetBacklog().find("BOOT_HALT: DecompressionFailed\n"));
}

TEST_F(PipelineTest, BootsFromMultibootModules)
{
    constexpr addr_t KernelModule = 0x200000;
    constexpr addr_t RamdiskModule = 0x300000;
    constexpr addr_t FramebufferBase = 0xfd000000;
    p_Machine.AddMemory(0, 0x10000);
    p_Machine.AddMemory(MiB(1), MiB(16));
    p_Machine.AddMemory(MiB(64) - ArenaSize, ArenaSize);

    const auto payload = fake::MakePayload(0x10000);
    const auto kernel = fake::MakeKernel(payload);
    p_Machine.Write(KernelModule, kernel);
    const std::vector<uint8_t> ramdisk(0x8000, 0xab);
    p_Machine.Write(RamdiskModule, ramdisk);

    fake::MultibootInfo mb;
    mb.AddCommandLine("module=mod:1,initrd.img console=ttyS0");
    mb.AddModule(KernelModule, KernelModule + kernel.size(), "kernel.img");
    mb.AddModule(RamdiskModule, RamdiskModule + ramdisk.size(), "initrd.img");
    mb.AddFramebuffer(FramebufferBase, 1024, 768);
    mb.AddMemory(0, 0x9fc00, 1);
    mb.AddMemory(MiB(1), MiB(63), 1);
    p_Machine.Write(InfoAddress, mb.Build());

    auto& p = MakePipeline();
    ASSERT_TRUE(p.Run(fake::MultibootInfo::MakeEntryState(InfoAddress)).IsSuccess());
    EXPECT_EQ(FirmwareMode::DirectLongMode, p.GetPlatform().pd_mode);
    EXPECT_STREQ("mod0", p.GetSelectedDevice().bd_name);

    // A raw kernel is copied out of the module, to where it runs
    EXPECT_EQ(MiB(16), p.GetKernelImage().ki_base);
    EXPECT_EQ(payload, std::vector<uint8_t>(p_Machine.At(MiB(16)), p_Machine.At(MiB(16)) + payload.size()));

    // The ramdisk stays where GRUB put it
    const auto& modules = p.GetModules();
    ASSERT_EQ(1u, modules.size());
    EXPECT_STREQ("initrd.img", modules[0].m_name);
    EXPECT_EQ(RamdiskModule, modules[0].m_base);
    EXPECT_EQ(ramdisk.size(), modules[0].m_length);
    EXPECT_EQ(ModuleType::Ramdisk, modules[0].m_type);

    bootinfo::BootInfoView view;
    ASSERT_TRUE(ParseBootInfo(view));
    ASSERT_EQ(1u, view.bv_modules.size());
    EXPECT_EQ(RamdiskModule, view.bv_modules[0].m_base);
    ASSERT_TRUE(view.bv_has_framebuffer);
    EXPECT_EQ(FramebufferBase, view.bv_framebuffer.fb_base);
    EXPECT_EQ(1024u, view.bv_framebuffer.fb_width);
    EXPECT_FALSE(view.bv_has_firmware);
    EXPECT_TRUE(memmap::IsWithinRegionOfType(
        p.GetMemoryMap(), FramebufferBase, 1024 * 768 * 4, RegionType::Framebuffer));
}

TEST_F(PipelineTest, KernelsCanDeclineTheFramebuffer)
{
    constexpr addr_t KernelModule = 0x200000;
    constexpr addr_t FramebufferBase = 0xfd000000;
    p_Machine.AddMemory(0, 0x10000);
    p_Machine.AddMemory(MiB(1), MiB(16));
    p_Machine.AddMemory(MiB(64) - ArenaSize, ArenaSize);

    fake::KernelSpec spec;
    spec.ks_flags = FERRY_KERNEL_FLAG_NO_FRAMEBUFFER;
    const auto kernel = fake::MakeKernel(fake::MakePayload(0x10000), spec);
    p_Machine.Write(KernelModule, kernel);

    fake::MultibootInfo mb;
    mb.AddModule(KernelModule, KernelModule + kernel.size(), "kernel.img");
    mb.AddFramebuffer(FramebufferBase, 800, 600);
    mb.AddMemory(0, 0x9fc00, 1);
    mb.AddMemory(MiB(1), MiB(63), 1);
    p_Machine.Write(InfoAddress, mb.Build());

    auto& p = MakePipeline();
    ASSERT_TRUE(p.Run(fake::MultibootInfo::MakeEntryState(InfoAddress)).IsSuccess());

    bootinfo::BootInfoView view;
    ASSERT_TRUE(ParseBootInfo(view));
    EXPECT_FALSE(view.bv_has_framebuffer);
    // The memory map still says what is there
    EXPECT_TRUE(memmap::IsWithinRegionOfType(
        p.GetMemoryMap(), FramebufferBase, 800 * 600 * 4, RegionType::Framebuffer));
}

TEST_F(PipelineTest, WipesStagingOnOverflow)
{
    constexpr addr_t KernelModule = 0x200000;
    p_Machine.AddMemory(0, 0x10000);
    const auto payload = fake::MakePayload(MiB(3));
    fake::KernelSpec spec;
    spec.ks_image_size = MiB(2);
    const auto kernel = fake::MakeKernel(fake::Gzip(payload), spec);
    p_Machine.AddMemory(KernelModule, ROUND_UP(kernel.size(), PAGE_SIZE));
    p_Machine.Write(KernelModule, kernel);
    auto staging = p_Machine.AddMemory(MiB(16), MiB(2) + PAGE_SIZE, 0xcc);

    fake::MultibootInfo mb;
    mb.AddModule(KernelModule, KernelModule + kernel.size(), "kernel.img.gz");
    mb.AddMemory(0, 0x9fc00, 1);
    mb.AddMemory(MiB(1), MiB(63), 1);
    p_Machine.Write(InfoAddress, mb.Build());

    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::StagingOverflow, p.Run(fake::MultibootInfo::MakeEntryState(InfoAddress)).AsErrorKind());
    EXPECT_EQ(State::Halted, p.GetState());
    EXPECT_EQ(ErrorKind::StagingOverflow, p.GetError());
    EXPECT_EQ(MiB(16), p.GetStaging().sr_base);
    EXPECT_EQ(MiB(2), p.GetStaging().sr_capacity);
    EXPECT_EQ(std::vector<uint8_t>(MiB(2), 0), std::vector<uint8_t>(staging, staging + MiB(2)));
    EXPECT_EQ(0xcc, staging[MiB(2)]);
    EXPECT_NE(std::string::npos, GetBacklog().find("BOOT_HALT: StagingOverflow\n"));
}

TEST_F(PipelineTest, ReservesTheRealModeArea)
{
    p_Machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddMemory(0, MiB(2), 1);
    p_Machine.Write(InfoAddress, mb.Build());

    // No modules, so nothing to boot from
    auto& p = MakePipeline();
    EXPECT_EQ(ErrorKind::NoBootableDevice, p.Run(fake::MultibootInfo::MakeEntryState(InfoAddress)).AsErrorKind());
    EXPECT_EQ(1u, p.GetEnumerationCount());

    const auto& map = p.GetMemoryMap();
    ASSERT_EQ(2u, map.size());
    EXPECT_EQ((MemoryRegion{ 0, MiB(1), RegionType::Reserved, 0 }), map[0]);
    EXPECT_EQ((MemoryRegion{ MiB(1), MiB(1), RegionType::Usable, 0 }), map[1]);
}

TEST_F(PipelineTest, BootsFromAnEmmcWindowOnArm64)
{
    constexpr addr_t DtbAddress = 0x48000000;
    constexpr addr_t RamBase = 0x40000000;
    constexpr addr_t WindowBase = 0xfe000000;
    constexpr addr_t ArenaAddress = RamBase + MiB(64) - ArenaSize;

    fake::FdtBuilder fdt;
    fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
    fdt.BeginNode("memory@40000000").String("device_type", "memory").Reg64({ RamBase, MiB(64) }).EndNode();
    fdt.BeginNode("chosen").String("bootargs", "console=ttyAMA0 debug").EndNode();
    fdt.BeginNode("soc").Cells("#address-cells", { 1 }).Cells("#size-cells", { 1 });
    fdt.BeginNode("emmc2@fe000000").Strings("compatible", { "brcm,bcm2711-emmc2" });
    fdt.Cells("reg", { static_cast<uint32_t>(WindowBase), 0x40000 }).EndNode();
    fdt.EndNode();
    p_Machine.AddMemory(DtbAddress, 0x10000);
    p_Machine.Write(DtbAddress, fdt.Build());

    const auto payload = fake::MakePayload(0x20000);
    auto window = p_Machine.AddMemory(WindowBase, 0x40000);
    const auto kernel = fake::MakeKernel(payload);
    std::copy(kernel.begin(), kernel.end(), window);
    p_Machine.AddMemory(RamBase, MiB(1));
    p_Machine.AddMemory(ArenaAddress, ArenaSize);

    auto& p = MakePipeline();
    ASSERT_TRUE(p.Run(fake::FdtBuilder::MakeEntryState(DtbAddress)).IsSuccess());
    EXPECT_EQ(Architecture::ARM64, p.GetPlatform().pd_arch);
    EXPECT_EQ(FirmwareMode::DeviceTree, p.GetPlatform().pd_mode);
    EXPECT_STREQ("emmc2@fe000000", p.GetSelectedDevice().bd_name);
    EXPECT_STREQ("console=ttyAMA0 debug", p.GetOptions().o_command_line);
    // debug turns on every trace, transitions included
    EXPECT_TRUE(p.GetOptions().o_debug);
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::PIPELINE, trace::level::INFO));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::MEMMAP, trace::level::FUNC));

    // Staging starts at the bottom of RAM here
    EXPECT_EQ(RamBase, p.GetKernelImage().ki_base);
    EXPECT_EQ(payload, std::vector<uint8_t>(p_Machine.At(RamBase), p_Machine.At(RamBase) + payload.size()));

    const auto& hc = p.GetHandoffContext();
    EXPECT_EQ(Architecture::ARM64, hc.hc_arch);
    EXPECT_EQ(RamBase + 0x1000, hc.hc_entry);
    EXPECT_EQ(RamBase + payload.size(), hc.hc_argument);
    EXPECT_EQ(RamBase + MiB(64), hc.hc_stack_top);
    EXPECT_NE(0u, hc.hc_tables.t_mair);

    bootinfo::BootInfoView view;
    ASSERT_TRUE(ParseBootInfo(view));
    ASSERT_TRUE(view.bv_has_firmware);
    EXPECT_EQ(static_cast<uint32_t>(FERRY_FIRMWARE_DEVICE_TREE), view.bv_firmware_kind);
    EXPECT_EQ(DtbAddress, view.bv_firmware_address);
    // The kernel sees debug too
    EXPECT_STREQ("console=ttyAMA0 debug", view.bv_command_line);
}
