/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include "loader/handoff.h"
#include "loader/console.h"
#include "loader/lib.h"
#include "loader/fake-memory.h"
#include "loader/fake-uefi.h"

using memmap::MemoryRegion;
using memmap::RegionType;

namespace
{
    constexpr uint64_t ArenaSize = HandoffArena::StackSize + HandoffArena::TablePoolSize;
    constexpr addr_t ArenaAddress = MiB(64) - ArenaSize;
    constexpr addr_t KernelAddress = MiB(16);

    struct HandoffTest : ::testing::Test {
        HandoffTest() : h_Context(h_Machine) {}

        void SetUp() override
        {
            h_Machine.AddMemory(ArenaAddress, ArenaSize);
            ASSERT_TRUE(h_Map.push_back(MemoryRegion{ 0, MiB(1), RegionType::Reserved, 0 }));
            ASSERT_TRUE(h_Map.push_back(MemoryRegion{ MiB(1), MiB(63), RegionType::Usable, 0 }));

            h_Image.ki_base = KernelAddress;
            h_Image.ki_length = 0x20000;
            h_Image.ki_entry_offset = 0x1000;
            h_Image.ki_owned = true;
            h_BootInfo.bi_base = MiB(1);
            h_BootInfo.bi_length = 0x200;
            h_BootInfo.bi_region_size = PAGE_SIZE;
        }

        // Puts kernel and boot information in place, as the earlier stages would
        void ClaimEverything()
        {
            const auto& lc = h_Context.c_Context;
            ASSERT_TRUE(memmap::Claim(lc, h_Map, h_Image.ki_base, h_Image.ki_length));
            ASSERT_TRUE(memmap::Claim(lc, h_Map, h_BootInfo.bi_base, h_BootInfo.bi_region_size));
            ASSERT_TRUE(handoff::ReserveArena(lc, h_Map, h_Arena).IsSuccess());
        }

        Result Prepare() { return handoff::Prepare(h_Context.c_Context, h_Image, h_BootInfo, h_Arena, h_Map, h_Handoff); }

        addr_t Translate(addr_t virt)
        {
            addr_t phys = ~static_cast<addr_t>(0);
            EXPECT_TRUE(handoff::Translate(h_Context.c_Context, h_Handoff, virt, phys)) << std::hex << virt;
            return phys;
        }

        bool IsMapped(addr_t virt)
        {
            addr_t phys;
            return handoff::Translate(h_Context.c_Context, h_Handoff, virt, phys);
        }

        // Identity, high-half aliases, stack
        void ExpectKernelView()
        {
            EXPECT_EQ(KernelAddress + 0x1000, h_Handoff.hc_entry);
            EXPECT_EQ(MiB(1), h_Handoff.hc_argument);
            EXPECT_EQ(ArenaAddress + HandoffArena::TablePoolSize + HandoffArena::StackSize, h_Handoff.hc_stack_top);
            EXPECT_EQ(0u, h_Handoff.hc_stack_top % 16);

            EXPECT_EQ(h_Handoff.hc_entry, Translate(h_Handoff.hc_entry));
            EXPECT_EQ(MiB(1) + 0x20, Translate(MiB(1) + 0x20));
            EXPECT_EQ(h_Handoff.hc_stack_top - 8, Translate(h_Handoff.hc_stack_top - 8));
            EXPECT_EQ(MiB(40), Translate(MiB(40)));

            EXPECT_EQ(KernelAddress + 0x1234, Translate(pagetable::HighHalfBase + KernelAddress + 0x1234));
            EXPECT_EQ(MiB(1), Translate(pagetable::HighHalfBase + MiB(1)));
            EXPECT_EQ(h_Arena.ha_stack_base, Translate(pagetable::HighHalfBase + h_Arena.ha_stack_base));

            EXPECT_FALSE(IsMapped(MiB(64)));
            EXPECT_FALSE(IsMapped(GiB(8)));
            EXPECT_FALSE(IsMapped(pagetable::HighHalfBase + MiB(40)));
        }

        fake::Machine h_Machine;
        fake::Context h_Context;
        memmap::MemoryMap h_Map;
        KernelImage h_Image;
        BootInfo h_BootInfo;
        HandoffArena h_Arena;
        HandoffContext h_Handoff;
    };
} // unnamed namespace

TEST_F(HandoffTest, ReservesTheArenaHigh)
{
    ASSERT_TRUE(handoff::ReserveArena(h_Context.c_Context, h_Map, h_Arena).IsSuccess());
    EXPECT_EQ(ArenaAddress, h_Arena.ha_tables_base);
    EXPECT_EQ(ArenaAddress + HandoffArena::TablePoolSize, h_Arena.ha_stack_base);
    ASSERT_EQ(3u, h_Map.size());
    EXPECT_EQ((MemoryRegion{ ArenaAddress, ArenaSize, RegionType::Bootloader, 0 }), h_Map[2]);
}

TEST_F(HandoffTest, ArenaMustFitBelow4GiB)
{
    h_Map.clear();
    ASSERT_TRUE(h_Map.push_back(MemoryRegion{ 0, 0x9f000, RegionType::Usable, 0 }));
    ASSERT_TRUE(h_Map.push_back(MemoryRegion{ MiB(1), 0x10000, RegionType::Usable, 0 }));
    ASSERT_TRUE(h_Map.push_back(MemoryRegion{ GiB(4), GiB(1), RegionType::Usable, 0 }));
    EXPECT_EQ(
        ErrorKind::StackAllocationFailed, handoff::ReserveArena(h_Context.c_Context, h_Map, h_Arena).AsErrorKind());
}

TEST_F(HandoffTest, BuildsAmd64Tables)
{
    ClaimEverything();
    ASSERT_TRUE(Prepare().IsSuccess());
    EXPECT_EQ(Architecture::X86_64, h_Handoff.hc_arch);
    EXPECT_TRUE(h_Handoff.hc_mask_interrupts);

    const auto& tables = h_Handoff.hc_tables;
    EXPECT_EQ(ArenaAddress, tables.t_root);
    EXPECT_EQ(tables.t_root, tables.t_root_high);
    // Root, then a directory pointer table and a directory for each half
    EXPECT_EQ(5u, tables.t_pages_used);
    EXPECT_EQ(0u, tables.t_mair);
    EXPECT_EQ(0u, tables.t_satp);
    ExpectKernelView();
}

TEST_F(HandoffTest, BuildsArm64Tables)
{
    h_Context.c_Platform.pd_arch = Architecture::ARM64;
    ClaimEverything();
    ASSERT_TRUE(Prepare().IsSuccess());
    EXPECT_EQ(Architecture::ARM64, h_Handoff.hc_arch);

    const auto& tables = h_Handoff.hc_tables;
    EXPECT_NE(tables.t_root, tables.t_root_high);
    EXPECT_EQ(6u, tables.t_pages_used);
    EXPECT_NE(0u, tables.t_mair);
    EXPECT_NE(0u, tables.t_tcr);
    ExpectKernelView();
}

TEST_F(HandoffTest, BuildsRiscv64Tables)
{
    h_Context.c_Platform.pd_arch = Architecture::RISCV64;
    ClaimEverything();
    ASSERT_TRUE(Prepare().IsSuccess());

    const auto& tables = h_Handoff.hc_tables;
    EXPECT_EQ((9ull << 60) | (tables.t_root >> 12), tables.t_satp);
    EXPECT_EQ(5u, tables.t_pages_used);
    ExpectKernelView();
}

TEST_F(HandoffTest, FramebufferIsIdentityMapped)
{
    ASSERT_TRUE(h_Map.push_back(MemoryRegion{ 0xe0000000, MiB(8), RegionType::Framebuffer, 0 }));
    ClaimEverything();
    ASSERT_TRUE(Prepare().IsSuccess());
    EXPECT_EQ(0xe0000000u + 0x1000, Translate(0xe0000000 + 0x1000));
    EXPECT_FALSE(IsMapped(0xe0000000 + MiB(8)));
}

TEST_F(HandoffTest, PrepareNeedsTheArena)
{
    ClaimEverything();
    h_Arena = HandoffArena{};
    EXPECT_EQ(ErrorKind::StackAllocationFailed, Prepare().AsErrorKind());
}

TEST_F(HandoffTest, KernelMustBeClaimed)
{
    ASSERT_TRUE(handoff::ReserveArena(h_Context.c_Context, h_Map, h_Arena).IsSuccess());
    EXPECT_EQ(ErrorKind::PagingSetupFailed, Prepare().AsErrorKind());
}

TEST_F(HandoffTest, EntryMustBeIdentityMappable)
{
    ClaimEverything();
    h_Image.ki_entry_offset = pagetable::IdentityLimit;
    EXPECT_EQ(ErrorKind::PagingSetupFailed, Prepare().AsErrorKind());

    h_Image.ki_entry_offset = ~static_cast<uint64_t>(0);
    EXPECT_EQ(ErrorKind::PagingSetupFailed, Prepare().AsErrorKind());
}

TEST_F(HandoffTest, EntryMustLieInsideTheImage)
{
    ClaimEverything();
    h_Image.ki_entry_offset = h_Image.ki_length;
    EXPECT_EQ(ErrorKind::PagingSetupFailed, Prepare().AsErrorKind());

    h_Image.ki_entry_offset = h_Image.ki_length - 1;
    EXPECT_TRUE(Prepare().IsSuccess());
}

TEST_F(HandoffTest, RefusesLoaderMemoryBeyondTheLowerHalf)
{
    ASSERT_TRUE(h_Map.push_back(MemoryRegion{ pagetable::IdentityLimit, MiB(2), RegionType::Bootloader, 0 }));
    ClaimEverything();
    EXPECT_EQ(ErrorKind::PagingSetupFailed, Prepare().AsErrorKind());
}

TEST(Handoff, NothingToExitWithoutUefi)
{
    fake::Machine machine;
    fake::Context ctx(machine);
    EXPECT_TRUE(handoff::ExitFirmware(ctx.c_Context).IsSuccess());
}

namespace
{
    struct ExitTest : ::testing::Test {
        ExitTest() : e_Context(e_Machine) {}

        void SetUp() override
        {
            e_Uefi.AddDescriptor(firmware::efi::EfiConventionalMemory, 0x100000, 0x1000);
            auto& pd = e_Context.c_Platform;
            pd.pd_mode = FirmwareMode::UEFI;
            pd.pd_efi_system_table = e_Uefi.GetSystemTable();
            pd.pd_efi_image = e_Uefi.GetImageHandle();

            console::Output output;
            output.o_backend = console::Backend::UefiConOut;
            output.o_conout = e_Uefi.GetSystemTable()->ConOut;
            console::SetOutput(output);
        }

        void TearDown() override { console::SetOutput(console::Output{}); }

        fake::Machine e_Machine;
        fake::Context e_Context;
        fake::Uefi e_Uefi;
    };
} // unnamed namespace

TEST_F(ExitTest, ExitsBootServices)
{
    ASSERT_TRUE(handoff::ExitFirmware(e_Context.c_Context).IsSuccess());
    EXPECT_TRUE(e_Uefi.HasExited());
    EXPECT_EQ(1u, e_Uefi.GetExitCalls());
    // The firmware console is gone
    EXPECT_EQ(console::Backend::None, console::GetBackend());
}

TEST_F(ExitTest, RetriesWithAFreshMapKey)
{
    e_Uefi.SetStaleKeyOnce();
    ASSERT_TRUE(handoff::ExitFirmware(e_Context.c_Context).IsSuccess());
    EXPECT_TRUE(e_Uefi.HasExited());
    EXPECT_EQ(2u, e_Uefi.GetExitCalls());
}

TEST_F(ExitTest, ReportsFailure)
{
    e_Uefi.SetExitStatus(firmware::efi::EFI_DEVICE_ERROR);
    EXPECT_EQ(ErrorKind::FirmwareExitFailed, handoff::ExitFirmware(e_Context.c_Context).AsErrorKind());
    EXPECT_FALSE(e_Uefi.HasExited());
    EXPECT_EQ(1u, e_Uefi.GetExitCalls());
    EXPECT_EQ(console::Backend::UefiConOut, console::GetBackend());
}
