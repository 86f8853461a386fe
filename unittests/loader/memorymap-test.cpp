/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include "loader/memorymap.h"
#include "loader/framebuffer.h"
#include "loader/lib.h"
#include "loader/platform.h"
#include "loader/fake-bios.h"
#include "loader/fake-fdt.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"
#include "loader/fake-uefi.h"

using namespace memmap;

namespace
{
    void AddRaw(RawMemoryMap& raw, addr_t base, uint64_t length, RegionType type, uint32_t attributes = 0,
        Source source = Source::Firmware)
    {
        RawRegion rr;
        rr.rr_region = MemoryRegion{ base, length, type, attributes };
        rr.rr_source = source;
        ASSERT_TRUE(raw.push_back(rr));
    }

    MemoryMap MakeMap(std::initializer_list<MemoryRegion> regions)
    {
        MemoryMap map;
        for (const auto& r : regions)
            EXPECT_TRUE(map.push_back(r));
        return map;
    }

    void ExpectMap(const MemoryMap& map, std::initializer_list<MemoryRegion> expected)
    {
        ASSERT_EQ(expected.size(), map.size());
        size_t n = 0;
        for (const auto& r : expected) {
            EXPECT_EQ(r.mr_base, map[n].mr_base) << "entry " << n;
            EXPECT_EQ(r.mr_length, map[n].mr_length) << "entry " << n;
            EXPECT_EQ(r.mr_type, map[n].mr_type) << "entry " << n;
            EXPECT_EQ(r.mr_attributes, map[n].mr_attributes) << "entry " << n;
            ++n;
        }
        EXPECT_TRUE(Validate(map));
    }

    constexpr addr_t InfoAddress = 0x9000;
    constexpr addr_t DtbAddress = 0x40000000;
} // unnamed namespace

TEST(MemoryMap, NormalizeSortsAndDropsEmptyEntries)
{
    RawMemoryMap raw;
    AddRaw(raw, 0x100000, 0x100000, RegionType::Usable);
    AddRaw(raw, 0x5000, 0, RegionType::Reserved);
    AddRaw(raw, 0, 0x9f000, RegionType::Usable);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(map, { { 0, 0x9f000, RegionType::Usable }, { 0x100000, 0x100000, RegionType::Usable } });
}

TEST(MemoryMap, NormalizeLetsTheHighestPrecedenceWin)
{
    RawMemoryMap raw;
    AddRaw(raw, 0, 0x10000, RegionType::Usable);
    AddRaw(raw, 0x4000, 0x1000, RegionType::Reserved);
    AddRaw(raw, 0x8000, 0x4000, RegionType::BadRam);
    AddRaw(raw, 0xa000, 0x4000, RegionType::AcpiNvs);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(
        map, {
                 { 0, 0x4000, RegionType::Usable },
                 { 0x4000, 0x1000, RegionType::Reserved },
                 { 0x5000, 0x5000, RegionType::Usable },
                 { 0xa000, 0x4000, RegionType::AcpiNvs },
                 { 0xe000, 0x2000, RegionType::Usable },
             });
}

TEST(MemoryMap, NormalizeIsIdempotent)
{
    RawMemoryMap raw;
    AddRaw(raw, MiB(1), MiB(63), RegionType::Usable);
    AddRaw(raw, 0, 0x9fc00, RegionType::Usable);
    AddRaw(raw, 0x9fc00, 0x400, RegionType::Reserved);
    AddRaw(raw, MiB(8), MiB(2), RegionType::AcpiReclaim);
    AddRaw(raw, MiB(9), MiB(2), RegionType::AcpiNvs);
    AddRaw(raw, MiB(20), 0x3000, RegionType::Usable, attribute::Runtime);
    AddRaw(raw, MiB(32), MiB(1), RegionType::BadRam);
    AddRaw(raw, 0xe0000000, MiB(8), RegionType::Framebuffer);
    AddRaw(raw, 0, MiB(1), RegionType::Reserved, 0, Source::Architectural);

    MemoryMap first;
    ASSERT_TRUE(Normalize(raw, first).IsSuccess());
    EXPECT_TRUE(Validate(first));

    // Feeding the result back in changes nothing
    RawMemoryMap again;
    for (const auto& r : first)
        AddRaw(again, r.mr_base, r.mr_length, r.mr_type, r.mr_attributes);
    MemoryMap second;
    ASSERT_TRUE(Normalize(again, second).IsSuccess());
    ASSERT_EQ(first.size(), second.size());
    for (size_t n = 0; n < first.size(); n++)
        EXPECT_EQ(first[n], second[n]) << "entry " << n;
}

TEST(MemoryMap, NormalizeCombinesAttributesOfEqualTypes)
{
    RawMemoryMap raw;
    AddRaw(raw, 0, 0x2000, RegionType::Usable, attribute::Runtime);
    AddRaw(raw, 0x1000, 0x2000, RegionType::Usable, attribute::Uncached);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(
        map, {
                 { 0, 0x1000, RegionType::Usable, attribute::Runtime },
                 { 0x1000, 0x1000, RegionType::Usable, attribute::Runtime | attribute::Uncached },
                 { 0x2000, 0x1000, RegionType::Usable, attribute::Uncached },
             });
}

TEST(MemoryMap, NormalizeMergesAdjacentEntries)
{
    RawMemoryMap raw;
    AddRaw(raw, 0x3000, 0x1000, RegionType::Usable);
    AddRaw(raw, 0x1000, 0x1000, RegionType::Usable);
    AddRaw(raw, 0x2000, 0x1000, RegionType::Usable);
    AddRaw(raw, 0x4000, 0x1000, RegionType::Usable, attribute::Runtime);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(
        map, {
                 { 0x1000, 0x3000, RegionType::Usable },
                 { 0x4000, 0x1000, RegionType::Usable, attribute::Runtime },
             });
}

TEST(MemoryMap, ArchitecturalEntriesOnlyOverrideTheType)
{
    RawMemoryMap raw;
    AddRaw(raw, 0, MiB(2), RegionType::Usable, attribute::Uncached);
    AddRaw(raw, 0, MiB(1), RegionType::Reserved, 0, Source::Architectural);
    // Describes no memory, so it must not show up
    AddRaw(raw, GiB(1), 0x1000, RegionType::Reserved, 0, Source::Architectural);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(
        map, {
                 { 0, MiB(1), RegionType::Reserved, attribute::Uncached },
                 { MiB(1), MiB(1), RegionType::Usable, attribute::Uncached },
             });
}

TEST(MemoryMap, ArchitecturalEntriesBeatReservedFirmwareEntries)
{
    RawMemoryMap raw;
    AddRaw(raw, 0, 0x2000, RegionType::Reserved);
    AddRaw(raw, 0, 0x2000, RegionType::Bootloader, 0, Source::Architectural);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(map, { { 0, 0x2000, RegionType::Bootloader } });
}

TEST(MemoryMap, NormalizeClipsAtTheEndOfTheAddressSpace)
{
    RawMemoryMap raw;
    AddRaw(raw, 0xfffffffffffff000, 0x2000, RegionType::Reserved);

    MemoryMap map;
    ASSERT_TRUE(Normalize(raw, map).IsSuccess());
    ExpectMap(map, { { 0xfffffffffffff000, 0xfff, RegionType::Reserved } });
}

TEST(MemoryMap, NormalizeWithoutMemoryFails)
{
    RawMemoryMap raw;
    MemoryMap map;
    EXPECT_EQ(ErrorKind::NoMemoryMap, Normalize(raw, map).AsErrorKind());

    AddRaw(raw, 0x1000, 0, RegionType::Usable);
    AddRaw(raw, 0, 0x1000, RegionType::Reserved, 0, Source::Architectural);
    EXPECT_EQ(ErrorKind::NoMemoryMap, Normalize(raw, map).AsErrorKind());
}

TEST(MemoryMap, NormalizeFailsWhenTheResultIsTooLarge)
{
    RawMemoryMap raw;
    for (size_t n = 0; n <= MaxRegions; n++)
        AddRaw(raw, n * 0x2000, 0x1000, RegionType::Usable);

    MemoryMap map;
    EXPECT_EQ(ErrorKind::MemoryMapTooLarge, Normalize(raw, map).AsErrorKind());
}

TEST(MemoryMap, EfiDescriptorConversion)
{
    using namespace firmware::efi;
    EXPECT_EQ(
        (MemoryRegion{ 0x100000, 0x3000, RegionType::Usable, 0 }),
        FromEfiDescriptor(EfiConventionalMemory, 0x100000, 3, 0));
    EXPECT_EQ(
        (MemoryRegion{ 0x1000, 0x1000, RegionType::Usable, attribute::Runtime }),
        FromEfiDescriptor(EfiConventionalMemory, 0x1000, 1, EFI_MEMORY_RUNTIME));
    for (auto type : { EfiLoaderCode, EfiLoaderData, EfiBootServicesCode, EfiBootServicesData })
        EXPECT_EQ(RegionType::Bootloader, FromEfiDescriptor(type, 0, 1, 0).mr_type);
    for (auto type : { EfiRuntimeServicesCode, EfiRuntimeServicesData }) {
        const auto r = FromEfiDescriptor(type, 0, 1, 0);
        EXPECT_EQ(RegionType::Reserved, r.mr_type);
        EXPECT_EQ(attribute::Runtime, r.mr_attributes);
    }
    EXPECT_EQ(RegionType::AcpiReclaim, FromEfiDescriptor(EfiACPIReclaimMemory, 0, 1, 0).mr_type);
    EXPECT_EQ(RegionType::AcpiNvs, FromEfiDescriptor(EfiACPIMemoryNVS, 0, 1, 0).mr_type);
    EXPECT_EQ(RegionType::BadRam, FromEfiDescriptor(EfiUnusableMemory, 0, 1, 0).mr_type);
    EXPECT_EQ(
        (MemoryRegion{ 0, 0x1000, RegionType::Reserved, attribute::NonVolatile }),
        FromEfiDescriptor(EfiPersistentMemory, 0, 1, 0));
    EXPECT_EQ(RegionType::Reserved, FromEfiDescriptor(EfiMemoryMappedIO, 0, 1, 0).mr_type);
    EXPECT_EQ(RegionType::Reserved, FromEfiDescriptor(0x70000000, 0, 1, 0).mr_type);
}

TEST(MemoryMap, E820TypeConversion)
{
    EXPECT_EQ(RegionType::Usable, FromE820Type(1));
    EXPECT_EQ(RegionType::Reserved, FromE820Type(2));
    EXPECT_EQ(RegionType::AcpiReclaim, FromE820Type(3));
    EXPECT_EQ(RegionType::AcpiNvs, FromE820Type(4));
    EXPECT_EQ(RegionType::BadRam, FromE820Type(5));
    EXPECT_EQ(RegionType::Reserved, FromE820Type(12));
}

TEST(MemoryMap, PrecedenceOrder)
{
    const RegionType order[] = { RegionType::Reserved, RegionType::AcpiNvs, RegionType::AcpiReclaim,
        RegionType::Framebuffer, RegionType::Bootloader, RegionType::Usable, RegionType::BadRam };
    for (size_t n = 1; n < sizeof(order) / sizeof(order[0]); n++)
        EXPECT_GT(Precedence(order[n - 1]), Precedence(order[n]));
}

TEST(MemoryMap, RegionTypeNames)
{
    EXPECT_STREQ("usable", RegionTypeName(RegionType::Usable));
    EXPECT_STREQ("reserved", RegionTypeName(RegionType::Reserved));
    EXPECT_STREQ("acpi-reclaim", RegionTypeName(RegionType::AcpiReclaim));
    EXPECT_STREQ("acpi-nvs", RegionTypeName(RegionType::AcpiNvs));
    EXPECT_STREQ("bad-ram", RegionTypeName(RegionType::BadRam));
    EXPECT_STREQ("bootloader", RegionTypeName(RegionType::Bootloader));
    EXPECT_STREQ("framebuffer", RegionTypeName(RegionType::Framebuffer));
}

TEST(MemoryMap, ReserveSplitsRegions)
{
    const auto in = MakeMap({
        { 0, 0x10000, RegionType::Usable, attribute::Uncached },
        { 0x20000, 0x10000, RegionType::Usable },
    });

    MemoryMap out;
    ASSERT_TRUE(Reserve(in, 0x8000, 0x1c000, RegionType::Bootloader, out).IsSuccess());
    ExpectMap(
        out, {
                 { 0, 0x8000, RegionType::Usable, attribute::Uncached },
                 { 0x8000, 0x8000, RegionType::Bootloader, attribute::Uncached },
                 { 0x20000, 0x4000, RegionType::Bootloader },
                 { 0x24000, 0xc000, RegionType::Usable },
             });
}

TEST(MemoryMap, ReserveMergesWithNeighbours)
{
    const auto in = MakeMap({
        { 0, 0x1000, RegionType::Bootloader },
        { 0x1000, 0x3000, RegionType::Usable },
    });

    MemoryMap out;
    ASSERT_TRUE(Reserve(in, 0x1000, 0x1000, RegionType::Bootloader, out).IsSuccess());
    ExpectMap(
        out, {
                 { 0, 0x2000, RegionType::Bootloader },
                 { 0x2000, 0x2000, RegionType::Usable },
             });
}

TEST(MemoryMap, WithinRegionOfType)
{
    const auto map = MakeMap({
        { 0, 0x1000, RegionType::Usable },
        { 0x1000, 0x1000, RegionType::Bootloader },
        { 0x2000, 0x1000, RegionType::Usable },
    });
    EXPECT_TRUE(IsWithinRegionOfType(map, 0, 0x1000, RegionType::Usable));
    EXPECT_TRUE(IsWithinRegionOfType(map, 0x1800, 0x800, RegionType::Bootloader));
    EXPECT_FALSE(IsWithinRegionOfType(map, 0x800, 0x1000, RegionType::Usable));
    EXPECT_FALSE(IsWithinRegionOfType(map, 0x2000, 0x1001, RegionType::Usable));
    EXPECT_FALSE(IsWithinRegionOfType(map, 0x2000, 0, RegionType::Usable));
}

TEST(MemoryMap, FindFreeBottomUp)
{
    const auto map = MakeMap({
        { 0, 0x9f000, RegionType::Usable },
        { MiB(1), MiB(1), RegionType::Bootloader },
        { MiB(2), MiB(30), RegionType::Usable },
    });

    addr_t result;
    ASSERT_TRUE(FindFree(map, 0x1000, 0x1000, 0, ~static_cast<addr_t>(0), false, result));
    EXPECT_EQ(0u, result);
    ASSERT_TRUE(FindFree(map, MiB(1), 0x1000, 0, ~static_cast<addr_t>(0), false, result));
    EXPECT_EQ(MiB(2), result);
    ASSERT_TRUE(FindFree(map, 0x1000, MiB(4), MiB(1), ~static_cast<addr_t>(0), false, result));
    EXPECT_EQ(MiB(4), result);
    ASSERT_TRUE(FindFree(map, 0x1000, 0x1000, MiB(16), ~static_cast<addr_t>(0), false, result));
    EXPECT_EQ(MiB(16), result);
    EXPECT_FALSE(FindFree(map, MiB(31), 0x1000, 0, ~static_cast<addr_t>(0), false, result));
    EXPECT_FALSE(FindFree(map, MiB(16), 0x1000, 0, MiB(16), false, result));
}

TEST(MemoryMap, FindFreeTopDown)
{
    const auto map = MakeMap({
        { MiB(1), MiB(1), RegionType::Usable },
        { MiB(2), MiB(1), RegionType::Reserved },
        { MiB(3), MiB(5), RegionType::Usable },
    });

    addr_t result;
    ASSERT_TRUE(FindFree(map, 0x3000, 0x1000, 0, ~static_cast<addr_t>(0), true, result));
    EXPECT_EQ(MiB(8) - 0x3000, result);
    ASSERT_TRUE(FindFree(map, 0x1000, MiB(2), 0, ~static_cast<addr_t>(0), true, result));
    EXPECT_EQ(MiB(6), result);
    ASSERT_TRUE(FindFree(map, 0x1000, 0x1000, 0, MiB(3), true, result));
    EXPECT_EQ(MiB(2) - 0x1000, result);
    EXPECT_FALSE(FindFree(map, MiB(2), 0x1000, 0, MiB(4), true, result));
}

TEST(MemoryMap, FindFreeRejectsNonsense)
{
    const auto map = MakeMap({ { 0, MiB(1), RegionType::Usable } });
    addr_t result;
    EXPECT_FALSE(FindFree(map, 0, 0x1000, 0, MiB(1), false, result));
    EXPECT_FALSE(FindFree(map, 0x1000, 0x3000, 0, MiB(1), false, result));
    EXPECT_FALSE(FindFree(map, 0x1000, 0, 0, MiB(1), false, result));
}

TEST(MemoryMap, Summaries)
{
    const auto map = MakeMap({
        { 0, 0x9f000, RegionType::Reserved },
        { MiB(1), MiB(1), RegionType::Bootloader },
        { MiB(2), MiB(2), RegionType::Usable },
        { MiB(4), MiB(8), RegionType::Usable },
        { MiB(12), MiB(1), RegionType::AcpiNvs },
    });
    EXPECT_EQ(MiB(8), LargestUsable(map));
    EXPECT_EQ(MiB(2), LowestUsable(map));

    const auto s = GetStatistics(map);
    EXPECT_EQ(0x9f000 + MiB(12), s.s_total);
    EXPECT_EQ(MiB(10), s.s_usable);
    EXPECT_EQ(MiB(1), s.s_bootloader);
    EXPECT_EQ(0x9f000 + MiB(1), s.s_reserved);

    const auto none = MakeMap({ { 0, MiB(1), RegionType::Reserved } });
    EXPECT_EQ(0u, LargestUsable(none));
    EXPECT_EQ(0u, LowestUsable(none));
}

TEST(MemoryMap, ValidateRejectsBrokenMaps)
{
    EXPECT_TRUE(Validate(MakeMap({})));
    EXPECT_TRUE(Validate(MakeMap({ { 0, 0x1000, RegionType::Usable }, { 0x1000, 0x1000, RegionType::Reserved } })));
    EXPECT_FALSE(Validate(MakeMap({ { 0, 0, RegionType::Usable } })));
    EXPECT_FALSE(Validate(MakeMap({ { 0xfffffffffffff000, 0x2000, RegionType::Usable } })));
    EXPECT_FALSE(Validate(MakeMap({ { 0x1000, 0x1000, RegionType::Usable }, { 0, 0x1000, RegionType::Reserved } })));
    EXPECT_FALSE(Validate(MakeMap({ { 0, 0x2000, RegionType::Usable }, { 0x1000, 0x1000, RegionType::Reserved } })));
    EXPECT_FALSE(Validate(MakeMap({ { 0, 0x1000, RegionType::Usable }, { 0x1000, 0x1000, RegionType::Usable } })));
}

TEST(MemoryMap, ClaimAndReleaseWithoutFirmware)
{
    fake::Machine machine;
    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::LegacyBIOS;
    auto map = MakeMap({ { MiB(1), MiB(15), RegionType::Usable } });

    ASSERT_TRUE(Claim(ctx.c_Context, map, MiB(2), MiB(1)));
    ExpectMap(
        map, {
                 { MiB(1), MiB(1), RegionType::Usable },
                 { MiB(2), MiB(1), RegionType::Bootloader },
                 { MiB(3), MiB(13), RegionType::Usable },
             });
    EXPECT_TRUE(machine.GetScratch().s_claims.empty());

    // Already taken
    EXPECT_FALSE(Claim(ctx.c_Context, map, MiB(2), 0x1000));
    EXPECT_FALSE(Claim(ctx.c_Context, map, MiB(15), MiB(2)));

    ASSERT_TRUE(Release(ctx.c_Context, map, MiB(2), MiB(1)));
    ExpectMap(map, { { MiB(1), MiB(15), RegionType::Usable } });
}

TEST(MemoryMap, ClaimsUnderUefiAreTrackedAndGivenBack)
{
    fake::Machine machine;
    fake::Uefi uefi;
    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::UEFI;
    ctx.c_Platform.pd_efi_system_table = uefi.GetSystemTable();
    auto map = MakeMap({ { MiB(1), MiB(15), RegionType::Usable } });

    ASSERT_TRUE(Claim(ctx.c_Context, map, MiB(2), 0x3000));
    ASSERT_TRUE(Claim(ctx.c_Context, map, MiB(4), 0x1000));
    ASSERT_EQ(2u, uefi.GetAllocations().size());
    EXPECT_EQ(MiB(2), uefi.GetAllocations()[0].a_address);
    EXPECT_EQ(3u, uefi.GetAllocations()[0].a_pages);
    EXPECT_EQ(2u, machine.GetScratch().s_claims.size());

    ASSERT_TRUE(Release(ctx.c_Context, map, MiB(4), 0x1000));
    ASSERT_EQ(1u, uefi.GetFrees().size());
    EXPECT_EQ(MiB(4), uefi.GetFrees()[0].a_address);
    EXPECT_EQ(1u, machine.GetScratch().s_claims.size());

    ReleaseAllClaims(ctx.c_Context);
    ASSERT_EQ(2u, uefi.GetFrees().size());
    EXPECT_EQ(MiB(2), uefi.GetFrees()[1].a_address);
    EXPECT_EQ(3u, uefi.GetFrees()[1].a_pages);
    EXPECT_TRUE(machine.GetScratch().s_claims.empty());
}

TEST(MemoryMap, ForgetClaimsKeepsTheMemory)
{
    fake::Machine machine;
    fake::Uefi uefi;
    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::UEFI;
    ctx.c_Platform.pd_efi_system_table = uefi.GetSystemTable();
    auto map = MakeMap({ { MiB(1), MiB(15), RegionType::Usable } });

    ASSERT_TRUE(Claim(ctx.c_Context, map, MiB(2), 0x1000));
    ForgetClaims(ctx.c_Context);
    EXPECT_TRUE(machine.GetScratch().s_claims.empty());
    EXPECT_TRUE(uefi.GetFrees().empty());
}

TEST(MemoryMap, ClaimFailsIfTheFirmwareRefuses)
{
    fake::Machine machine;
    fake::Uefi uefi;
    uefi.SetAllocateStatus(firmware::efi::EFI_NOT_FOUND);
    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::UEFI;
    ctx.c_Platform.pd_efi_system_table = uefi.GetSystemTable();
    auto map = MakeMap({ { MiB(1), MiB(15), RegionType::Usable } });

    EXPECT_FALSE(Claim(ctx.c_Context, map, MiB(2), 0x1000));
    ExpectMap(map, { { MiB(1), MiB(15), RegionType::Usable } });
    EXPECT_TRUE(machine.GetScratch().s_claims.empty());
}

TEST(MemoryMap, AcquireFromUefi)
{
    using namespace firmware::efi;
    fake::Machine machine;
    fake::Uefi uefi;
    uefi.AddDescriptor(EfiConventionalMemory, 0, 0xa0);
    uefi.AddDescriptor(EfiBootServicesData, 0x100000, 0x100);
    uefi.AddDescriptor(EfiConventionalMemory, 0x200000, 0x3e00);
    uefi.AddDescriptor(EfiRuntimeServicesData, 0x4000000, 0x10, EFI_MEMORY_RUNTIME);
    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(uefi.MakeEntryState(), machine.GetPhysicalMemory(), ctx.c_Platform).IsSuccess());

    Framebuffer fb;
    fb.fb_base = 0x80000000;
    fb.fb_width = 1024;
    fb.fb_height = 768;
    fb.fb_pitch = 4096;
    fb.fb_bpp = 32;

    MemoryMap map;
    ASSERT_TRUE(Acquire(ctx.c_Context, &fb, map).IsSuccess());
    ExpectMap(
        map, {
                 { 0, 0xa0000, RegionType::Reserved },
                 { 0x100000, 0x100000, RegionType::Bootloader },
                 { 0x200000, 0x3e00000, RegionType::Usable },
                 { 0x4000000, 0x10000, RegionType::Reserved, attribute::Runtime },
                 { 0x80000000, 4096 * 768, RegionType::Framebuffer, attribute::WriteCombine },
             });
}

TEST(MemoryMap, AcquireFromUefiWithoutDescriptorsFails)
{
    fake::Machine machine;
    fake::Uefi uefi;
    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(uefi.MakeEntryState(), machine.GetPhysicalMemory(), ctx.c_Platform).IsSuccess());

    MemoryMap map;
    EXPECT_EQ(ErrorKind::NoMemoryMap, Acquire(ctx.c_Context, nullptr, map).AsErrorKind());
}

TEST(MemoryMap, AcquireFromMultiboot)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddModule(0x200000, 0x280000, "initrd");
    mb.AddMemory(0, 0x9fc00, 1);
    mb.AddMemory(0x100000, 0x7fe00000, 1);
    mb.AddMemory(0xfffc0000, 0x40000, 2);
    machine.Write(InfoAddress, mb.Build());

    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(
                    fake::MultibootInfo::MakeEntryState(InfoAddress), machine.GetPhysicalMemory(), ctx.c_Platform)
                    .IsSuccess());

    MemoryMap map;
    ASSERT_TRUE(Acquire(ctx.c_Context, nullptr, map).IsSuccess());
    // The information block and the loader sit below 1MB, and are covered by the architectural reservation
    ExpectMap(
        map, {
                 { 0, 0x9fc00, RegionType::Reserved },
                 { 0x100000, 0x100000, RegionType::Usable },
                 { 0x200000, 0x80000, RegionType::Bootloader },
                 { 0x280000, 0x7fc80000, RegionType::Usable },
                 { 0xfffc0000, 0x40000, RegionType::Reserved },
             });
}

TEST(MemoryMap, AcquireFromMultibootNeedsAMemoryMap)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddCommandLine("quiet");
    machine.Write(InfoAddress, mb.Build());

    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(
                    fake::MultibootInfo::MakeEntryState(InfoAddress), machine.GetPhysicalMemory(), ctx.c_Platform)
                    .IsSuccess());

    MemoryMap map;
    EXPECT_EQ(ErrorKind::NoMemoryMap, Acquire(ctx.c_Context, nullptr, map).AsErrorKind());
}

TEST(MemoryMap, AcquireFromE820)
{
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::Bios bios(machine.GetPhysicalMemory());
    bios.AddE820(0, 0x9fc00, 1);
    bios.AddE820(0x9fc00, 0x400, 2);
    bios.AddE820(0x100000, 0x3ff00000, 1);
    bios.AddE820(0x3fff0000, 0x10000, 3);
    bios.WriteStage1(0x80);

    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(bios.MakeEntryState(), machine.GetPhysicalMemory(), ctx.c_Platform).IsSuccess());

    MemoryMap map;
    ASSERT_TRUE(Acquire(ctx.c_Context, nullptr, map).IsSuccess());
    ExpectMap(
        map, {
                 { 0, 0xa0000, RegionType::Reserved },
                 { 0x100000, 0x3fef0000, RegionType::Usable },
                 { 0x3fff0000, 0x10000, RegionType::AcpiReclaim },
             });
}

TEST(MemoryMap, AcquireFromDeviceTree)
{
    fake::FdtBuilder fdt;
    fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
    fdt.BeginNode("memory@40000000").String("device_type", "memory").Reg64({ 0x40000000, 0x40000000 }).EndNode();
    fdt.BeginNode("memory@c0000000").String("status", "disabled").Reg64({ 0xc0000000, 0x1000000 }).EndNode();
    fdt.BeginNode("memory@100000000").String("status", "okay").Reg64({ 0x100000000, 0x40000000 }).EndNode();
    fdt.BeginNode("memoryless").Reg64({ 0x200000000, 0x1000 }).EndNode();
    fdt.BeginNode("reserved-memory").Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
    fdt.BeginNode("tee@48000000").Reg64({ 0x48000000, 0x1000000 }).EndNode();
    fdt.EndNode();
    fdt.AddReservation(0x50000000, 0x100000);
    const auto dtb = fdt.Build();

    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    machine.Write(DtbAddress, dtb);

    auto entry = fake::FdtBuilder::MakeEntryState(DtbAddress);
    entry.es_loader_base = 0x40080000;
    entry.es_loader_size = 0x100000;
    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(entry, machine.GetPhysicalMemory(), ctx.c_Platform).IsSuccess());

    MemoryMap map;
    ASSERT_TRUE(Acquire(ctx.c_Context, nullptr, map).IsSuccess());
    const uint64_t dtb_size = dtb.size();
    ExpectMap(
        map, {
                 { 0x40000000, dtb_size, RegionType::Bootloader },
                 { 0x40000000 + dtb_size, 0x80000 - dtb_size, RegionType::Usable },
                 { 0x40080000, 0x100000, RegionType::Bootloader },
                 { 0x40180000, 0x7e80000, RegionType::Usable },
                 { 0x48000000, 0x1000000, RegionType::Reserved },
                 { 0x49000000, 0x7000000, RegionType::Usable },
                 { 0x50000000, 0x100000, RegionType::Reserved },
                 { 0x50100000, 0x2ff00000, RegionType::Usable },
                 { 0x100000000, 0x40000000, RegionType::Usable },
             });
}

TEST(MemoryMap, AcquireFromDeviceTreeWithSingleCells)
{
    fake::FdtBuilder fdt;
    fdt.Cells("#address-cells", { 1 }).Cells("#size-cells", { 1 });
    fdt.BeginNode("memory").Cells("reg", { 0x40000000, 0x8000000, 0x80000000, 0x8000000 }).EndNode();
    const auto dtb = fdt.Build();

    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    machine.Write(DtbAddress, dtb);

    fake::Context ctx(machine);
    ASSERT_TRUE(platform::Probe(
                    fake::FdtBuilder::MakeEntryState(DtbAddress, ENTRY_MACHINE_RISCV), machine.GetPhysicalMemory(),
                    ctx.c_Platform)
                    .IsSuccess());

    MemoryMap map;
    ASSERT_TRUE(Acquire(ctx.c_Context, nullptr, map).IsSuccess());
    const uint64_t dtb_size = dtb.size();
    ExpectMap(
        map, {
                 { 0x40000000, dtb_size, RegionType::Bootloader },
                 { 0x40000000 + dtb_size, 0x8000000 - dtb_size, RegionType::Usable },
                 { 0x80000000, 0x8000000, RegionType::Usable },
             });
}
