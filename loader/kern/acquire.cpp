/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/memorymap.h"
#include "loader/firmware/fdt.h"
#include "loader/firmware/multiboot.h"
#include "loader/framebuffer.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"

namespace memmap
{
    namespace
    {
        bool AddRaw(
            RawMemoryMap& raw, addr_t base, uint64_t length, RegionType type, uint32_t attributes = 0,
            Source source = Source::Firmware)
        {
            if (length == 0)
                return true;
            RawRegion rr;
            rr.rr_region = MemoryRegion{ base, length, type, attributes };
            rr.rr_source = source;
            if (!raw.push_back(rr)) {
                TRACE(MEMMAP, ERROR, "more than %d raw memory descriptors", static_cast<int>(MaxRawRegions));
                return false;
            }
            return true;
        }

        Result FromUefi(const LoaderContext& lc, RawMemoryMap& raw)
        {
            using namespace firmware::efi;
            auto& scratch = lc.lc_scratch;
            MemoryMapInfo info;
            if (!GetMemoryMap(
                    lc.lc_platform.pd_efi_system_table, scratch.s_firmware, sizeof(scratch.s_firmware), info))
                return RESULT_MAKE_FAILURE(NoMemoryMap);

            for (UINTN offset = 0; offset + info.mmi_descriptor_size <= info.mmi_size;
                 offset += info.mmi_descriptor_size) {
                auto md = reinterpret_cast<const EFI_MEMORY_DESCRIPTOR*>(scratch.s_firmware + offset);
                const auto r = FromEfiDescriptor(md->Type, md->PhysicalStart, md->NumberOfPages, md->Attribute);
                if (!AddRaw(raw, r.mr_base, r.mr_length, r.mr_type, r.mr_attributes))
                    return RESULT_MAKE_FAILURE(MemoryMapTooLarge);
            }
            return Result::Success();
        }

        Result FromMultiboot(const LoaderContext& lc, RawMemoryMap& raw)
        {
            const auto& physmem = lc.lc_physmem;
            const addr_t info = lc.lc_platform.pd_multiboot_info;
            auto mi = firmware::multiboot::MapInfo(physmem, info);
            if (mi == nullptr)
                return RESULT_MAKE_FAILURE(NoMemoryMap);

            bool have_mmap = false, ok = true;
            firmware::multiboot::ForEachTag(physmem, info, [&](const MULTIBOOT2_TAG& tag) {
                switch (tag.mt_type) {
                    case MULTIBOOT2_TAG_TYPE_MMAP: {
                        auto mm = reinterpret_cast<const MULTIBOOT2_TAG_MMAP*>(&tag);
                        if (tag.mt_size < sizeof(*mm) || mm->mm_entry_size < sizeof(MULTIBOOT2_MMAP_ENTRY))
                            return;
                        auto base = reinterpret_cast<const uint8_t*>(&tag);
                        for (uint32_t offset = sizeof(*mm); offset + mm->mm_entry_size <= tag.mt_size;
                             offset += mm->mm_entry_size) {
                            auto me = reinterpret_cast<const MULTIBOOT2_MMAP_ENTRY*>(base + offset);
                            ok &= AddRaw(raw, me->me_base, me->me_length, FromE820Type(me->me_type));
                        }
                        have_mmap = true;
                        break;
                    }
                    case MULTIBOOT2_TAG_TYPE_MODULE: {
                        auto mod = reinterpret_cast<const MULTIBOOT2_TAG_MODULE*>(&tag);
                        if (tag.mt_size >= sizeof(*mod) && mod->mm_mod_end > mod->mm_mod_start)
                            ok &= AddRaw(
                                raw, mod->mm_mod_start, mod->mm_mod_end - mod->mm_mod_start,
                                RegionType::Bootloader);
                        break;
                    }
                }
            });
            // The information structure must survive until the kernel has parsed our boot info
            ok &= AddRaw(raw, info, mi->mi_total_size, RegionType::Bootloader);

            if (!ok)
                return RESULT_MAKE_FAILURE(MemoryMapTooLarge);
            if (!have_mmap) {
                TRACE(MEMMAP, ERROR, "multiboot information lacks a memory map");
                return RESULT_MAKE_FAILURE(NoMemoryMap);
            }
            return Result::Success();
        }

        Result FromE820(const LoaderContext& lc, RawMemoryMap& raw)
        {
            auto entries = reinterpret_cast<E820_ENTRY*>(lc.lc_scratch.s_firmware);
            const size_t max = sizeof(lc.lc_scratch.s_firmware) / sizeof(E820_ENTRY);
            size_t count;
            if (!firmware::bios::ReadE820(lc.lc_platform, lc.lc_physmem, entries, max, count))
                return RESULT_MAKE_FAILURE(NoMemoryMap);

            for (size_t n = 0; n < count; n++) {
                if (!AddRaw(raw, entries[n].e_base, entries[n].e_length, FromE820Type(entries[n].e_type)))
                    return RESULT_MAKE_FAILURE(MemoryMapTooLarge);
            }
            return Result::Success();
        }

        // Adds every (address, size) pair of 'reg' as 'type'
        bool AddRegProperty(
            RawMemoryMap& raw, const firmware::fdt::Property& reg, unsigned int acells, unsigned int scells,
            RegionType type)
        {
            const unsigned int tuple = acells + scells;
            if (!reg.IsValid() || tuple == 0)
                return true;
            for (unsigned int n = 0; (n + tuple) * 4 <= reg.p_length; n += tuple) {
                const uint64_t base = reg.GetCells(n, acells);
                const uint64_t size = reg.GetCells(n + acells, scells);
                if (!AddRaw(raw, base, size, type))
                    return false;
            }
            return true;
        }

        Result FromDeviceTree(const LoaderContext& lc, RawMemoryMap& raw)
        {
            using namespace firmware::fdt;
            Blob blob;
            if (!blob.Attach(lc.lc_physmem, lc.lc_platform.pd_dtb))
                return RESULT_MAKE_FAILURE(NoMemoryMap);

            const Node root = blob.GetRoot();
            const unsigned int acells = blob.GetAddressCells(root);
            const unsigned int scells = blob.GetSizeCells(root);

            bool ok = true;
            blob.ForEachChild(root, [&](Node node) {
                const char* name = blob.GetName(node);
                if (strncmp(name, "memory", 6) != 0 || (name[6] != '\0' && name[6] != '@'))
                    return;
                if (auto status = blob.GetProperty(node, "status").AsString();
                    status != nullptr && strcmp(status, "okay") != 0)
                    return;
                ok &= AddRegProperty(raw, blob.GetProperty(node, "reg"), acells, scells, RegionType::Usable);
            });

            if (const Node rsv = blob.FindNode("/reserved-memory"); rsv != InvalidNode) {
                const unsigned int rsv_acells = blob.GetAddressCells(rsv);
                const unsigned int rsv_scells = blob.GetSizeCells(rsv);
                blob.ForEachChild(rsv, [&](Node node) {
                    ok &= AddRegProperty(
                        raw, blob.GetProperty(node, "reg"), rsv_acells, rsv_scells, RegionType::Reserved);
                });
            }

            blob.ForEachReservation(
                [&](uint64_t address, uint64_t size) { ok &= AddRaw(raw, address, size, RegionType::Reserved); });
            ok &= AddRaw(raw, lc.lc_platform.pd_dtb, blob.GetTotalSize(), RegionType::Bootloader);
            return ok ? Result::Success() : RESULT_MAKE_FAILURE(MemoryMapTooLarge);
        }

    } // unnamed namespace

    MemoryRegion FromEfiDescriptor(uint32_t type, addr_t base, uint64_t pages, uint64_t attributes)
    {
        using namespace firmware::efi;
        MemoryRegion r;
        r.mr_base = base;
        r.mr_length = pages * PAGE_SIZE;
        if (pages > (~static_cast<uint64_t>(0) / PAGE_SIZE))
            r.mr_length = ~static_cast<uint64_t>(0) - base; // clipped by Normalize()
        if (attributes & EFI_MEMORY_RUNTIME)
            r.mr_attributes |= attribute::Runtime;

        switch (type) {
            case EfiConventionalMemory:
                r.mr_type = RegionType::Usable;
                break;
            case EfiLoaderCode:
            case EfiLoaderData:
            case EfiBootServicesCode:
            case EfiBootServicesData:
                r.mr_type = RegionType::Bootloader;
                break;
            case EfiRuntimeServicesCode:
            case EfiRuntimeServicesData:
                r.mr_type = RegionType::Reserved;
                r.mr_attributes |= attribute::Runtime;
                break;
            case EfiACPIReclaimMemory:
                r.mr_type = RegionType::AcpiReclaim;
                break;
            case EfiACPIMemoryNVS:
                r.mr_type = RegionType::AcpiNvs;
                break;
            case EfiUnusableMemory:
                r.mr_type = RegionType::BadRam;
                break;
            case EfiPersistentMemory:
                r.mr_type = RegionType::Reserved;
                r.mr_attributes |= attribute::NonVolatile;
                break;
            default:
                r.mr_type = RegionType::Reserved;
                break;
        }
        return r;
    }

    Result Acquire(const LoaderContext& lc, const Framebuffer* fb, MemoryMap& map)
    {
        const auto& pd = lc.lc_platform;
        auto& raw = lc.lc_scratch.s_raw_map;
        raw.clear();

        Result result = Result::Success();
        switch (pd.pd_mode) {
            case FirmwareMode::UEFI:
                result = FromUefi(lc, raw);
                break;
            case FirmwareMode::DirectLongMode:
                result = FromMultiboot(lc, raw);
                break;
            case FirmwareMode::LegacyBIOS:
                result = FromE820(lc, raw);
                break;
            case FirmwareMode::DeviceTree:
                result = FromDeviceTree(lc, raw);
                break;
        }
        if (result.IsFailure())
            return result;

        bool ok = AddRaw(raw, pd.pd_loader_base, pd.pd_loader_size, RegionType::Bootloader);
        if (fb != nullptr)
            ok &= AddRaw(raw, fb->fb_base, fb->GetSize(), RegionType::Framebuffer, attribute::WriteCombine);
        // Real-mode IVT, BDA, EBDA and option ROMs
        if (pd.pd_arch == Architecture::X86_64)
            ok &= AddRaw(raw, 0, MiB(1), RegionType::Reserved, 0, Source::Architectural);
        if (!ok)
            return RESULT_MAKE_FAILURE(MemoryMapTooLarge);

        TRACE(MEMMAP, INFO, "%d raw descriptors", static_cast<int>(raw.size()));
        RESULT_PROPAGATE_FAILURE(Normalize(raw, map));
        if (trace::IsEnabled(trace::SubSystem::MEMMAP, trace::level::INFO))
            Dump(map);
        return Result::Success();
    }

} // namespace memmap
