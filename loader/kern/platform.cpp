/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/platform.h"
#include "loader/firmware/fdt.h"
#include "loader/firmware/multiboot.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/trace.h"

namespace platform
{
    namespace
    {
        bool MapArchitecture(const EntryState& entry, Architecture& arch)
        {
            if (entry.es_xlen != 64 || entry.es_big_endian)
                return false;
            switch (entry.es_machine) {
                case ENTRY_MACHINE_X86_64:
                    arch = Architecture::X86_64;
                    return true;
                case ENTRY_MACHINE_AARCH64:
                    arch = Architecture::ARM64;
                    return true;
                case ENTRY_MACHINE_RISCV:
                    arch = Architecture::RISCV64;
                    return true;
            }
            return false;
        }

        bool HasUefi(const EntryState& entry)
        {
            return entry.es_efi_system_table != nullptr &&
                   entry.es_efi_system_table->Hdr.Signature == firmware::efi::EFI_SYSTEM_TABLE_SIGNATURE &&
                   entry.es_efi_system_table->BootServices != nullptr;
        }

        bool HasMultiboot2(const EntryState& entry, const PhysicalMemory& physmem)
        {
            return entry.es_multiboot_magic == MULTIBOOT2_BOOTLOADER_MAGIC &&
                   firmware::multiboot::MapInfo(physmem, entry.es_multiboot_info) != nullptr;
        }

        bool HasDeviceTree(const EntryState& entry, const PhysicalMemory& physmem)
        {
            if (entry.es_dtb == 0)
                return false;
            firmware::fdt::Blob blob;
            return blob.Attach(physmem, entry.es_dtb);
        }

        const STAGE1_INFO* GetStage1Info(const EntryState& entry, const PhysicalMemory& physmem)
        {
            if (entry.es_stage1_info == 0 || entry.es_realmode_call == nullptr)
                return nullptr;
            auto s1 = physmem.MapAs<const STAGE1_INFO>(entry.es_stage1_info);
            if (s1 == nullptr || s1->s1_signature != STAGE1_SIGNATURE)
                return nullptr;
            return s1;
        }

    } // unnamed namespace

    bool SupportsMode(Architecture arch, FirmwareMode mode)
    {
        switch (arch) {
            case Architecture::X86_64:
                return mode == FirmwareMode::LegacyBIOS || mode == FirmwareMode::UEFI ||
                       mode == FirmwareMode::DirectLongMode;
            case Architecture::ARM64:
            case Architecture::RISCV64:
                return mode == FirmwareMode::UEFI || mode == FirmwareMode::DeviceTree;
        }
        return false;
    }

    bool RequiresDeviceTree(Architecture arch) { return arch != Architecture::X86_64; }

    addr_t GetStagingMinimum(const PlatformDescriptor& pd, addr_t ram_start)
    {
        if (pd.pd_arch == Architecture::X86_64)
            return MiB(16);
        return ram_start;
    }

    addr_t GetAllocationMinimum(const PlatformDescriptor& pd)
    {
        // Keep away from the real-mode area; it is reserved anyway
        return pd.pd_arch == Architecture::X86_64 ? MiB(1) : 0;
    }

    const char* ArchitectureName(Architecture arch)
    {
        switch (arch) {
            case Architecture::X86_64:
                return "x86_64";
            case Architecture::ARM64:
                return "arm64";
            case Architecture::RISCV64:
                return "riscv64";
        }
        return "?";
    }

    const char* FirmwareModeName(FirmwareMode mode)
    {
        switch (mode) {
            case FirmwareMode::LegacyBIOS:
                return "bios";
            case FirmwareMode::UEFI:
                return "uefi";
            case FirmwareMode::DirectLongMode:
                return "multiboot2";
            case FirmwareMode::DeviceTree:
                return "device-tree";
        }
        return "?";
    }

    Result Probe(const EntryState& entry, const PhysicalMemory& physmem, PlatformDescriptor& pd)
    {
        pd = PlatformDescriptor{};
        if (!MapArchitecture(entry, pd.pd_arch)) {
            TRACE(PROBE, ERROR, "machine %d, %d bits is not supported", entry.es_machine, entry.es_xlen);
            return RESULT_MAKE_FAILURE(UnsupportedArchitecture);
        }
        pd.pd_pointer_width = entry.es_xlen;
        pd.pd_endian = Endianness::Little;
        pd.pd_loader_base = entry.es_loader_base;
        pd.pd_loader_size = entry.es_loader_size;

        // Fixed order; the first firmware interface that checks out wins
        const auto arch = pd.pd_arch;
        if (SupportsMode(arch, FirmwareMode::UEFI) && HasUefi(entry)) {
            pd.pd_mode = FirmwareMode::UEFI;
            pd.pd_efi_image = entry.es_efi_image_handle;
            pd.pd_efi_system_table = entry.es_efi_system_table;
            // UEFI on ARM64 and RISC-V still hands us a device tree
            pd.pd_dtb = entry.es_dtb;
        } else if (SupportsMode(arch, FirmwareMode::DirectLongMode) && HasMultiboot2(entry, physmem)) {
            pd.pd_mode = FirmwareMode::DirectLongMode;
            pd.pd_multiboot_info = entry.es_multiboot_info;
        } else if (SupportsMode(arch, FirmwareMode::DeviceTree) && HasDeviceTree(entry, physmem)) {
            pd.pd_mode = FirmwareMode::DeviceTree;
            pd.pd_dtb = entry.es_dtb;
        } else if (auto s1 = GetStage1Info(entry, physmem);
                   SupportsMode(arch, FirmwareMode::LegacyBIOS) && s1 != nullptr) {
            pd.pd_mode = FirmwareMode::LegacyBIOS;
            pd.pd_realmode_call = entry.es_realmode_call;
            pd.pd_boot_drive = s1->s1_boot_drive;
            pd.pd_stage1_cmdline = s1->s1_cmdline;
            pd.pd_bounce_buffer = s1->s1_bounce_buffer;
            pd.pd_bounce_size = s1->s1_bounce_size;
        } else {
            TRACE(PROBE, ERROR, "no firmware interface found");
            return RESULT_MAKE_FAILURE(UnknownFirmware);
        }

        TRACE(PROBE, INFO, "%s, %s firmware", ArchitectureName(pd.pd_arch), FirmwareModeName(pd.pd_mode));
        return Result::Success();
    }

} // namespace platform
