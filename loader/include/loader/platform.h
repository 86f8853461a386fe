/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include "loader/firmware/bios.h"
#include "loader/firmware/efi.h"
#include "loader/result.h"

class PhysicalMemory;

enum class Architecture { X86_64, ARM64, RISCV64 };

enum class FirmwareMode { LegacyBIOS, UEFI, DirectLongMode, DeviceTree };

enum class Endianness { Little, Big };

/* ELF machine numbers, as recorded by the entry stub */
#define ENTRY_MACHINE_X86_64 62
#define ENTRY_MACHINE_AARCH64 183
#define ENTRY_MACHINE_RISCV 243

/*
 * Everything the entry stub saw when firmware handed us control; fields the
 * firmware did not provide are zero.
 */
struct EntryState {
    uint16_t es_machine = 0;   // ENTRY_MACHINE_...
    uint8_t es_xlen = 0;       // pointer width in bits
    bool es_big_endian = false;

    // UEFI
    firmware::efi::EFI_HANDLE es_efi_image_handle = nullptr;
    firmware::efi::EFI_SYSTEM_TABLE* es_efi_system_table = nullptr;

    // Multiboot2; %eax and %ebx at entry
    uint32_t es_multiboot_magic = 0;
    addr_t es_multiboot_info = 0;

    // Device tree blob passed in x0 / a1
    addr_t es_dtb = 0;

    // Legacy BIOS
    addr_t es_stage1_info = 0;
    firmware::bios::RealModeCall es_realmode_call = nullptr;

    // Where the loader itself resides
    addr_t es_loader_base = 0;
    uint64_t es_loader_size = 0;
};

struct PlatformDescriptor {
    Architecture pd_arch = Architecture::X86_64;
    FirmwareMode pd_mode = FirmwareMode::LegacyBIOS;
    unsigned int pd_pointer_width = 64;
    Endianness pd_endian = Endianness::Little;

    // Firmware cookies
    firmware::efi::EFI_HANDLE pd_efi_image = nullptr;
    firmware::efi::EFI_SYSTEM_TABLE* pd_efi_system_table = nullptr;
    addr_t pd_multiboot_info = 0;
    addr_t pd_dtb = 0;

    firmware::bios::RealModeCall pd_realmode_call = nullptr;
    addr_t pd_bounce_buffer = 0;
    uint32_t pd_bounce_size = 0;
    uint8_t pd_boot_drive = 0;
    addr_t pd_stage1_cmdline = 0;

    addr_t pd_loader_base = 0;
    uint64_t pd_loader_size = 0;
};

namespace platform
{
    Result Probe(const EntryState& entry, const PhysicalMemory& physmem, PlatformDescriptor& pd);

    bool SupportsMode(Architecture arch, FirmwareMode mode);
    bool RequiresDeviceTree(Architecture arch);

    // Lowest address the kernel may be staged at, and the lowest address for loader allocations
    addr_t GetStagingMinimum(const PlatformDescriptor& pd, addr_t ram_start);
    addr_t GetAllocationMinimum(const PlatformDescriptor& pd);

    const char* ArchitectureName(Architecture arch);
    const char* FirmwareModeName(FirmwareMode mode);

} // namespace platform
