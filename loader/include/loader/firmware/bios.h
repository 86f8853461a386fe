/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
/*
 * Legacy BIOS services. The stage-1 code switches to long mode and leaves a
 * thunk behind that drops back to real mode, issues a software interrupt with
 * the given registers and returns the resulting registers. Any buffer the BIOS
 * must see lives in the low-memory bounce buffer stage 1 set aside.
 */
#pragma once

#include <ferry/types.h>
#include "loader/result.h"

class PhysicalMemory;
struct PlatformDescriptor;

struct REALMODE_REGS {
    uint32_t eax;
    uint32_t ebx;
    uint32_t ecx;
    uint32_t edx;
    uint32_t ebp;
    uint32_t esi;
    uint32_t edi;
    uint32_t esp;
    uint16_t ds;
    uint16_t es;
    uint16_t ss;
    uint32_t eflags;
#define EFLAGS_CF (1 << 0) /* Carry flag */
#define EFLAGS_ZF (1 << 6) /* Zero flag */
    uint8_t interrupt;
    uint16_t cs;
    uint16_t ip;
} __attribute__((packed));

/* Left in low memory by stage 1; located through the entry state */
struct STAGE1_INFO {
    /* 00 */ uint32_t s1_signature;
#define STAGE1_SIGNATURE 0x31595246 /* 'FRY1' */
    /* 04 */ uint8_t s1_boot_drive;
    /* 05 */ uint8_t s1_reserved[3];
    /* 08 */ uint32_t s1_cmdline;       /* physical address, 0 if none */
    /* 0c */ uint32_t s1_bounce_buffer; /* physical address, below 1MB */
    /* 10 */ uint32_t s1_bounce_size;
} __attribute__((packed));

/* INT 15h, AX=E820h */
struct E820_ENTRY {
    uint64_t e_base;
    uint64_t e_length;
    uint32_t e_type;
    uint32_t e_attributes;
#define E820_ATTR_ENABLED (1 << 0)
} __attribute__((packed));

/* INT 13h extended read disk address packet */
struct INT13_DAP {
    uint8_t dap_size;
    uint8_t dap_reserved;
    uint16_t dap_count;
    uint16_t dap_offset;
    uint16_t dap_segment;
    uint64_t dap_lba;
} __attribute__((packed));

/* INT 13h AH=48h result buffer */
struct INT13_DRIVE_PARAMETERS {
    uint16_t dp_size;
    uint16_t dp_flags;
#define INT13_DP_FLAG_REMOVABLE (1 << 2)
    uint32_t dp_cylinders;
    uint32_t dp_heads;
    uint32_t dp_sectors_per_track;
    uint64_t dp_total_sectors;
    uint16_t dp_bytes_per_sector;
} __attribute__((packed));

/* VBE 2.0 mode information; only the fields up to PhysBasePtr are used */
struct ModeInfoBlock {
    uint16_t ModeAttributes;
#define VBE_MODEATTR_SUPPORTED (1 << 0)
#define VBE_MODEATTR_GRAPHICS (1 << 4)
#define VBE_MODEATTR_FRAMEBUFFER (1 << 7)
    uint8_t WinAAttributes;
    uint8_t WinBAttributes;
    uint16_t WinGranularity;
    uint16_t WinSize;
    uint16_t WinASegment;
    uint16_t WinBSegment;
    uint32_t WinFuncPtr;
    uint16_t BytesPerScanLine;
    uint16_t XResolution;
    uint16_t YResolution;
    uint8_t XCharSize;
    uint8_t YCharSize;
    uint8_t NumberOfPlanes;
    uint8_t BitsPerPixel;
    uint8_t NumberOfBanks;
    uint8_t MemoryModel;
#define VBE_MEMMODEL_DIRECTCOLOR 6
    uint8_t BankSize;
    uint8_t NumberOfImagePages;
    uint8_t _Reserved0;
    uint8_t RedMaskSize;
    uint8_t RedFieldPosition;
    uint8_t GreenMaskSize;
    uint8_t GreenFieldPosition;
    uint8_t BlueMaskSize;
    uint8_t BlueFieldPosition;
    uint8_t RsvdMaskSize;
    uint8_t RsvdFieldPosition;
    uint8_t DirectColorModeInfo;
    uint32_t PhysBasePtr;
    uint32_t _Reserved1;
    uint16_t _Reserved2;
} __attribute__((packed));

namespace firmware::bios
{
    using RealModeCall = void (*)(REALMODE_REGS& regs);

    static constexpr uint8_t FirstHardDisk = 0x80;
    static constexpr uint8_t LastHardDisk = 0x87;

    // Segment:offset pair for a bounce buffer address
    inline uint16_t Segment(addr_t phys) { return static_cast<uint16_t>(phys >> 4); }
    inline uint16_t Offset(addr_t phys) { return static_cast<uint16_t>(phys & 0xf); }

    void Call(const PlatformDescriptor& platform, uint8_t interrupt, REALMODE_REGS& regs);

    bool HasExtendedDiskServices(const PlatformDescriptor& platform, uint8_t drive);
    bool GetDriveParameters(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, uint8_t drive,
        INT13_DRIVE_PARAMETERS& params);
    Result ReadSectors(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, uint8_t drive, uint64_t lba,
        unsigned int count, unsigned int sector_size, void* buffer);

    // Stores up to 'max' entries; false if the BIOS lacks E820
    bool ReadE820(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, E820_ENTRY* entries, size_t max,
        size_t& count);

    bool GetCurrentVideoMode(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, ModeInfoBlock& mib);

    void PutChar(RealModeCall call, int ch);

} // namespace firmware::bios
