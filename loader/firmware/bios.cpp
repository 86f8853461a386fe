/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/firmware/bios.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/trace.h"

namespace firmware::bios
{
    namespace
    {
        constexpr uint32_t SMAP = 0x534d4150; /* 'SMAP' */
        constexpr unsigned int MaxSectorsPerRead = 127;

        bool Succeeded(const REALMODE_REGS& regs) { return (regs.eflags & EFLAGS_CF) == 0; }

    } // unnamed namespace

    void Call(const PlatformDescriptor& platform, uint8_t interrupt, REALMODE_REGS& regs)
    {
        regs.interrupt = interrupt;
        platform.pd_realmode_call(regs);
    }

    bool HasExtendedDiskServices(const PlatformDescriptor& platform, uint8_t drive)
    {
        REALMODE_REGS regs{};
        regs.eax = 0x4100;
        regs.ebx = 0x55aa;
        regs.edx = drive;
        Call(platform, 0x13, regs);
        return Succeeded(regs) && (regs.ebx & 0xffff) == 0xaa55 && (regs.ecx & 1) != 0;
    }

    bool GetDriveParameters(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, uint8_t drive,
        INT13_DRIVE_PARAMETERS& params)
    {
        const addr_t buffer = platform.pd_bounce_buffer;
        INT13_DRIVE_PARAMETERS request{};
        request.dp_size = 0x1e;
        if (!physmem.Write(buffer, &request, sizeof(request)))
            return false;

        REALMODE_REGS regs{};
        regs.eax = 0x4800;
        regs.edx = drive;
        regs.ds = Segment(buffer);
        regs.esi = Offset(buffer);
        Call(platform, 0x13, regs);
        if (!Succeeded(regs))
            return false;
        return physmem.Read(buffer, &params, sizeof(params));
    }

    Result ReadSectors(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, uint8_t drive, uint64_t lba,
        unsigned int count, unsigned int sector_size, void* buffer)
    {
        // The disk address packet comes first, the data follows it
        const addr_t dap_phys = platform.pd_bounce_buffer;
        const addr_t data_phys = dap_phys + sizeof(INT13_DAP);
        if (sector_size == 0 || platform.pd_bounce_size <= sizeof(INT13_DAP))
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        unsigned int per_read = (platform.pd_bounce_size - sizeof(INT13_DAP)) / sector_size;
        if (per_read > MaxSectorsPerRead)
            per_read = MaxSectorsPerRead;
        if (per_read == 0)
            return RESULT_MAKE_FAILURE(DeviceReadFailed);

        auto dest = static_cast<uint8_t*>(buffer);
        while (count > 0) {
            const unsigned int chunk = count < per_read ? count : per_read;

            INT13_DAP dap{};
            dap.dap_size = sizeof(dap);
            dap.dap_count = chunk;
            dap.dap_segment = Segment(data_phys);
            dap.dap_offset = Offset(data_phys);
            dap.dap_lba = lba;
            if (!physmem.Write(dap_phys, &dap, sizeof(dap)))
                return RESULT_MAKE_FAILURE(DeviceReadFailed);

            REALMODE_REGS regs{};
            regs.eax = 0x4200;
            regs.edx = drive;
            regs.ds = Segment(dap_phys);
            regs.esi = Offset(dap_phys);
            Call(platform, 0x13, regs);
            if (!Succeeded(regs)) {
                TRACE(
                    FIRMWARE, ERROR, "drive %x: read of lba %llu failed, status %x", drive,
                    static_cast<unsigned long long>(lba), (regs.eax >> 8) & 0xff);
                return RESULT_MAKE_FAILURE(DeviceReadFailed);
            }

            if (!physmem.Read(data_phys, dest, static_cast<uint64_t>(chunk) * sector_size))
                return RESULT_MAKE_FAILURE(DeviceReadFailed);
            dest += static_cast<size_t>(chunk) * sector_size;
            lba += chunk;
            count -= chunk;
        }
        return Result::Success();
    }

    bool ReadE820(
        const PlatformDescriptor& platform, PhysicalMemory& physmem, E820_ENTRY* entries, size_t max,
        size_t& count)
    {
        const addr_t buffer = platform.pd_bounce_buffer;
        count = 0;

        uint32_t continuation = 0;
        do {
            E820_ENTRY entry{};
            entry.e_attributes = E820_ATTR_ENABLED;
            if (!physmem.Write(buffer, &entry, sizeof(entry)))
                return false;

            REALMODE_REGS regs{};
            regs.eax = 0xe820;
            regs.edx = SMAP;
            regs.ebx = continuation;
            regs.ecx = sizeof(E820_ENTRY);
            regs.es = Segment(buffer);
            regs.edi = Offset(buffer);
            Call(platform, 0x15, regs);
            if (!Succeeded(regs) || regs.eax != SMAP)
                return count > 0; // carry on the first call means no E820

            if (!physmem.Read(buffer, &entry, sizeof(entry)))
                return false;
            if (regs.ecx < 20)
                return false;
            if (regs.ecx < sizeof(E820_ENTRY))
                entry.e_attributes = E820_ATTR_ENABLED;

            if (entry.e_attributes & E820_ATTR_ENABLED) {
                if (count == max) {
                    TRACE(FIRMWARE, WARN, "more than %d E820 entries, ignoring the rest", static_cast<int>(max));
                    return true;
                }
                entries[count++] = entry;
            }
            continuation = regs.ebx;
        } while (continuation != 0);
        return true;
    }

    bool GetCurrentVideoMode(const PlatformDescriptor& platform, PhysicalMemory& physmem, ModeInfoBlock& mib)
    {
        REALMODE_REGS regs{};
        regs.eax = 0x4f03;
        Call(platform, 0x10, regs);
        if ((regs.eax & 0xffff) != 0x004f)
            return false;
        const uint16_t mode = regs.ebx & 0x3fff;

        const addr_t buffer = platform.pd_bounce_buffer;
        regs = REALMODE_REGS{};
        regs.eax = 0x4f01;
        regs.ecx = mode;
        regs.es = Segment(buffer);
        regs.edi = Offset(buffer);
        Call(platform, 0x10, regs);
        if ((regs.eax & 0xffff) != 0x004f)
            return false;
        return physmem.Read(buffer, &mib, sizeof(mib));
    }

    void PutChar(RealModeCall call, int ch)
    {
        REALMODE_REGS regs{};
        regs.eax = 0x0e00 | (ch & 0xff);
        regs.ebx = 0x0007;
        regs.interrupt = 0x10;
        call(regs);
    }

} // namespace firmware::bios
