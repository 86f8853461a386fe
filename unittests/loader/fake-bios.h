/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "loader/firmware/bios.h"
#include "loader/physmem.h"
#include "loader/platform.h"

namespace fake
{
    struct BiosDisk {
        uint8_t d_drive = 0x80;
        uint16_t d_sector_size = 512;
        bool d_removable = false;
        bool d_fail_reads = false;
        std::vector<uint8_t> d_data;
    };

    /*
     * Real-mode services as seen through the stage-1 thunk: INT 13h extended
     * disk services, INT 15h E820 and the bits of INT 10h we use. Only one
     * instance may exist at a time, as the thunk takes no context.
     */
    class Bios
    {
      public:
        static constexpr addr_t Stage1Info = 0x500;
        static constexpr addr_t CommandLine = 0x600;
        static constexpr addr_t BounceBuffer = 0x1000;
        static constexpr uint32_t BounceSize = 0x8000;

        explicit Bios(PhysicalMemory& physmem) : b_PhysMem(physmem) { current = this; }
        ~Bios() { current = nullptr; }
        Bios(const Bios&) = delete;
        Bios& operator=(const Bios&) = delete;

        BiosDisk& AddDisk(uint8_t drive, size_t size)
        {
            BiosDisk disk;
            disk.d_drive = drive;
            disk.d_data.resize(size);
            b_Disks.push_back(disk);
            return b_Disks.back();
        }

        BiosDisk* FindDisk(uint8_t drive)
        {
            for (auto& disk : b_Disks)
                if (disk.d_drive == drive)
                    return &disk;
            return nullptr;
        }

        void AddE820(uint64_t base, uint64_t length, uint32_t type)
        {
            E820_ENTRY e{};
            e.e_base = base;
            e.e_length = length;
            e.e_type = type;
            e.e_attributes = E820_ATTR_ENABLED;
            b_E820.push_back(e);
        }

        // Writes the stage-1 information block; the low 64KB must be backed
        void WriteStage1(uint8_t boot_drive, const char* cmdline = nullptr)
        {
            STAGE1_INFO s1{};
            s1.s1_signature = STAGE1_SIGNATURE;
            s1.s1_boot_drive = boot_drive;
            s1.s1_bounce_buffer = BounceBuffer;
            s1.s1_bounce_size = BounceSize;
            if (cmdline != nullptr) {
                s1.s1_cmdline = CommandLine;
                ASSERT_TRUE(b_PhysMem.Write(CommandLine, cmdline, strlen(cmdline) + 1));
            }
            ASSERT_TRUE(b_PhysMem.Write(Stage1Info, &s1, sizeof(s1)));
        }

        EntryState MakeEntryState() const
        {
            EntryState entry;
            entry.es_machine = ENTRY_MACHINE_X86_64;
            entry.es_xlen = 64;
            entry.es_stage1_info = Stage1Info;
            entry.es_realmode_call = &Bios::Call;
            entry.es_loader_base = 0x10000;
            entry.es_loader_size = 0x10000;
            return entry;
        }

        static void Call(REALMODE_REGS& regs) { current->Handle(regs); }

        unsigned int GetReadCalls() const { return b_ReadCalls; }
        const std::string& GetTeletype() const { return b_Teletype; }

      private:
        static addr_t Linear(uint16_t segment, uint32_t offset) { return (static_cast<addr_t>(segment) << 4) + (offset & 0xffff); }

        static void Fail(REALMODE_REGS& regs, uint8_t status)
        {
            regs.eflags = regs.eflags | EFLAGS_CF;
            regs.eax = (regs.eax & 0xffff00ff) | (static_cast<uint32_t>(status) << 8);
        }

        static void Succeed(REALMODE_REGS& regs) { regs.eflags = regs.eflags & ~EFLAGS_CF; }

        void Handle(REALMODE_REGS& regs)
        {
            switch (regs.interrupt) {
                case 0x10:
                    HandleVideo(regs);
                    break;
                case 0x13:
                    HandleDisk(regs);
                    break;
                case 0x15:
                    HandleE820(regs);
                    break;
                default:
                    Fail(regs, 0x86);
                    break;
            }
        }

        void HandleVideo(REALMODE_REGS& regs)
        {
            const uint32_t ax = regs.eax & 0xffff;
            if ((ax >> 8) == 0x0e) {
                b_Teletype += static_cast<char>(ax & 0xff);
                return;
            }
            // No VBE
            regs.eax = (regs.eax & 0xffff0000) | 0x014f;
        }

        void HandleDisk(REALMODE_REGS& regs)
        {
            const uint8_t function = (regs.eax >> 8) & 0xff;
            auto disk = FindDisk(regs.edx & 0xff);
            if (disk == nullptr) {
                Fail(regs, 0x01);
                return;
            }

            switch (function) {
                case 0x41:
                    regs.ebx = 0xaa55;
                    regs.ecx = 1; // extended disk access
                    Succeed(regs);
                    return;
                case 0x48: {
                    INT13_DRIVE_PARAMETERS params{};
                    params.dp_size = 0x1e;
                    params.dp_flags = disk->d_removable ? INT13_DP_FLAG_REMOVABLE : 0;
                    params.dp_total_sectors = disk->d_data.size() / disk->d_sector_size;
                    params.dp_bytes_per_sector = disk->d_sector_size;
                    if (!b_PhysMem.Write(Linear(regs.ds, regs.esi), &params, sizeof(params))) {
                        Fail(regs, 0x01);
                        return;
                    }
                    Succeed(regs);
                    return;
                }
                case 0x42: {
                    INT13_DAP dap;
                    if (!b_PhysMem.Read(Linear(regs.ds, regs.esi), &dap, sizeof(dap)) || disk->d_fail_reads) {
                        Fail(regs, 0x04);
                        return;
                    }
                    const uint64_t offset = dap.dap_lba * disk->d_sector_size;
                    const uint64_t length = static_cast<uint64_t>(dap.dap_count) * disk->d_sector_size;
                    if (dap.dap_count > 127 || offset + length > disk->d_data.size() ||
                        !b_PhysMem.Write(Linear(dap.dap_segment, dap.dap_offset), &disk->d_data[offset], length)) {
                        Fail(regs, 0x04);
                        return;
                    }
                    ++b_ReadCalls;
                    Succeed(regs);
                    return;
                }
            }
            Fail(regs, 0x01);
        }

        void HandleE820(REALMODE_REGS& regs)
        {
            constexpr uint32_t SMAP = 0x534d4150;
            const size_t index = regs.ebx;
            if (regs.eax != 0xe820 || regs.edx != SMAP || index >= b_E820.size() || regs.ecx < 20) {
                Fail(regs, 0x86);
                return;
            }
            if (!b_PhysMem.Write(Linear(regs.es, regs.edi), &b_E820[index], sizeof(E820_ENTRY))) {
                Fail(regs, 0x86);
                return;
            }
            regs.eax = SMAP;
            regs.ecx = sizeof(E820_ENTRY);
            regs.ebx = index + 1 < b_E820.size() ? index + 1 : 0;
            Succeed(regs);
        }

        inline static Bios* current = nullptr;

        PhysicalMemory& b_PhysMem;
        std::vector<BiosDisk> b_Disks;
        std::vector<E820_ENTRY> b_E820;
        unsigned int b_ReadCalls = 0;
        std::string b_Teletype;
    };

} // namespace fake
