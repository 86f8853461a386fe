/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <ferry/util/fixed_vector.h>
#include "loader/firmware/efi.h"
#include "loader/platform.h"
#include "loader/result.h"

struct LoaderContext;

enum class DeviceKind { HardDisk, SSD, USB, CDROM, Network, SDCard, eMMC, SPI, Firmware };

/*
 * How blocks are read from a device. This is a closed set: every read
 * switches on bs_type, and only the fields of that type are meaningful.
 */
struct BlockSource {
    enum class Type { UefiBlockIo, BiosDisk, MmioWindow, FirmwareBlob };
    Type bs_type = Type::FirmwareBlob;
    uint32_t bs_block_size = 512;
    uint64_t bs_block_count = 0;

    // UefiBlockIo; bs_block_io is null for file-system-only handles
    firmware::efi::EFI_HANDLE bs_handle = nullptr;
    firmware::efi::EFI_BLOCK_IO_PROTOCOL* bs_block_io = nullptr;
    firmware::efi::EFI_SIMPLE_FILE_SYSTEM_PROTOCOL* bs_file_system = nullptr;

    // BiosDisk
    uint8_t bs_drive = 0;

    // MmioWindow and FirmwareBlob
    addr_t bs_base = 0;
    uint64_t bs_length = 0;
    unsigned int bs_module = 0; // index of the multiboot module
};

struct BootDevice {
    static constexpr size_t NameLength = 32;

    DeviceKind bd_kind = DeviceKind::HardDisk;
    BlockSource bd_source;
    uint32_t bd_modes = 0; // bitmask of bootdevice::ModeBit()
    int bd_priority = 0;
    bool bd_removable = false;
    bool bd_bootable = true;
    char bd_name[NameLength] = {};
};

// Where on a device the kernel (or a module) lives
struct Locator {
    static constexpr size_t MaxPathLength = 128;
    enum class Type { Path, Lba, Module };

    Type l_type = Type::Lba;
    char l_path[MaxPathLength] = {};
    uint64_t l_lba = 0;    // in 512-byte units
    uint64_t l_length = 0; // 0 if up to the end of the medium
    unsigned int l_module = 0;
};

namespace bootdevice
{
    static constexpr size_t MaxDevices = 32;
    static constexpr uint64_t LbaUnit = 512;

    using DeviceList = util::fixed_vector<BootDevice, MaxDevices>;

    // Identifies a device across enumerations
    struct DeviceId {
        BlockSource::Type id_type;
        uint64_t id_value;

        friend bool operator==(const DeviceId& a, const DeviceId& b)
        {
            return a.id_type == b.id_type && a.id_value == b.id_value;
        }
    };
    using ExcludeList = util::fixed_vector<DeviceId, MaxDevices>;

    inline uint32_t ModeBit(FirmwareMode mode) { return 1u << static_cast<unsigned int>(mode); }

    int DefaultPriority(DeviceKind kind);
    const char* KindName(DeviceKind kind);
    DeviceId GetId(const BootDevice& device);

    // Accepts '\path' or '/path', 'lba:<start>[+<bytes>]' and 'mod:<n>'
    bool ParseLocator(const char* s, Locator& locator);
    void GetDefaultLocator(const PlatformDescriptor& pd, Locator& locator);

    Result Enumerate(const LoaderContext& lc, DeviceList& devices);

    /*
     * Picks the bootable device with the lowest priority that supports 'mode',
     * is not excluded and has something at 'locator'; ties keep enumeration
     * order.
     */
    Result Select(
        const LoaderContext& lc, const DeviceList& devices, FirmwareMode mode, const Locator& locator,
        const ExcludeList& exclude, size_t& index);

    // Whether 'locator' can refer to data on 'device' at all
    bool CanLocate(const BootDevice& device, const Locator& locator);

    /*
     * A contiguous byte range on a device: the file a path refers to, the
     * medium from an LBA onwards, or a firmware-provided blob.
     */
    class Stream
    {
      public:
        explicit Stream(const LoaderContext& lc) : st_Context(lc) {}
        ~Stream() { Close(); }
        Stream(const Stream&) = delete;
        Stream& operator=(const Stream&) = delete;

        Result Open(const BootDevice& device, const Locator& locator);
        void Close();

        uint64_t GetSize() const { return st_Size; }
        Result Read(uint64_t offset, void* dest, uint64_t length);

        // Stores the physical address of the data if it is directly addressable
        bool GetDirectAddress(addr_t& address) const;

      private:
        Result ReadMedium(uint64_t offset, uint8_t* dest, uint64_t length);
        Result ReadBlocks(uint64_t block, uint64_t count, void* dest);
        Result ReadFile(uint64_t offset, void* dest, uint64_t length);

        const LoaderContext& st_Context;
        BootDevice st_Device;
        uint64_t st_Start = 0; // byte offset on the medium
        uint64_t st_Size = 0;
        firmware::efi::EFI_FILE_PROTOCOL* st_File = nullptr;
        bool st_Open = false;
    };

} // namespace bootdevice
