/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/bootdevice.h"
#include "loader/firmware/bios.h"
#include "loader/firmware/fdt.h"
#include "loader/firmware/multiboot.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/scratch.h"
#include "loader/trace.h"
#include <ferry/util/algorithm.h>
#include <ferry/util/checked.h>
#include <ferry/util/utility.h>

namespace bootdevice
{
    namespace
    {
        constexpr size_t MaxHandles = 64;
        constexpr uint32_t CdromSectorSize = 2048;

        bool Add(DeviceList& devices, const BootDevice& device)
        {
            if (!devices.push_back(device)) {
                TRACE(DEVICE, WARN, "more than %d devices, ignoring '%s'", static_cast<int>(MaxDevices), device.bd_name);
                return false;
            }
            TRACE(
                DEVICE, INFO, "%s: %s, priority %d%s", device.bd_name, KindName(device.bd_kind), device.bd_priority,
                device.bd_bootable ? "" : " (not bootable)");
            return true;
        }

        BootDevice MakeDevice(DeviceKind kind, FirmwareMode mode)
        {
            BootDevice device;
            device.bd_kind = kind;
            device.bd_modes = ModeBit(mode);
            device.bd_priority = DefaultPriority(kind);
            device.bd_removable = kind == DeviceKind::USB || kind == DeviceKind::CDROM || kind == DeviceKind::SDCard;
            device.bd_bootable = kind != DeviceKind::Network;
            return device;
        }

        bool ParseNumber(const char* s, const char** end, uint64_t& value)
        {
            if (*s < '0' || *s > '9')
                return false;
            char* e;
            value = strtoull(s, &e, 0);
            *end = e;
            return true;
        }

        void EnumerateUefi(const LoaderContext& lc, DeviceList& devices)
        {
            using namespace firmware::efi;
            auto st = lc.lc_platform.pd_efi_system_table;

            // The device we were loaded from is preferred over everything else
            EFI_HANDLE boot_handle = nullptr;
            if (auto li = static_cast<EFI_LOADED_IMAGE_PROTOCOL*>(
                    GetProtocol(st, lc.lc_platform.pd_efi_image, LoadedImageProtocolGuid));
                li != nullptr)
                boot_handle = li->DeviceHandle;

            EFI_HANDLE handles[MaxHandles];
            const size_t num_blockio = LocateHandles(st, BlockIoProtocolGuid, handles, MaxHandles);
            for (size_t n = 0; n < num_blockio; n++) {
                auto bio = static_cast<EFI_BLOCK_IO_PROTOCOL*>(GetProtocol(st, handles[n], BlockIoProtocolGuid));
                if (bio == nullptr || bio->Media == nullptr || !bio->Media->MediaPresent)
                    continue;
                auto fs = static_cast<EFI_SIMPLE_FILE_SYSTEM_PROTOCOL*>(
                    GetProtocol(st, handles[n], SimpleFileSystemProtocolGuid));
                if (bio->Media->LogicalPartition && fs == nullptr)
                    continue;

                DeviceKind kind = DeviceKind::HardDisk;
                if (bio->Media->BlockSize == CdromSectorSize)
                    kind = DeviceKind::CDROM;
                else if (bio->Media->RemovableMedia)
                    kind = DeviceKind::USB;
                auto device = MakeDevice(kind, FirmwareMode::UEFI);
                device.bd_removable = bio->Media->RemovableMedia != 0;
                device.bd_source.bs_type = BlockSource::Type::UefiBlockIo;
                device.bd_source.bs_handle = handles[n];
                device.bd_source.bs_block_io = bio;
                device.bd_source.bs_file_system = fs;
                device.bd_source.bs_block_size = bio->Media->BlockSize;
                device.bd_source.bs_block_count = bio->Media->LastBlock + 1;
                if (handles[n] == boot_handle)
                    device.bd_priority = 0;
                snprintf(device.bd_name, sizeof(device.bd_name), "blk%d", static_cast<int>(n));
                if (!Add(devices, device))
                    return;
            }

            // File systems whose handle has no block I/O protocol
            const size_t num_fs = LocateHandles(st, SimpleFileSystemProtocolGuid, handles, MaxHandles);
            for (size_t n = 0; n < num_fs; n++) {
                auto it = util::find_if(devices, [&](const BootDevice& d) {
                    return d.bd_source.bs_type == BlockSource::Type::UefiBlockIo &&
                           d.bd_source.bs_handle == handles[n];
                });
                if (it != devices.end())
                    continue;
                auto fs = static_cast<EFI_SIMPLE_FILE_SYSTEM_PROTOCOL*>(
                    GetProtocol(st, handles[n], SimpleFileSystemProtocolGuid));
                if (fs == nullptr)
                    continue;

                auto device = MakeDevice(DeviceKind::HardDisk, FirmwareMode::UEFI);
                device.bd_source.bs_type = BlockSource::Type::UefiBlockIo;
                device.bd_source.bs_handle = handles[n];
                device.bd_source.bs_file_system = fs;
                if (handles[n] == boot_handle)
                    device.bd_priority = 0;
                snprintf(device.bd_name, sizeof(device.bd_name), "fs%d", static_cast<int>(n));
                if (!Add(devices, device))
                    return;
            }

            const size_t num_net = LocateHandles(st, SimpleNetworkProtocolGuid, handles, MaxHandles);
            for (size_t n = 0; n < num_net; n++) {
                auto device = MakeDevice(DeviceKind::Network, FirmwareMode::UEFI);
                device.bd_source.bs_type = BlockSource::Type::UefiBlockIo;
                device.bd_source.bs_handle = handles[n];
                snprintf(device.bd_name, sizeof(device.bd_name), "net%d", static_cast<int>(n));
                if (!Add(devices, device))
                    return;
            }
        }

        bool AddBiosDrive(const LoaderContext& lc, DeviceList& devices, uint8_t drive)
        {
            const auto& pd = lc.lc_platform;
            if (!firmware::bios::HasExtendedDiskServices(pd, drive))
                return true;
            INT13_DRIVE_PARAMETERS params{};
            if (!firmware::bios::GetDriveParameters(pd, lc.lc_physmem, drive, params))
                return true;
            if (params.dp_bytes_per_sector == 0 || params.dp_bytes_per_sector > Scratch::MaxBlockSize)
                return true;

            DeviceKind kind = DeviceKind::HardDisk;
            if (params.dp_bytes_per_sector == CdromSectorSize)
                kind = DeviceKind::CDROM;
            else if (params.dp_flags & INT13_DP_FLAG_REMOVABLE)
                kind = DeviceKind::USB;
            auto device = MakeDevice(kind, FirmwareMode::LegacyBIOS);
            device.bd_removable = (params.dp_flags & INT13_DP_FLAG_REMOVABLE) != 0 || kind == DeviceKind::CDROM;
            device.bd_source.bs_type = BlockSource::Type::BiosDisk;
            device.bd_source.bs_drive = drive;
            device.bd_source.bs_block_size = params.dp_bytes_per_sector;
            device.bd_source.bs_block_count = params.dp_total_sectors;
            if (drive == pd.pd_boot_drive)
                device.bd_priority = 0;
            snprintf(device.bd_name, sizeof(device.bd_name), "bios%x", drive);
            return Add(devices, device);
        }

        void EnumerateBios(const LoaderContext& lc, DeviceList& devices)
        {
            const uint8_t boot_drive = lc.lc_platform.pd_boot_drive;
            for (unsigned int drive = firmware::bios::FirstHardDisk; drive <= firmware::bios::LastHardDisk; drive++) {
                if (!AddBiosDrive(lc, devices, drive))
                    return;
            }
            // El Torito and floppy boot drives live outside the hard disk range
            if (boot_drive < firmware::bios::FirstHardDisk || boot_drive > firmware::bios::LastHardDisk)
                AddBiosDrive(lc, devices, boot_drive);
        }

        void EnumerateMultiboot(const LoaderContext& lc, DeviceList& devices)
        {
            const addr_t info = lc.lc_platform.pd_multiboot_info;
            for (unsigned int index = 0;; index++) {
                auto mod = firmware::multiboot::FindModule(lc.lc_physmem, info, index);
                if (mod == nullptr)
                    break;
                if (mod->mm_mod_end <= mod->mm_mod_start)
                    continue;
                auto device = MakeDevice(DeviceKind::Firmware, FirmwareMode::DirectLongMode);
                device.bd_source.bs_type = BlockSource::Type::FirmwareBlob;
                device.bd_source.bs_base = mod->mm_mod_start;
                device.bd_source.bs_length = mod->mm_mod_end - mod->mm_mod_start;
                device.bd_source.bs_module = index;
                snprintf(device.bd_name, sizeof(device.bd_name), "mod%u", index);
                if (!Add(devices, device))
                    return;
            }
        }

        bool ClassifySocNode(const firmware::fdt::Property& compatible, DeviceKind& kind)
        {
            if (compatible.ContainsSubstring("emmc") || compatible.ContainsSubstring("dw-mshc")) {
                kind = DeviceKind::eMMC;
                return true;
            }
            if (compatible.ContainsSubstring("sdhci") || compatible.ContainsSubstring("mmc")) {
                kind = DeviceKind::SDCard;
                return true;
            }
            if (compatible.ContainsSubstring("spi-nor")) {
                kind = DeviceKind::SPI;
                return true;
            }
            return false;
        }

        void EnumerateDeviceTree(const LoaderContext& lc, DeviceList& devices)
        {
            using namespace firmware::fdt;
            Blob blob;
            if (!blob.Attach(lc.lc_physmem, lc.lc_platform.pd_dtb))
                return;
            const Node soc = blob.FindNode("/soc");
            if (soc == InvalidNode)
                return;

            const unsigned int acells = blob.GetAddressCells(soc);
            const unsigned int scells = blob.GetSizeCells(soc);
            bool full = false;
            blob.ForEachChild(soc, [&](Node node) {
                DeviceKind kind;
                if (full || !ClassifySocNode(blob.GetProperty(node, "compatible"), kind))
                    return;
                if (auto status = blob.GetProperty(node, "status").AsString();
                    status != nullptr && strcmp(status, "okay") != 0 && strcmp(status, "ok") != 0)
                    return;
                const auto reg = blob.GetProperty(node, "reg");
                if (!reg.IsValid() || reg.p_length < (acells + scells) * 4)
                    return;

                auto device = MakeDevice(kind, FirmwareMode::DeviceTree);
                device.bd_source.bs_type = BlockSource::Type::MmioWindow;
                device.bd_source.bs_base = reg.GetCells(0, acells);
                device.bd_source.bs_length = reg.GetCells(acells, scells);
                snprintf(device.bd_name, sizeof(device.bd_name), "%s", blob.GetName(node));
                full = !Add(devices, device);
            });
        }

    } // unnamed namespace

    int DefaultPriority(DeviceKind kind)
    {
        switch (kind) {
            case DeviceKind::Firmware:
                return 0;
            case DeviceKind::HardDisk:
            case DeviceKind::SSD:
            case DeviceKind::eMMC:
                return 10;
            case DeviceKind::SDCard:
            case DeviceKind::USB:
                return 20;
            case DeviceKind::SPI:
            case DeviceKind::CDROM:
                return 30;
            case DeviceKind::Network:
                return 40;
        }
        return 40;
    }

    const char* KindName(DeviceKind kind)
    {
        switch (kind) {
            case DeviceKind::HardDisk:
                return "Hard Disk";
            case DeviceKind::SSD:
                return "SSD";
            case DeviceKind::USB:
                return "USB Device";
            case DeviceKind::CDROM:
                return "CD-ROM";
            case DeviceKind::Network:
                return "Network Boot";
            case DeviceKind::SDCard:
                return "SD Card";
            case DeviceKind::eMMC:
                return "eMMC";
            case DeviceKind::SPI:
                return "SPI Flash";
            case DeviceKind::Firmware:
                return "Firmware";
        }
        return "?";
    }

    DeviceId GetId(const BootDevice& device)
    {
        const auto& bs = device.bd_source;
        switch (bs.bs_type) {
            case BlockSource::Type::UefiBlockIo:
                return { bs.bs_type, reinterpret_cast<uintptr_t>(bs.bs_handle) };
            case BlockSource::Type::BiosDisk:
                return { bs.bs_type, bs.bs_drive };
            case BlockSource::Type::MmioWindow:
            case BlockSource::Type::FirmwareBlob:
                break;
        }
        return { bs.bs_type, bs.bs_base };
    }

    bool ParseLocator(const char* s, Locator& locator)
    {
        locator = Locator{};
        if (s[0] == '\\' || s[0] == '/') {
            const size_t len = strlen(s);
            if (len >= sizeof(locator.l_path))
                return false;
            locator.l_type = Locator::Type::Path;
            memcpy(locator.l_path, s, len + 1);
            return true;
        }

        const char* end;
        if (strncmp(s, "lba:", 4) == 0) {
            locator.l_type = Locator::Type::Lba;
            if (!ParseNumber(s + 4, &end, locator.l_lba))
                return false;
            if (*end == '+') {
                if (!ParseNumber(end + 1, &end, locator.l_length) || locator.l_length == 0)
                    return false;
            }
            return *end == '\0';
        }

        if (strncmp(s, "mod:", 4) == 0) {
            uint64_t index;
            if (!ParseNumber(s + 4, &end, index) || *end != '\0' || index >= MaxDevices)
                return false;
            locator.l_type = Locator::Type::Module;
            locator.l_module = static_cast<unsigned int>(index);
            return true;
        }
        return false;
    }

    void GetDefaultLocator(const PlatformDescriptor& pd, Locator& locator)
    {
        const char* s = "lba:0";
        switch (pd.pd_mode) {
            case FirmwareMode::UEFI:
                s = "\\EFI\\kernel.img";
                break;
            case FirmwareMode::LegacyBIOS:
                s = "lba:2048";
                break;
            case FirmwareMode::DirectLongMode:
                s = "mod:0";
                break;
            case FirmwareMode::DeviceTree:
                break;
        }
        const bool ok = ParseLocator(s, locator);
        KASSERT(ok, "default locator '%s' does not parse", s);
    }

    bool CanLocate(const BootDevice& device, const Locator& locator)
    {
        const auto& bs = device.bd_source;
        switch (locator.l_type) {
            case Locator::Type::Path:
                return bs.bs_type == BlockSource::Type::UefiBlockIo && bs.bs_file_system != nullptr;
            case Locator::Type::Module:
                return bs.bs_type == BlockSource::Type::FirmwareBlob && bs.bs_module == locator.l_module;
            case Locator::Type::Lba:
                return bs.bs_type != BlockSource::Type::UefiBlockIo || bs.bs_block_io != nullptr;
        }
        return false;
    }

    Result Enumerate(const LoaderContext& lc, DeviceList& devices)
    {
        devices.clear();
        switch (lc.lc_platform.pd_mode) {
            case FirmwareMode::UEFI:
                EnumerateUefi(lc, devices);
                break;
            case FirmwareMode::LegacyBIOS:
                EnumerateBios(lc, devices);
                break;
            case FirmwareMode::DirectLongMode:
                EnumerateMultiboot(lc, devices);
                break;
            case FirmwareMode::DeviceTree:
                EnumerateDeviceTree(lc, devices);
                break;
        }

        TRACE(DEVICE, INFO, "%d device(s) found", static_cast<int>(devices.size()));
        if (devices.empty())
            return RESULT_MAKE_FAILURE(NoBootableDevice);
        return Result::Success();
    }

    Result Select(
        const LoaderContext& lc, const DeviceList& devices, FirmwareMode mode, const Locator& locator,
        const ExcludeList& exclude, size_t& index)
    {
        bool found = false;
        for (size_t n = 0; n < devices.size(); n++) {
            const auto& device = devices[n];
            if (!device.bd_bootable || (device.bd_modes & ModeBit(mode)) == 0)
                continue;
            if (found && device.bd_priority >= devices[index].bd_priority)
                continue;
            if (!CanLocate(device, locator))
                continue;
            const auto id = GetId(device);
            if (util::find_if(exclude, [&](const DeviceId& e) { return e == id; }) != exclude.end())
                continue;

            Stream stream(lc);
            if (auto result = stream.Open(device, locator); result.IsFailure()) {
                TRACE(DEVICE, INFO, "%s: nothing at the kernel locator", device.bd_name);
                continue;
            }
            index = n;
            found = true;
        }

        if (!found) {
            TRACE(DEVICE, ERROR, "no bootable device left");
            return RESULT_MAKE_FAILURE(NoBootableDevice);
        }
        TRACE(DEVICE, INFO, "selected %s (%s)", devices[index].bd_name, KindName(devices[index].bd_kind));
        return Result::Success();
    }

    Result Stream::Open(const BootDevice& device, const Locator& locator)
    {
        Close();
        if (!CanLocate(device, locator))
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        st_Device = device;

        const auto& bs = device.bd_source;
        if (locator.l_type == Locator::Type::Path) {
            using namespace firmware::efi;
            EFI_FILE_PROTOCOL* root;
            if (EFI_ERROR(bs.bs_file_system->OpenVolume(bs.bs_file_system, &root)))
                return RESULT_MAKE_FAILURE(DeviceReadFailed);

            CHAR16 path[Locator::MaxPathLength];
            ToChar16(locator.l_path, path, Locator::MaxPathLength);
            for (auto p = path; *p != 0; p++) {
                if (*p == '/')
                    *p = '\\';
            }
            EFI_FILE_PROTOCOL* file;
            const auto status = root->Open(root, &file, path, EFI_FILE_MODE_READ, 0);
            root->Close(root);
            if (EFI_ERROR(status)) {
                TRACE(DEVICE, INFO, "%s: cannot open '%s'", device.bd_name, locator.l_path);
                return RESULT_MAKE_FAILURE(DeviceReadFailed);
            }

            alignas(8) uint8_t buffer[sizeof(EFI_FILE_INFO) + 2 * Locator::MaxPathLength];
            UINTN size = sizeof(buffer);
            if (EFI_ERROR(file->GetInfo(file, &FileInfoGuid, &size, buffer))) {
                file->Close(file);
                return RESULT_MAKE_FAILURE(DeviceReadFailed);
            }
            st_File = file;
            st_Start = 0;
            st_Size = reinterpret_cast<const EFI_FILE_INFO*>(buffer)->FileSize;
            st_Open = true;
            return Result::Success();
        }

        uint64_t medium_size;
        switch (bs.bs_type) {
            case BlockSource::Type::UefiBlockIo:
            case BlockSource::Type::BiosDisk:
                if (!util::checked_mul(bs.bs_block_count, static_cast<uint64_t>(bs.bs_block_size), medium_size))
                    return RESULT_MAKE_FAILURE(DeviceReadFailed);
                break;
            default:
                medium_size = bs.bs_length;
                break;
        }

        uint64_t start = 0;
        if (locator.l_type == Locator::Type::Lba && !util::checked_mul(locator.l_lba, LbaUnit, start))
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        if (start >= medium_size) {
            TRACE(DEVICE, INFO, "%s: offset %llu beyond the medium", device.bd_name, static_cast<unsigned long long>(start));
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        }
        st_Start = start;
        st_Size = medium_size - start;
        if (locator.l_length != 0 && locator.l_length < st_Size)
            st_Size = locator.l_length;
        st_Open = true;
        return Result::Success();
    }

    void Stream::Close()
    {
        if (st_File != nullptr)
            st_File->Close(st_File);
        st_File = nullptr;
        st_Open = false;
        st_Size = 0;
    }

    bool Stream::GetDirectAddress(addr_t& address) const
    {
        if (!st_Open || st_Device.bd_source.bs_type != BlockSource::Type::FirmwareBlob)
            return false;
        address = st_Device.bd_source.bs_base + st_Start;
        return true;
    }

    Result Stream::Read(uint64_t offset, void* dest, uint64_t length)
    {
        uint64_t end;
        if (!st_Open || !util::checked_add(offset, length, end) || end > st_Size)
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        if (length == 0)
            return Result::Success();
        if (st_File != nullptr)
            return ReadFile(offset, dest, length);
        return ReadMedium(st_Start + offset, static_cast<uint8_t*>(dest), length);
    }

    Result Stream::ReadFile(uint64_t offset, void* dest, uint64_t length)
    {
        using namespace firmware::efi;
        if (EFI_ERROR(st_File->SetPosition(st_File, offset)))
            return RESULT_MAKE_FAILURE(DeviceReadFailed);

        auto p = static_cast<uint8_t*>(dest);
        while (length > 0) {
            UINTN chunk = length;
            const auto status = st_File->Read(st_File, &chunk, p);
            if (EFI_ERROR(status) || chunk == 0 || chunk > length) {
                TRACE(DEVICE, ERROR, "%s: file read failed, status %llx", st_Device.bd_name,
                    static_cast<unsigned long long>(status));
                return RESULT_MAKE_FAILURE(DeviceReadFailed);
            }
            p += chunk;
            length -= chunk;
        }
        return Result::Success();
    }

    Result Stream::ReadBlocks(uint64_t block, uint64_t count, void* dest)
    {
        const auto& ctx = st_Context;
        const auto& bs = st_Device.bd_source;
        switch (bs.bs_type) {
            case BlockSource::Type::UefiBlockIo: {
                using namespace firmware::efi;
                auto bio = bs.bs_block_io;
                const auto status =
                    bio->ReadBlocks(bio, bio->Media->MediaId, block, count * bs.bs_block_size, dest);
                if (EFI_ERROR(status)) {
                    TRACE(DEVICE, ERROR, "%s: read of block %llu failed, status %llx", st_Device.bd_name,
                        static_cast<unsigned long long>(block), static_cast<unsigned long long>(status));
                    return RESULT_MAKE_FAILURE(DeviceReadFailed);
                }
                return Result::Success();
            }
            case BlockSource::Type::BiosDisk: {
                auto p = static_cast<uint8_t*>(dest);
                // INT 13h takes a 16-bit sector count
                while (count > 0) {
                    const unsigned int chunk = count > 0xffff ? 0xffff : static_cast<unsigned int>(count);
                    RESULT_PROPAGATE_FAILURE(firmware::bios::ReadSectors(
                        ctx.lc_platform, ctx.lc_physmem, bs.bs_drive, block, chunk, bs.bs_block_size, p));
                    p += static_cast<uint64_t>(chunk) * bs.bs_block_size;
                    block += chunk;
                    count -= chunk;
                }
                return Result::Success();
            }
            case BlockSource::Type::MmioWindow:
            case BlockSource::Type::FirmwareBlob:
                if (!ctx.lc_physmem.Read(bs.bs_base + block * bs.bs_block_size, dest, count * bs.bs_block_size))
                    return RESULT_MAKE_FAILURE(DeviceReadFailed);
                return Result::Success();
        }
        return RESULT_MAKE_FAILURE(DeviceReadFailed);
    }

    Result Stream::ReadMedium(uint64_t offset, uint8_t* dest, uint64_t length)
    {
        const auto& bs = st_Device.bd_source;
        if (bs.bs_type == BlockSource::Type::MmioWindow || bs.bs_type == BlockSource::Type::FirmwareBlob) {
            // Byte addressable; no need to go through blocks
            if (!st_Context.lc_physmem.Read(bs.bs_base + offset, dest, length))
                return RESULT_MAKE_FAILURE(DeviceReadFailed);
            return Result::Success();
        }

        const uint64_t block_size = bs.bs_block_size;
        if (block_size == 0 || block_size > Scratch::MaxBlockSize)
            return RESULT_MAKE_FAILURE(DeviceReadFailed);
        uint8_t* sector = st_Context.lc_scratch.s_sector;

        // Partial first block
        if (const uint64_t skip = offset % block_size; skip != 0) {
            RESULT_PROPAGATE_FAILURE(ReadBlocks(offset / block_size, 1, sector));
            const uint64_t chunk = util::min(block_size - skip, length);
            memcpy(dest, sector + skip, chunk);
            dest += chunk;
            offset += chunk;
            length -= chunk;
        }

        // Whole blocks go straight to the destination
        if (const uint64_t blocks = length / block_size; blocks > 0) {
            RESULT_PROPAGATE_FAILURE(ReadBlocks(offset / block_size, blocks, dest));
            dest += blocks * block_size;
            offset += blocks * block_size;
            length -= blocks * block_size;
        }

        if (length > 0) {
            RESULT_PROPAGATE_FAILURE(ReadBlocks(offset / block_size, 1, sector));
            memcpy(dest, sector, length);
        }
        return Result::Success();
    }

} // namespace bootdevice
