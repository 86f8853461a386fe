/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <gtest/gtest.h>
#include <cstring>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "loader/firmware/efi.h"
#include "loader/platform.h"

namespace fake
{
    namespace efi = firmware::efi;

    struct UefiDisk {
        efi::EFI_BLOCK_IO_MEDIA d_media{};
        efi::EFI_BLOCK_IO_PROTOCOL d_block_io{};
        efi::EFI_SIMPLE_FILE_SYSTEM_PROTOCOL d_file_system{};
        bool d_has_block_io = true;
        bool d_has_file_system = false;
        bool d_fail_reads = false;
        std::vector<uint8_t> d_data;
        // Keyed by path, as passed to Open(), with backslashes
        std::map<std::string, std::vector<uint8_t>> d_files;
    };

    struct UefiAllocation {
        efi::EFI_PHYSICAL_ADDRESS a_address;
        efi::UINTN a_pages;
    };

    /*
     * Boot and runtime services backed by host memory. Calls that take no
     * 'This' pointer find the instance through 'current'; only one may exist
     * at a time.
     */
    class Uefi
    {
      public:
        static constexpr efi::UINTN DescriptorSize = 48;

        Uefi()
        {
            current = this;

            u_BootServices.AllocatePages = &Uefi::AllocatePages;
            u_BootServices.FreePages = &Uefi::FreePages;
            u_BootServices.GetMemoryMap = &Uefi::GetMemoryMap;
            u_BootServices.HandleProtocol = &Uefi::HandleProtocol;
            u_BootServices.LocateHandle = &Uefi::LocateHandle;
            u_BootServices.LocateProtocol = &Uefi::LocateProtocol;
            u_BootServices.ExitBootServices = &Uefi::ExitBootServices;
            u_RuntimeServices.GetVariable = &Uefi::GetVariable;
            u_ConOut.OutputString = &Uefi::OutputString;

            u_SystemTable.Hdr.Signature = efi::EFI_SYSTEM_TABLE_SIGNATURE;
            u_SystemTable.ConOut = &u_ConOut;
            u_SystemTable.RuntimeServices = &u_RuntimeServices;
            u_SystemTable.BootServices = &u_BootServices;

            u_LoadedImage.SystemTable = &u_SystemTable;
        }

        ~Uefi() { current = nullptr; }
        Uefi(const Uefi&) = delete;
        Uefi& operator=(const Uefi&) = delete;

        UefiDisk& AddDisk(uint32_t block_size, uint64_t blocks, bool removable = false)
        {
            auto& disk = *u_Disks.emplace_back(std::make_unique<UefiDisk>());
            disk.d_media.MediaId = static_cast<uint32_t>(u_Disks.size());
            disk.d_media.RemovableMedia = removable;
            disk.d_media.MediaPresent = 1;
            disk.d_media.BlockSize = block_size;
            disk.d_media.LastBlock = blocks - 1;
            disk.d_block_io.Media = &disk.d_media;
            disk.d_block_io.ReadBlocks = &Uefi::ReadBlocks;
            disk.d_file_system.OpenVolume = &Uefi::OpenVolume;
            disk.d_data.resize(block_size * blocks);
            return disk;
        }

        // A volume without block I/O, such as a firmware-provided file system
        UefiDisk& AddVolume()
        {
            auto& disk = AddDisk(512, 1);
            disk.d_has_block_io = false;
            disk.d_has_file_system = true;
            return disk;
        }

        void AddFile(UefiDisk& disk, const std::string& path, const std::vector<uint8_t>& data)
        {
            disk.d_has_file_system = true;
            disk.d_files[path] = data;
        }

        // Network handles are never dereferenced, so any unique value will do
        void AddNetwork()
        {
            u_NetworkHandles.push_back(reinterpret_cast<efi::EFI_HANDLE>(0xe7000 + u_NetworkHandles.size()));
        }

        void SetBootDisk(const UefiDisk& disk) { u_LoadedImage.DeviceHandle = GetHandle(disk); }

        static efi::EFI_HANDLE GetHandle(const UefiDisk& disk) { return const_cast<UefiDisk*>(&disk); }

        void AddDescriptor(uint32_t type, uint64_t base, uint64_t pages, uint64_t attribute = 0)
        {
            efi::EFI_MEMORY_DESCRIPTOR md{};
            md.Type = type;
            md.PhysicalStart = base;
            md.NumberOfPages = pages;
            md.Attribute = attribute;
            u_Descriptors.push_back(md);
        }

        void SetOptions(const std::string& options) { u_Options = options; }

        void SetGop(uint64_t base, uint32_t width, uint32_t height, efi::EFI_GRAPHICS_PIXEL_FORMAT format)
        {
            u_GopInfo.HorizontalResolution = width;
            u_GopInfo.VerticalResolution = height;
            u_GopInfo.PixelsPerScanLine = width;
            u_GopInfo.PixelFormat = format;
            u_GopMode.Info = &u_GopInfo;
            u_GopMode.SizeOfInfo = sizeof(u_GopInfo);
            u_GopMode.FrameBufferBase = base;
            u_GopMode.FrameBufferSize = static_cast<uint64_t>(width) * height * 4;
            u_Gop.Mode = &u_GopMode;
            u_HaveGop = true;
        }

        // ExitBootServices() reports a stale map key once, as if the map changed
        void SetStaleKeyOnce() { u_StaleKeyOnce = true; }
        void SetExitStatus(efi::EFI_STATUS status) { u_ExitStatus = status; }
        void SetMaxReadChunk(efi::UINTN chunk) { u_MaxReadChunk = chunk; }
        void SetAllocateStatus(efi::EFI_STATUS status) { u_AllocateStatus = status; }

        EntryState MakeEntryState(uint16_t machine = ENTRY_MACHINE_X86_64)
        {
            EntryState entry;
            entry.es_machine = machine;
            entry.es_xlen = 64;
            entry.es_efi_image_handle = GetImageHandle();
            entry.es_efi_system_table = &u_SystemTable;
            return entry;
        }

        efi::EFI_SYSTEM_TABLE* GetSystemTable() { return &u_SystemTable; }
        efi::EFI_HANDLE GetImageHandle() { return &u_LoadedImage; }

        const std::vector<UefiAllocation>& GetAllocations() const { return u_Allocations; }
        const std::vector<UefiAllocation>& GetFrees() const { return u_Frees; }
        unsigned int GetExitCalls() const { return u_ExitCalls; }
        bool HasExited() const { return u_Exited; }
        int GetOpenFiles() const { return u_OpenFiles; }
        const std::string& GetConsoleOutput() const { return u_ConsoleOutput; }

      private:
        struct OpenFile {
            efi::EFI_FILE_PROTOCOL f_protocol;
            UefiDisk* f_disk;
            const std::vector<uint8_t>* f_data; // nullptr for the root directory
            uint64_t f_position;
        };

        static bool IsGuid(const efi::EFI_GUID* a, const efi::EFI_GUID& b) { return *a == b; }

        UefiDisk* FindDisk(efi::EFI_HANDLE handle)
        {
            for (auto& disk : u_Disks)
                if (disk.get() == handle)
                    return disk.get();
            return nullptr;
        }

        efi::EFI_FILE_PROTOCOL* NewFile(UefiDisk* disk, const std::vector<uint8_t>* data)
        {
            auto& file = *u_Files.emplace_back(std::make_unique<OpenFile>());
            file.f_protocol = efi::EFI_FILE_PROTOCOL{};
            file.f_protocol.Open = &Uefi::FileOpen;
            file.f_protocol.Close = &Uefi::FileClose;
            file.f_protocol.Read = &Uefi::FileRead;
            file.f_protocol.SetPosition = &Uefi::FileSetPosition;
            file.f_protocol.GetInfo = &Uefi::FileGetInfo;
            file.f_disk = disk;
            file.f_data = data;
            file.f_position = 0;
            ++u_OpenFiles;
            return &file.f_protocol;
        }

        static OpenFile* AsFile(efi::EFI_FILE_PROTOCOL* p) { return reinterpret_cast<OpenFile*>(p); }

        static efi::EFI_STATUS EFIAPI AllocatePages(
            efi::EFI_ALLOCATE_TYPE type, efi::EFI_MEMORY_TYPE, efi::UINTN pages, efi::EFI_PHYSICAL_ADDRESS* memory)
        {
            if (type != efi::AllocateAddress)
                return efi::EFI_UNSUPPORTED;
            if (current->u_AllocateStatus != efi::EFI_SUCCESS)
                return current->u_AllocateStatus;
            current->u_Allocations.push_back({ *memory, pages });
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI FreePages(efi::EFI_PHYSICAL_ADDRESS memory, efi::UINTN pages)
        {
            current->u_Frees.push_back({ memory, pages });
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI GetMemoryMap(
            efi::UINTN* size, efi::EFI_MEMORY_DESCRIPTOR* map, efi::UINTN* key, efi::UINTN* descriptor_size,
            uint32_t* version)
        {
            auto& self = *current;
            const efi::UINTN needed = self.u_Descriptors.size() * DescriptorSize;
            *descriptor_size = DescriptorSize;
            *version = 1;
            if (*size < needed) {
                *size = needed;
                return efi::EFI_BUFFER_TOO_SMALL;
            }
            auto out = reinterpret_cast<uint8_t*>(map);
            memset(out, 0, needed);
            for (size_t n = 0; n < self.u_Descriptors.size(); n++)
                memcpy(out + n * DescriptorSize, &self.u_Descriptors[n], sizeof(efi::EFI_MEMORY_DESCRIPTOR));
            *size = needed;
            *key = self.u_MapKey;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI
        HandleProtocol(efi::EFI_HANDLE handle, const efi::EFI_GUID* protocol, void** interface)
        {
            auto& self = *current;
            if (handle == self.GetImageHandle() && IsGuid(protocol, efi::LoadedImageProtocolGuid)) {
                *interface = &self.u_LoadedImage;
                return efi::EFI_SUCCESS;
            }
            if (auto disk = self.FindDisk(handle); disk != nullptr) {
                if (disk->d_has_block_io && IsGuid(protocol, efi::BlockIoProtocolGuid)) {
                    *interface = &disk->d_block_io;
                    return efi::EFI_SUCCESS;
                }
                if (disk->d_has_file_system && IsGuid(protocol, efi::SimpleFileSystemProtocolGuid)) {
                    *interface = &disk->d_file_system;
                    return efi::EFI_SUCCESS;
                }
            }
            return efi::EFI_UNSUPPORTED;
        }

        static efi::EFI_STATUS EFIAPI LocateHandle(
            efi::EFI_LOCATE_SEARCH_TYPE type, const efi::EFI_GUID* protocol, void*, efi::UINTN* size,
            efi::EFI_HANDLE* buffer)
        {
            auto& self = *current;
            if (type != efi::ByProtocol)
                return efi::EFI_INVALID_PARAMETER;

            std::vector<efi::EFI_HANDLE> handles;
            if (IsGuid(protocol, efi::SimpleNetworkProtocolGuid)) {
                handles = self.u_NetworkHandles;
            } else {
                for (auto& disk : self.u_Disks) {
                    if ((IsGuid(protocol, efi::BlockIoProtocolGuid) && disk->d_has_block_io) ||
                        (IsGuid(protocol, efi::SimpleFileSystemProtocolGuid) && disk->d_has_file_system))
                        handles.push_back(disk.get());
                }
            }
            if (handles.empty())
                return efi::EFI_NOT_FOUND;

            const efi::UINTN needed = handles.size() * sizeof(efi::EFI_HANDLE);
            if (*size < needed) {
                *size = needed;
                return efi::EFI_BUFFER_TOO_SMALL;
            }
            memcpy(buffer, handles.data(), needed);
            *size = needed;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI LocateProtocol(const efi::EFI_GUID* protocol, void*, void** interface)
        {
            auto& self = *current;
            if (!self.u_HaveGop || !IsGuid(protocol, efi::GraphicsOutputProtocolGuid))
                return efi::EFI_NOT_FOUND;
            *interface = &self.u_Gop;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI ExitBootServices(efi::EFI_HANDLE image, efi::UINTN key)
        {
            auto& self = *current;
            ++self.u_ExitCalls;
            if (image != self.GetImageHandle())
                return efi::EFI_INVALID_PARAMETER;
            if (self.u_StaleKeyOnce) {
                self.u_StaleKeyOnce = false;
                ++self.u_MapKey;
                return efi::EFI_INVALID_PARAMETER;
            }
            if (key != self.u_MapKey)
                return efi::EFI_INVALID_PARAMETER;
            if (self.u_ExitStatus != efi::EFI_SUCCESS)
                return self.u_ExitStatus;
            self.u_Exited = true;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI GetVariable(
            const efi::CHAR16* name, const efi::EFI_GUID* vendor, uint32_t*, efi::UINTN* size, void* data)
        {
            auto& self = *current;
            std::string narrow;
            for (auto p = name; *p != 0; p++)
                narrow += static_cast<char>(*p);
            if (narrow != "FerryOptions" || !IsGuid(vendor, efi::FerryVendorGuid) || self.u_Options.empty())
                return efi::EFI_NOT_FOUND;
            if (*size < self.u_Options.size()) {
                *size = self.u_Options.size();
                return efi::EFI_BUFFER_TOO_SMALL;
            }
            memcpy(data, self.u_Options.data(), self.u_Options.size());
            *size = self.u_Options.size();
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI OutputString(efi::EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL*, const efi::CHAR16* s)
        {
            for (auto p = s; *p != 0; p++)
                current->u_ConsoleOutput += static_cast<char>(*p);
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI ReadBlocks(
            efi::EFI_BLOCK_IO_PROTOCOL* self_bio, uint32_t media_id, efi::EFI_LBA lba, efi::UINTN size, void* buffer)
        {
            for (auto& disk : current->u_Disks) {
                if (&disk->d_block_io != self_bio)
                    continue;
                const uint64_t block_size = disk->d_media.BlockSize;
                if (disk->d_fail_reads || media_id != disk->d_media.MediaId)
                    return efi::EFI_DEVICE_ERROR;
                if (size % block_size != 0 || lba * block_size + size > disk->d_data.size())
                    return efi::EFI_INVALID_PARAMETER;
                memcpy(buffer, &disk->d_data[lba * block_size], size);
                return efi::EFI_SUCCESS;
            }
            return efi::EFI_INVALID_PARAMETER;
        }

        static efi::EFI_STATUS EFIAPI OpenVolume(efi::EFI_SIMPLE_FILE_SYSTEM_PROTOCOL* fs, efi::EFI_FILE_PROTOCOL** root)
        {
            for (auto& disk : current->u_Disks) {
                if (&disk->d_file_system != fs)
                    continue;
                *root = current->NewFile(disk.get(), nullptr);
                return efi::EFI_SUCCESS;
            }
            return efi::EFI_INVALID_PARAMETER;
        }

        static efi::EFI_STATUS EFIAPI FileOpen(
            efi::EFI_FILE_PROTOCOL* dir, efi::EFI_FILE_PROTOCOL** file, const efi::CHAR16* name, uint64_t mode,
            uint64_t)
        {
            auto parent = AsFile(dir);
            if (parent->f_data != nullptr || mode != efi::EFI_FILE_MODE_READ)
                return efi::EFI_INVALID_PARAMETER;
            std::string path;
            for (auto p = name; *p != 0; p++)
                path += static_cast<char>(*p);
            auto it = parent->f_disk->d_files.find(path);
            if (it == parent->f_disk->d_files.end())
                return efi::EFI_NOT_FOUND;
            *file = current->NewFile(parent->f_disk, &it->second);
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI FileClose(efi::EFI_FILE_PROTOCOL*)
        {
            --current->u_OpenFiles;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI FileRead(efi::EFI_FILE_PROTOCOL* p, efi::UINTN* size, void* buffer)
        {
            auto file = AsFile(p);
            if (file->f_data == nullptr)
                return efi::EFI_UNSUPPORTED;
            if (file->f_disk->d_fail_reads)
                return efi::EFI_DEVICE_ERROR;
            const auto& data = *file->f_data;
            uint64_t chunk = *size;
            if (current->u_MaxReadChunk != 0 && chunk > current->u_MaxReadChunk)
                chunk = current->u_MaxReadChunk;
            if (file->f_position >= data.size())
                chunk = 0;
            else if (chunk > data.size() - file->f_position)
                chunk = data.size() - file->f_position;
            if (chunk > 0)
                memcpy(buffer, &data[file->f_position], chunk);
            file->f_position += chunk;
            *size = chunk;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI FileSetPosition(efi::EFI_FILE_PROTOCOL* p, uint64_t position)
        {
            auto file = AsFile(p);
            if (file->f_data == nullptr)
                return efi::EFI_UNSUPPORTED;
            file->f_position = position;
            return efi::EFI_SUCCESS;
        }

        static efi::EFI_STATUS EFIAPI
        FileGetInfo(efi::EFI_FILE_PROTOCOL* p, const efi::EFI_GUID* type, efi::UINTN* size, void* buffer)
        {
            auto file = AsFile(p);
            if (!IsGuid(type, efi::FileInfoGuid) || file->f_data == nullptr)
                return efi::EFI_UNSUPPORTED;
            if (*size < sizeof(efi::EFI_FILE_INFO)) {
                *size = sizeof(efi::EFI_FILE_INFO);
                return efi::EFI_BUFFER_TOO_SMALL;
            }
            efi::EFI_FILE_INFO info{};
            info.Size = sizeof(info);
            info.FileSize = file->f_data->size();
            info.PhysicalSize = file->f_data->size();
            memcpy(buffer, &info, sizeof(info));
            *size = sizeof(info);
            return efi::EFI_SUCCESS;
        }

        inline static Uefi* current = nullptr;

        efi::EFI_SYSTEM_TABLE u_SystemTable{};
        efi::EFI_BOOT_SERVICES u_BootServices{};
        efi::EFI_RUNTIME_SERVICES u_RuntimeServices{};
        efi::EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL u_ConOut{};
        efi::EFI_LOADED_IMAGE_PROTOCOL u_LoadedImage{};
        efi::EFI_GRAPHICS_OUTPUT_PROTOCOL u_Gop{};
        efi::EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE u_GopMode{};
        efi::EFI_GRAPHICS_OUTPUT_MODE_INFORMATION u_GopInfo{};
        bool u_HaveGop = false;

        std::vector<std::unique_ptr<UefiDisk>> u_Disks;
        std::vector<std::unique_ptr<OpenFile>> u_Files;
        std::vector<efi::EFI_HANDLE> u_NetworkHandles;
        std::vector<efi::EFI_MEMORY_DESCRIPTOR> u_Descriptors;
        std::vector<UefiAllocation> u_Allocations;
        std::vector<UefiAllocation> u_Frees;
        std::string u_Options;
        std::string u_ConsoleOutput;

        efi::UINTN u_MapKey = 0x1000;
        efi::UINTN u_MaxReadChunk = 0;
        efi::EFI_STATUS u_ExitStatus = efi::EFI_SUCCESS;
        efi::EFI_STATUS u_AllocateStatus = efi::EFI_SUCCESS;
        bool u_StaleKeyOnce = false;
        bool u_Exited = false;
        unsigned int u_ExitCalls = 0;
        int u_OpenFiles = 0;
    };

} // namespace fake
