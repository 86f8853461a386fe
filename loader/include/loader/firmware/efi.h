/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
/*
 * The subset of the UEFI 2.x ABI the loader uses. Tables are laid out in full
 * up to the last member we need; members we never call are kept as opaque
 * pointers so the offsets stay correct.
 */
#pragma once

#include <ferry/types.h>

#if defined(__x86_64__)
#define EFIAPI __attribute__((ms_abi))
#else
#define EFIAPI
#endif

namespace firmware::efi
{
    using EFI_STATUS = uint64_t;
    using EFI_HANDLE = void*;
    using EFI_PHYSICAL_ADDRESS = uint64_t;
    using EFI_LBA = uint64_t;
    using UINTN = uint64_t;
    using CHAR16 = uint16_t;
    using BOOLEAN = uint8_t;

    static constexpr EFI_STATUS EFI_SUCCESS = 0;
    static constexpr EFI_STATUS EFI_ERROR_BIT = 1ull << 63;
    static constexpr EFI_STATUS EFI_INVALID_PARAMETER = EFI_ERROR_BIT | 2;
    static constexpr EFI_STATUS EFI_UNSUPPORTED = EFI_ERROR_BIT | 3;
    static constexpr EFI_STATUS EFI_BUFFER_TOO_SMALL = EFI_ERROR_BIT | 5;
    static constexpr EFI_STATUS EFI_DEVICE_ERROR = EFI_ERROR_BIT | 7;
    static constexpr EFI_STATUS EFI_OUT_OF_RESOURCES = EFI_ERROR_BIT | 9;
    static constexpr EFI_STATUS EFI_NOT_FOUND = EFI_ERROR_BIT | 14;

    inline bool EFI_ERROR(EFI_STATUS status) { return (status & EFI_ERROR_BIT) != 0; }

    struct EFI_GUID {
        uint32_t Data1;
        uint16_t Data2;
        uint16_t Data3;
        uint8_t Data4[8];
    };

    inline bool operator==(const EFI_GUID& a, const EFI_GUID& b)
    {
        if (a.Data1 != b.Data1 || a.Data2 != b.Data2 || a.Data3 != b.Data3)
            return false;
        for (int n = 0; n < 8; n++)
            if (a.Data4[n] != b.Data4[n])
                return false;
        return true;
    }

    static constexpr EFI_GUID BlockIoProtocolGuid = {
        0x964e5b21, 0x6459, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b }
    };
    static constexpr EFI_GUID SimpleFileSystemProtocolGuid = {
        0x964e5b22, 0x6459, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b }
    };
    static constexpr EFI_GUID LoadedImageProtocolGuid = {
        0x5b1b31a1, 0x9562, 0x11d2, { 0x8e, 0x3f, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b }
    };
    static constexpr EFI_GUID GraphicsOutputProtocolGuid = {
        0x9042a9de, 0x23dc, 0x4a38, { 0x96, 0xfb, 0x7a, 0xde, 0xd0, 0x80, 0x51, 0x6a }
    };
    static constexpr EFI_GUID SimpleNetworkProtocolGuid = {
        0xa19832b9, 0xac25, 0x11d3, { 0x9a, 0x2d, 0x00, 0x90, 0x27, 0x3f, 0xc1, 0x4d }
    };
    static constexpr EFI_GUID FileInfoGuid = {
        0x09576e92, 0x6d3f, 0x11d2, { 0x8e, 0x39, 0x00, 0xa0, 0xc9, 0x69, 0x72, 0x3b }
    };
    // Vendor GUID of the FerryOptions variable
    static constexpr EFI_GUID FerryVendorGuid = {
        0x6f7a3c2e, 0x94d1, 0x4b8e, { 0xa5, 0xc3, 0x2d, 0x9e, 0x1b, 0x7f, 0x0a, 0x64 }
    };

    static constexpr uint64_t EFI_SYSTEM_TABLE_SIGNATURE = 0x5453595320494249; /* 'IBI SYST' */

    struct EFI_TABLE_HEADER {
        uint64_t Signature;
        uint32_t Revision;
        uint32_t HeaderSize;
        uint32_t CRC32;
        uint32_t Reserved;
    };

    enum EFI_MEMORY_TYPE : uint32_t {
        EfiReservedMemoryType,
        EfiLoaderCode,
        EfiLoaderData,
        EfiBootServicesCode,
        EfiBootServicesData,
        EfiRuntimeServicesCode,
        EfiRuntimeServicesData,
        EfiConventionalMemory,
        EfiUnusableMemory,
        EfiACPIReclaimMemory,
        EfiACPIMemoryNVS,
        EfiMemoryMappedIO,
        EfiMemoryMappedIOPortSpace,
        EfiPalCode,
        EfiPersistentMemory,
        EfiMaxMemoryType
    };

    enum EFI_ALLOCATE_TYPE : uint32_t { AllocateAnyPages, AllocateMaxAddress, AllocateAddress };

    enum EFI_LOCATE_SEARCH_TYPE : uint32_t { AllHandles, ByRegisterNotify, ByProtocol };

    static constexpr uint64_t EFI_MEMORY_UC = 0x1;
    static constexpr uint64_t EFI_MEMORY_WC = 0x2;
    static constexpr uint64_t EFI_MEMORY_NV = 0x8000;
    static constexpr uint64_t EFI_MEMORY_RUNTIME = 0x8000000000000000;

    struct EFI_MEMORY_DESCRIPTOR {
        uint32_t Type;
        uint32_t Pad;
        EFI_PHYSICAL_ADDRESS PhysicalStart;
        uint64_t VirtualStart;
        uint64_t NumberOfPages;
        uint64_t Attribute;
    };

    struct EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL {
        EFI_STATUS(EFIAPI* Reset)(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* This, BOOLEAN ExtendedVerification);
        EFI_STATUS(EFIAPI* OutputString)(EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* This, const CHAR16* String);
        void* TestString;
        void* QueryMode;
        void* SetMode;
        void* SetAttribute;
        void* ClearScreen;
        void* SetCursorPosition;
        void* EnableCursor;
        void* Mode;
    };

    struct EFI_BOOT_SERVICES {
        EFI_TABLE_HEADER Hdr;
        void* RaiseTPL;
        void* RestoreTPL;
        EFI_STATUS(EFIAPI* AllocatePages)(
            EFI_ALLOCATE_TYPE Type, EFI_MEMORY_TYPE MemoryType, UINTN Pages,
            EFI_PHYSICAL_ADDRESS* Memory);
        EFI_STATUS(EFIAPI* FreePages)(EFI_PHYSICAL_ADDRESS Memory, UINTN Pages);
        EFI_STATUS(EFIAPI* GetMemoryMap)(
            UINTN* MemoryMapSize, EFI_MEMORY_DESCRIPTOR* MemoryMap, UINTN* MapKey,
            UINTN* DescriptorSize, uint32_t* DescriptorVersion);
        void* AllocatePool;
        void* FreePool;
        void* CreateEvent;
        void* SetTimer;
        void* WaitForEvent;
        void* SignalEvent;
        void* CloseEvent;
        void* CheckEvent;
        void* InstallProtocolInterface;
        void* ReinstallProtocolInterface;
        void* UninstallProtocolInterface;
        EFI_STATUS(EFIAPI* HandleProtocol)(EFI_HANDLE Handle, const EFI_GUID* Protocol, void** Interface);
        void* Reserved;
        void* RegisterProtocolNotify;
        EFI_STATUS(EFIAPI* LocateHandle)(
            EFI_LOCATE_SEARCH_TYPE SearchType, const EFI_GUID* Protocol, void* SearchKey,
            UINTN* BufferSize, EFI_HANDLE* Buffer);
        void* LocateDevicePath;
        void* InstallConfigurationTable;
        void* LoadImage;
        void* StartImage;
        void* Exit;
        void* UnloadImage;
        EFI_STATUS(EFIAPI* ExitBootServices)(EFI_HANDLE ImageHandle, UINTN MapKey);
        void* GetNextMonotonicCount;
        void* Stall;
        void* SetWatchdogTimer;
        void* ConnectController;
        void* DisconnectController;
        void* OpenProtocol;
        void* CloseProtocol;
        void* OpenProtocolInformation;
        void* ProtocolsPerHandle;
        void* LocateHandleBuffer;
        EFI_STATUS(EFIAPI* LocateProtocol)(const EFI_GUID* Protocol, void* Registration, void** Interface);
    };

    struct EFI_RUNTIME_SERVICES {
        EFI_TABLE_HEADER Hdr;
        void* GetTime;
        void* SetTime;
        void* GetWakeupTime;
        void* SetWakeupTime;
        void* SetVirtualAddressMap;
        void* ConvertPointer;
        EFI_STATUS(EFIAPI* GetVariable)(
            const CHAR16* VariableName, const EFI_GUID* VendorGuid, uint32_t* Attributes,
            UINTN* DataSize, void* Data);
    };

    struct EFI_SYSTEM_TABLE {
        EFI_TABLE_HEADER Hdr;
        CHAR16* FirmwareVendor;
        uint32_t FirmwareRevision;
        EFI_HANDLE ConsoleInHandle;
        void* ConIn;
        EFI_HANDLE ConsoleOutHandle;
        EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* ConOut;
        EFI_HANDLE StandardErrorHandle;
        EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* StdErr;
        EFI_RUNTIME_SERVICES* RuntimeServices;
        EFI_BOOT_SERVICES* BootServices;
        UINTN NumberOfTableEntries;
        void* ConfigurationTable;
    };

    struct EFI_BLOCK_IO_MEDIA {
        uint32_t MediaId;
        BOOLEAN RemovableMedia;
        BOOLEAN MediaPresent;
        BOOLEAN LogicalPartition;
        BOOLEAN ReadOnly;
        BOOLEAN WriteCaching;
        uint32_t BlockSize;
        uint32_t IoAlign;
        EFI_LBA LastBlock;
    };

    struct EFI_BLOCK_IO_PROTOCOL {
        uint64_t Revision;
        EFI_BLOCK_IO_MEDIA* Media;
        void* Reset;
        EFI_STATUS(EFIAPI* ReadBlocks)(
            EFI_BLOCK_IO_PROTOCOL* This, uint32_t MediaId, EFI_LBA Lba, UINTN BufferSize, void* Buffer);
        void* WriteBlocks;
        void* FlushBlocks;
    };

    static constexpr uint64_t EFI_FILE_MODE_READ = 0x1;

    struct EFI_FILE_PROTOCOL {
        uint64_t Revision;
        EFI_STATUS(EFIAPI* Open)(
            EFI_FILE_PROTOCOL* This, EFI_FILE_PROTOCOL** NewHandle, const CHAR16* FileName,
            uint64_t OpenMode, uint64_t Attributes);
        EFI_STATUS(EFIAPI* Close)(EFI_FILE_PROTOCOL* This);
        void* Delete;
        EFI_STATUS(EFIAPI* Read)(EFI_FILE_PROTOCOL* This, UINTN* BufferSize, void* Buffer);
        void* Write;
        void* GetPosition;
        EFI_STATUS(EFIAPI* SetPosition)(EFI_FILE_PROTOCOL* This, uint64_t Position);
        EFI_STATUS(EFIAPI* GetInfo)(
            EFI_FILE_PROTOCOL* This, const EFI_GUID* InformationType, UINTN* BufferSize, void* Buffer);
    };

    struct EFI_TIME {
        uint8_t Bytes[16];
    };

    struct EFI_FILE_INFO {
        uint64_t Size;
        uint64_t FileSize;
        uint64_t PhysicalSize;
        EFI_TIME CreateTime;
        EFI_TIME LastAccessTime;
        EFI_TIME ModificationTime;
        uint64_t Attribute;
        CHAR16 FileName[1];
    };

    struct EFI_SIMPLE_FILE_SYSTEM_PROTOCOL {
        uint64_t Revision;
        EFI_STATUS(EFIAPI* OpenVolume)(EFI_SIMPLE_FILE_SYSTEM_PROTOCOL* This, EFI_FILE_PROTOCOL** Root);
    };

    struct EFI_LOADED_IMAGE_PROTOCOL {
        uint32_t Revision;
        EFI_HANDLE ParentHandle;
        EFI_SYSTEM_TABLE* SystemTable;
        EFI_HANDLE DeviceHandle;
        void* FilePath;
        void* Reserved;
        uint32_t LoadOptionsSize;
        void* LoadOptions;
        void* ImageBase;
        uint64_t ImageSize;
    };

    enum EFI_GRAPHICS_PIXEL_FORMAT : uint32_t {
        PixelRedGreenBlueReserved8BitPerColor,
        PixelBlueGreenRedReserved8BitPerColor,
        PixelBitMask,
        PixelBltOnly,
    };

    struct EFI_PIXEL_BITMASK {
        uint32_t RedMask;
        uint32_t GreenMask;
        uint32_t BlueMask;
        uint32_t ReservedMask;
    };

    struct EFI_GRAPHICS_OUTPUT_MODE_INFORMATION {
        uint32_t Version;
        uint32_t HorizontalResolution;
        uint32_t VerticalResolution;
        EFI_GRAPHICS_PIXEL_FORMAT PixelFormat;
        EFI_PIXEL_BITMASK PixelInformation;
        uint32_t PixelsPerScanLine;
    };

    struct EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE {
        uint32_t MaxMode;
        uint32_t Mode;
        EFI_GRAPHICS_OUTPUT_MODE_INFORMATION* Info;
        UINTN SizeOfInfo;
        EFI_PHYSICAL_ADDRESS FrameBufferBase;
        UINTN FrameBufferSize;
    };

    struct EFI_GRAPHICS_OUTPUT_PROTOCOL {
        void* QueryMode;
        void* SetMode;
        void* Blt;
        EFI_GRAPHICS_OUTPUT_PROTOCOL_MODE* Mode;
    };

} // namespace firmware::efi

namespace firmware::efi
{
    // Converts ASCII 's' to a NUL-terminated UCS-2 string, truncating if needed
    void ToChar16(const char* s, CHAR16* out, size_t max);

    struct MemoryMapInfo {
        UINTN mmi_size = 0;
        UINTN mmi_key = 0;
        UINTN mmi_descriptor_size = 0;
    };

    bool GetMemoryMap(EFI_SYSTEM_TABLE* st, void* buffer, size_t buffer_size, MemoryMapInfo& info);

    // Claims [base, base + length) from the firmware as loader data
    bool ClaimPages(EFI_SYSTEM_TABLE* st, addr_t base, uint64_t length);
    bool ReleasePages(EFI_SYSTEM_TABLE* st, addr_t base, uint64_t length);

    // Terminates boot services; retries once with a fresh map key
    bool ExitBootServices(EFI_SYSTEM_TABLE* st, EFI_HANDLE image, void* buffer, size_t buffer_size);

    // Stores handles carrying 'protocol' in 'handles'; returns the number stored
    size_t LocateHandles(EFI_SYSTEM_TABLE* st, const EFI_GUID& protocol, EFI_HANDLE* handles, size_t max);

    void* GetProtocol(EFI_SYSTEM_TABLE* st, EFI_HANDLE handle, const EFI_GUID& protocol);

    // Reads a variable under the loader vendor GUID; 'length' receives its size
    bool GetVariable(EFI_SYSTEM_TABLE* st, const char* name, void* buffer, size_t size, size_t& length);

} // namespace firmware::efi
