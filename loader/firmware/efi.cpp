/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/firmware/efi.h"
#include "loader/lib.h"
#include "loader/trace.h"

namespace firmware::efi
{
    namespace
    {
        UINTN PagesFor(uint64_t length) { return (length + PAGE_SIZE - 1) / PAGE_SIZE; }
    } // unnamed namespace

    void ToChar16(const char* s, CHAR16* out, size_t max)
    {
        size_t n = 0;
        for (/* nothing */; n + 1 < max && s[n] != '\0'; n++)
            out[n] = static_cast<unsigned char>(s[n]);
        out[n] = 0;
    }

    bool GetMemoryMap(EFI_SYSTEM_TABLE* st, void* buffer, size_t buffer_size, MemoryMapInfo& info)
    {
        UINTN size = buffer_size;
        uint32_t version;
        const auto status = st->BootServices->GetMemoryMap(
            &size, static_cast<EFI_MEMORY_DESCRIPTOR*>(buffer), &info.mmi_key, &info.mmi_descriptor_size,
            &version);
        if (EFI_ERROR(status)) {
            TRACE(FIRMWARE, ERROR, "GetMemoryMap failed, status %llx (%llu bytes needed)",
                static_cast<unsigned long long>(status), static_cast<unsigned long long>(size));
            return false;
        }
        if (info.mmi_descriptor_size < sizeof(EFI_MEMORY_DESCRIPTOR))
            return false;
        info.mmi_size = size;
        return true;
    }

    bool ClaimPages(EFI_SYSTEM_TABLE* st, addr_t base, uint64_t length)
    {
        EFI_PHYSICAL_ADDRESS address = base;
        const auto status =
            st->BootServices->AllocatePages(AllocateAddress, EfiLoaderData, PagesFor(length), &address);
        if (EFI_ERROR(status)) {
            TRACE(FIRMWARE, ERROR, "cannot claim %llx (%llu bytes), status %llx",
                static_cast<unsigned long long>(base), static_cast<unsigned long long>(length),
                static_cast<unsigned long long>(status));
            return false;
        }
        return true;
    }

    bool ReleasePages(EFI_SYSTEM_TABLE* st, addr_t base, uint64_t length)
    {
        return !EFI_ERROR(st->BootServices->FreePages(base, PagesFor(length)));
    }

    bool ExitBootServices(EFI_SYSTEM_TABLE* st, EFI_HANDLE image, void* buffer, size_t buffer_size)
    {
        for (int attempt = 0; attempt < 2; attempt++) {
            MemoryMapInfo info;
            if (!GetMemoryMap(st, buffer, buffer_size, info))
                return false;
            const auto status = st->BootServices->ExitBootServices(image, info.mmi_key);
            if (status == EFI_SUCCESS)
                return true;
            if (status != EFI_INVALID_PARAMETER)
                break;
            // The map changed under us; refresh the key and try once more
        }
        return false;
    }

    size_t LocateHandles(EFI_SYSTEM_TABLE* st, const EFI_GUID& protocol, EFI_HANDLE* handles, size_t max)
    {
        UINTN size = max * sizeof(EFI_HANDLE);
        const auto status = st->BootServices->LocateHandle(ByProtocol, &protocol, nullptr, &size, handles);
        if (status == EFI_BUFFER_TOO_SMALL) {
            TRACE(FIRMWARE, WARN, "more than %d handles, ignoring the rest", static_cast<int>(max));
            return 0;
        }
        if (EFI_ERROR(status))
            return 0;
        return size / sizeof(EFI_HANDLE);
    }

    void* GetProtocol(EFI_SYSTEM_TABLE* st, EFI_HANDLE handle, const EFI_GUID& protocol)
    {
        void* interface = nullptr;
        if (EFI_ERROR(st->BootServices->HandleProtocol(handle, &protocol, &interface)))
            return nullptr;
        return interface;
    }

    bool GetVariable(EFI_SYSTEM_TABLE* st, const char* name, void* buffer, size_t size, size_t& length)
    {
        CHAR16 name16[64];
        ToChar16(name, name16, sizeof(name16) / sizeof(name16[0]));

        UINTN data_size = size;
        const auto status =
            st->RuntimeServices->GetVariable(name16, &FerryVendorGuid, nullptr, &data_size, buffer);
        if (EFI_ERROR(status))
            return false;
        length = data_size;
        return true;
    }

} // namespace firmware::efi
