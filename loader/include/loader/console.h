/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>

namespace firmware::efi
{
    struct EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL;
}

class PhysicalMemory;
struct REALMODE_REGS;

namespace console
{
    // Where console output ends up, besides the backlog
    enum class Backend {
        None,
        UefiConOut,
        BiosTeletype,
        Uart16550,
        Pl011,
        SbiLegacy,
    };

    struct Output {
        Backend o_backend = Backend::None;
        firmware::efi::EFI_SIMPLE_TEXT_OUTPUT_PROTOCOL* o_conout = nullptr;
        void (*o_realmode_call)(REALMODE_REGS&) = nullptr;
        PhysicalMemory* o_physmem = nullptr;
        addr_t o_uart_base = 0;
    };

    static constexpr size_t BacklogSize = 1024;

    void SetOutput(const Output& output);
    Backend GetBackend();

    void PutChar(int ch);
    void PutString(const char* s);

    // Most recent console output, oldest characters first
    const char* GetBacklog();
    void ClearBacklog();

} // namespace console
