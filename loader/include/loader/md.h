/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>

struct HandoffContext;

/*
 * Machine-dependent operations for the architecture the loader is built for;
 * these are the only places where privileged state is touched.
 */
namespace md
{
    // ENTRY_MACHINE_... value of the architecture we are built for
    uint16_t GetMachine();

    // Writes a character to the architecture's native debug console (16550 on x86, SBI on RISC-V)
    void NativeConsolePutChar(int ch);

    [[noreturn]] void Halt();

    // Installs the context's translation tables and transfers control to the kernel
    [[noreturn]] void Jump(const HandoffContext& context);

} // namespace md
