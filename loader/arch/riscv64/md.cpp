/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/md.h"
#include "loader/handoff.h"
#include "loader/platform.h"

#define SBI_CONSOLE_PUTCHAR 1
#define SSTATUS_SIE (1 << 1)

namespace md
{
    uint16_t GetMachine() { return ENTRY_MACHINE_RISCV; }

    void NativeConsolePutChar(int ch)
    {
        register uint64_t a0 __asm("a0") = ch;
        register uint64_t a7 __asm("a7") = SBI_CONSOLE_PUTCHAR;
        __asm volatile("ecall" : "+r"(a0) : "r"(a7) : "memory");
    }

    void Halt()
    {
        for (;;)
            __asm volatile("csrci sstatus, %0\n"
                           "wfi\n"
                           :
                           : "i"(SSTATUS_SIE));
    }

    void Jump(const HandoffContext& context)
    {
        register uint64_t a0 __asm("a0") = context.hc_argument;
        __asm volatile("csrci sstatus, %0\n"
                       "csrw sie, zero\n"
                       "fence rw, rw\n"
                       "csrw satp, %1\n"
                       "sfence.vma\n"
                       "fence.i\n"
                       "mv sp, %2\n"
                       "jr %3\n"
                       :
                       : "i"(SSTATUS_SIE), "r"(context.hc_tables.t_satp), "r"(context.hc_stack_top),
                         "r"(context.hc_entry), "r"(a0)
                       : "memory");
        Halt();
    }

} // namespace md
