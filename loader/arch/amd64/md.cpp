/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/md.h"
#include "loader/handoff.h"
#include "loader/platform.h"
#include "io.h"

#define SIO_PORT 0x3f8 /* COM1 */
#define SIO_REG_DATA 0
#define SIO_REG_LSR 5
#define SIO_LSR_THRE 0x20

#define PIC1_DATA 0x21
#define PIC2_DATA 0xa1

namespace md
{
    uint16_t GetMachine() { return ENTRY_MACHINE_X86_64; }

    void NativeConsolePutChar(int ch)
    {
        while ((inb(SIO_PORT + SIO_REG_LSR) & SIO_LSR_THRE) == 0)
            /* wait for the transmit buffer to become empty */;
        outb(SIO_PORT + SIO_REG_DATA, ch);
    }

    void Halt()
    {
        for (;;)
            __asm volatile("cli\n"
                           "hlt\n");
    }

    void Jump(const HandoffContext& context)
    {
        if (context.hc_mask_interrupts) {
            outb(PIC1_DATA, 0xff);
            outb(PIC2_DATA, 0xff);
        }
        __asm volatile("cli");

        /*
         * Install the new tables, serialize and enter the kernel with the boot
         * information in %rdi. The fake return address keeps the SysV stack
         * alignment.
         */
        __asm volatile("movq %0, %%cr3\n"
                       "mfence\n"
                       "xorl %%eax, %%eax\n"
                       "cpuid\n"
                       "movq %1, %%rsp\n"
                       "pushq $0\n"
                       "jmp *%2\n"
                       :
                       : "r"(context.hc_tables.t_root), "r"(context.hc_stack_top), "r"(context.hc_entry),
                         "D"(context.hc_argument)
                       : "rax", "rbx", "rcx", "rdx", "memory");
        Halt();
    }

} // namespace md
