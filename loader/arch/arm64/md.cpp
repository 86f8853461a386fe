/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/md.h"
#include "loader/handoff.h"
#include "loader/platform.h"

namespace md
{
    uint16_t GetMachine() { return ENTRY_MACHINE_AARCH64; }

    // There is no architectural console; the PL011 backend is used instead
    void NativeConsolePutChar(int) {}

    void Halt()
    {
        for (;;)
            __asm volatile("msr daifset, #0xf\n"
                           "wfi\n");
    }

    void Jump(const HandoffContext& context)
    {
        register uint64_t x0 __asm("x0") = context.hc_argument;
        const auto& tables = context.hc_tables;

        /*
         * Mask everything, drop from EL2 to EL1 if we were started there, then
         * install the tables and enable the MMU and caches.
         */
        __asm volatile("msr daifset, #0xf\n"
                       "mrs x9, CurrentEL\n"
                       "cmp x9, #(2 << 2)\n"
                       "b.ne 1f\n"
                       "mov x9, #(1 << 31)\n" /* HCR_EL2.RW: EL1 is AArch64 */
                       "msr hcr_el2, x9\n"
                       "mov x9, #0x3c5\n" /* EL1h, DAIF masked */
                       "msr spsr_el2, x9\n"
                       "mov x9, sp\n"
                       "msr sp_el1, x9\n"
                       "adr x9, 1f\n"
                       "msr elr_el2, x9\n"
                       "eret\n"
                       "1:\n"
                       "msr mair_el1, %0\n"
                       "msr tcr_el1, %1\n"
                       "msr ttbr0_el1, %2\n"
                       "msr ttbr1_el1, %3\n"
                       "isb\n"
                       "tlbi vmalle1\n"
                       "dsb sy\n"
                       "isb\n"
                       "mrs x9, sctlr_el1\n"
                       "orr x9, x9, #(1 << 0)\n"  /* M */
                       "orr x9, x9, #(1 << 2)\n"  /* C */
                       "orr x9, x9, #(1 << 12)\n" /* I */
                       "msr sctlr_el1, x9\n"
                       "isb\n"
                       "mov sp, %4\n"
                       "br %5\n"
                       :
                       : "r"(tables.t_mair), "r"(tables.t_tcr), "r"(tables.t_root), "r"(tables.t_root_high),
                         "r"(context.hc_stack_top), "r"(context.hc_entry), "r"(x0)
                       : "x9", "memory");
        Halt();
    }

} // namespace md
