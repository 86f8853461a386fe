/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/console.h"
#include "loader/lib.h"
#include "loader/md.h"
#include "loader/physmem.h"
#include "loader/pipeline.h"
#include "loader/platform.h"
#include "loader/scratch.h"

namespace
{
    Scratch scratch;
    PhysicalMemory physmem;

    // Picks a console from what the firmware gave us; the probe has not run yet
    void SetupConsole(const EntryState& entry)
    {
        console::Output output;
        if (entry.es_efi_system_table != nullptr) {
            output.o_backend = console::Backend::UefiConOut;
            output.o_conout = entry.es_efi_system_table->ConOut;
        } else if (entry.es_realmode_call != nullptr) {
            output.o_backend = console::Backend::BiosTeletype;
            output.o_realmode_call = entry.es_realmode_call;
        } else if (entry.es_machine == ENTRY_MACHINE_X86_64) {
            output.o_backend = console::Backend::Uart16550;
        } else if (entry.es_machine == ENTRY_MACHINE_RISCV) {
            output.o_backend = console::Backend::SbiLegacy;
        }
        console::SetOutput(output);
    }

} // unnamed namespace

// Called by the entry stub with the state it captured
extern "C" [[noreturn]] void loader_main(const EntryState* entry)
{
    SetupConsole(*entry);
    kprintf("Ferry loader\n");

    pipeline::Pipeline pipeline(physmem, scratch);
    pipeline.Boot(*entry);
}
