/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/console.h"
#include "loader/firmware/bios.h"
#include "loader/firmware/efi.h"
#include "loader/lib.h"
#include "loader/md.h"
#include "loader/physmem.h"

namespace console
{
    namespace
    {
        Output output;

        // Holds the most recent output; the oldest half is discarded once full
        char backlog[BacklogSize + 1];
        size_t backlog_pos = 0;

        void AddToBacklog(char ch)
        {
            if (backlog_pos == BacklogSize) {
                constexpr size_t keep = BacklogSize / 2;
                memmove(backlog, backlog + BacklogSize - keep, keep);
                backlog_pos = keep;
            }
            backlog[backlog_pos++] = ch;
            backlog[backlog_pos] = '\0';
        }

        void UefiPutChar(int ch)
        {
            using namespace firmware::efi;
            CHAR16 s[3]{};
            int n = 0;
            if (ch == '\n')
                s[n++] = '\r';
            s[n++] = static_cast<CHAR16>(ch);
            output.o_conout->OutputString(output.o_conout, s);
        }

        void Pl011PutChar(int ch)
        {
            constexpr addr_t UARTDR = 0x00;
            constexpr addr_t UARTFR = 0x18;
            constexpr uint32_t UARTFR_TXFF = (1 << 5);

            auto dr = output.o_physmem->MapAs<volatile uint32_t>(output.o_uart_base + UARTDR);
            auto fr = output.o_physmem->MapAs<volatile uint32_t>(output.o_uart_base + UARTFR);
            if (dr == nullptr || fr == nullptr)
                return;
            while (*fr & UARTFR_TXFF)
                /* wait for room in the transmit FIFO */;
            *dr = ch;
        }

        void BackendPutChar(int ch)
        {
            switch (output.o_backend) {
                case Backend::None:
                    break;
                case Backend::UefiConOut:
                    UefiPutChar(ch);
                    break;
                case Backend::BiosTeletype:
                    if (ch == '\n')
                        firmware::bios::PutChar(output.o_realmode_call, '\r');
                    firmware::bios::PutChar(output.o_realmode_call, ch);
                    break;
                case Backend::Uart16550:
                case Backend::SbiLegacy:
                    if (ch == '\n')
                        md::NativeConsolePutChar('\r');
                    md::NativeConsolePutChar(ch);
                    break;
                case Backend::Pl011:
                    if (ch == '\n')
                        Pl011PutChar('\r');
                    Pl011PutChar(ch);
                    break;
            }
        }

    } // unnamed namespace

    void SetOutput(const Output& o)
    {
        output = o;
        // Refuse backends that lack what they need to work
        if ((output.o_backend == Backend::UefiConOut && output.o_conout == nullptr) ||
            (output.o_backend == Backend::BiosTeletype && output.o_realmode_call == nullptr) ||
            (output.o_backend == Backend::Pl011 && output.o_physmem == nullptr))
            output.o_backend = Backend::None;
    }

    Backend GetBackend() { return output.o_backend; }

    void PutChar(int ch)
    {
        AddToBacklog(static_cast<char>(ch));
        BackendPutChar(ch);
    }

    void PutString(const char* s)
    {
        for (int c = *s++; c != 0; c = *s++)
            PutChar(c);
    }

    const char* GetBacklog() { return backlog; }

    void ClearBacklog()
    {
        backlog_pos = 0;
        backlog[0] = '\0';
    }

} // namespace console
