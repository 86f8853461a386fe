/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <stdarg.h>
#include "loader/console.h"
#include "loader/lib.h"
#include "loader/md.h"

namespace
{
    constexpr int PrintBufferSize = 256;
    bool panicking = false;
} // unnamed namespace

void kprintf(const char* fmt, ...)
{
    char buf[PrintBufferSize];

    va_list va;
    va_start(va, fmt);
    vsnprintf(buf, sizeof(buf), fmt, va);
    va_end(va);

    console::PutString(buf);
}

void _panic(const char* file, const char* func, int line, const char* fmt, ...)
{
    if (panicking) {
        console::PutString("double panic - dying!\n");
        md::Halt();
    }
    panicking = true;

    kprintf("panic in %s:%u (%s): ", file, line, func);

    char buf[PrintBufferSize];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    console::PutString(buf);
    console::PutString("\n");

    md::Halt();
}
