/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#define KASSERT(x, msg, args...) \
    if (!(x))                    \
    _panic(__FILE__, __func__, __LINE__, msg, ##args)

#define panic(msg, args...) _panic(__FILE__, __func__, __LINE__, msg, ##args)

/* Rounds up 'n' to a multiple of 'mult' */
#define ROUND_UP(n, mult) (((n) % (mult) == 0) ? (n) : (n) + ((mult) - (n) % (mult)))

/* Rounds down 'n' to a multiple of 'mult' */
#define ROUND_DOWN(n, mult) (((n) % (mult) == 0) ? (n) : (n) - (n) % (mult))

#define PAGE_SIZE 4096

#define KiB(n) (static_cast<uint64_t>(n) * 1024)
#define MiB(n) (KiB(n) * 1024)
#define GiB(n) (MiB(n) * 1024)

extern "C" {

void kprintf(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
[[noreturn]] void _panic(const char* file, const char* func, int line, const char* fmt, ...);

} // extern "C"
