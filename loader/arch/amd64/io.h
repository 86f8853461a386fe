/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2018 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>

static inline void outb(uint16_t port, uint8_t data)
{
    __asm volatile("outb %0, %w1" : : "a"(data), "d"(port));
}

static inline uint8_t inb(uint16_t port)
{
    uint8_t a;
    __asm volatile("inb %w1, %0" : "=a"(a) : "d"(port));
    return a;
}
