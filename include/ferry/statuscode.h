/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2020 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_STATUSCODE_H
#define FERRY_STATUSCODE_H

#include <ferry/types.h>

// on failure: bit 31 = set, and the error kind is contained in the other bits
// on success: bit 31 = clear, and the result is contained in the other bits
static inline unsigned int ferry_statuscode_extract_error(statuscode_t n) { return n & 0x7fffffff; }
static inline unsigned int ferry_statuscode_extract_value(statuscode_t n) { return n & 0x7fffffff; }

static inline statuscode_t ferry_statuscode_make_failure(unsigned int no)
{
    return (1u << 31) | no;
}

static inline int ferry_statuscode_is_success(statuscode_t val) { return (val & 0x80000000) == 0; }

static inline int ferry_statuscode_is_failure(statuscode_t val)
{
    return !ferry_statuscode_is_success(val);
}

static inline statuscode_t ferry_statuscode_make_success(unsigned int val)
{
    return val & 0x7fffffff;
}

#endif /* FERRY_STATUSCODE_H */
