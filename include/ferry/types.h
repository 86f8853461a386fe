/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#ifndef FERRY_TYPES_H
#define FERRY_TYPES_H

#include <stddef.h>
#include <stdint.h>

/* Physical addresses are 64 bits wide on every supported architecture */
typedef uint64_t addr_t;

typedef uint32_t statuscode_t;

#endif /* FERRY_TYPES_H */
