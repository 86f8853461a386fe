/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>

struct LoaderContext;

struct Framebuffer {
    addr_t fb_base = 0;
    uint32_t fb_width = 0;
    uint32_t fb_height = 0;
    uint32_t fb_pitch = 0;
    uint8_t fb_bpp = 0;
    uint8_t fb_red_size = 0;
    uint8_t fb_red_shift = 0;
    uint8_t fb_green_size = 0;
    uint8_t fb_green_shift = 0;
    uint8_t fb_blue_size = 0;
    uint8_t fb_blue_shift = 0;

    uint64_t GetSize() const { return static_cast<uint64_t>(fb_pitch) * fb_height; }
};

namespace framebuffer
{
    // Only 32-bit direct colour framebuffers are reported
    bool Discover(const LoaderContext& lc, Framebuffer& fb);

    // Whether 'fb' is something a kernel can draw on
    bool IsUsable(const Framebuffer& fb);

} // namespace framebuffer
