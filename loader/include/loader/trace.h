/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2018 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
/*
 * Loader tracing facilities
 *
 * Every subsystem has a mask of enabled levels; TRACE() only formats its
 * arguments if the level is enabled for the subsystem. Output goes to the
 * console, prefixed by the name of the calling function.
 */
#pragma once

#include <ferry/types.h>
#include <ferry/util/array.h>

namespace trace
{
    // Available subsystem trace types
    enum class SubSystem {
        PROBE = 0,      /* Platform probe */
        MEMMAP = 1,     /* Memory map acquisition and bookkeeping */
        DEVICE = 2,     /* Boot device enumeration and reads */
        IMAGE = 3,      /* Kernel image loader */
        DECOMPRESS = 4, /* Staging and decompression */
        BOOTINFO = 5,   /* Boot information builder */
        HANDOFF = 6,    /* Page tables and the final jump */
        FIRMWARE = 7,   /* Firmware adapters */
        PIPELINE = 8,   /* State machine transitions */
        _Last = PIPELINE
    };

    static constexpr int NumberOfSubSystems = static_cast<int>(SubSystem::_Last) + 1;

    // Available tracelevels
    namespace level
    {
        static constexpr int FUNC = 0x0001;  /* Function call tracing */
        static constexpr int ERROR = 0x0002; /* Error report */
        static constexpr int INFO = 0x0004;  /* Information */
        static constexpr int WARN = 0x0008;  /* Warning */
        static constexpr int ALL = 0xffff;   /* Everything */
    }                                        // namespace level

#define TRACE(SUBSYSTEM, LEVEL, EXPR...)                                 \
    (trace::IsEnabled(trace::SubSystem::SUBSYSTEM, trace::level::LEVEL)) \
        ? trace::detail::tracef(__func__, EXPR)                          \
        : (void)0

    namespace detail
    {
        extern util::array<uint32_t, NumberOfSubSystems> subsystem_mask;
        void tracef(const char* func, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
    } // namespace detail

    inline bool IsEnabled(SubSystem ss, int level)
    {
        return (detail::subsystem_mask[static_cast<int>(ss)] & level) != 0;
    }

    void Enable(SubSystem ss, int level);
    void Disable(SubSystem ss, int level);

    // Applies 'level' to every subsystem, replacing the current masks
    void SetAll(int level);

} // namespace trace
