/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2018 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <stdarg.h>
#include "loader/console.h"
#include "loader/lib.h"
#include "loader/trace.h"

namespace trace
{
    namespace detail
    {
        static constexpr int BufSize = 256;

        util::array<uint32_t, NumberOfSubSystems> subsystem_mask{ { level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN,
                                                                    level::ERROR | level::WARN } };

        void tracef(const char* func, const char* fmt, ...)
        {
            char buf[BufSize];
            snprintf(buf, sizeof(buf), "%s: ", func);

            va_list va;
            va_start(va, fmt);
            vsnprintf(buf + strlen(buf), sizeof(buf) - strlen(buf) - 2, fmt, va);
            buf[sizeof(buf) - 2] = '\0';
            strcat(buf, "\n");
            va_end(va);

            console::PutString(buf);
        }

    } // namespace detail

    void Enable(SubSystem ss, int mask) { detail::subsystem_mask[static_cast<int>(ss)] |= mask; }

    void Disable(SubSystem ss, int mask) { detail::subsystem_mask[static_cast<int>(ss)] &= ~mask; }

    void SetAll(int mask) { detail::subsystem_mask.fill(mask); }

} // namespace trace
