/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include <ferry/util/fixed_vector.h>
#include "loader/bootdevice.h"
#include "loader/image.h"

struct LoaderContext;

namespace config
{
    static constexpr size_t MaxLength = 1024;

    struct ModuleOption {
        char mo_locator[Locator::MaxPathLength] = {};
        char mo_name[Module::NameLength] = {};
    };

    /*
     * Loader options, parsed from a whitespace-separated string. Everything
     * we do not recognize is left for the kernel.
     */
    struct Options {
        // kernel=
        bool o_has_kernel = false;
        char o_kernel[Locator::MaxPathLength] = {};
        // What ends up in the CommandLine section
        char o_command_line[MaxLength] = {};
        util::fixed_vector<ModuleOption, image::MaxModules> o_modules;
        bool o_debug = false;
        bool o_no_decompress = false;
        bool o_quiet = false;
        int o_loglevel = -1; // -1 if not given
    };

    static constexpr int LogLevelErrors = 0;
    static constexpr int LogLevelWarnings = 1;
    static constexpr int LogLevelInfo = 2;
    static constexpr int LogLevelAll = 3;

    void Parse(const char* s, Options& options);

    // Log level the options ask for; 'quiet' beats 'debug' beats 'loglevel='
    int GetLogLevel(const Options& options);

    // Sets the trace masks
    void Apply(const Options& options);

    /*
     * Copies the option string the firmware has for us into 'buffer'; an
     * empty string if there is none.
     */
    void ReadSource(const LoaderContext& lc, char* buffer, size_t size);

} // namespace config
