/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/config.h"
#include "loader/firmware/efi.h"
#include "loader/firmware/fdt.h"
#include "loader/firmware/multiboot.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"
#include <ferry/util/utf8.h>
#include <ferry/util/utility.h>

namespace config
{
    namespace
    {
        constexpr const char OptionsVariable[] = "FerryOptions";

        bool IsSpace(char ch) { return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r'; }

        // Copies at most 'length' characters of 's', always terminating 'dest'
        void CopyString(char* dest, size_t size, const char* s, size_t length)
        {
            length = util::min(length, size - 1);
            memcpy(dest, s, length);
            dest[length] = '\0';
        }

        // If the token [s, s + length) is 'key=value', returns the value
        const char* MatchValue(const char* s, size_t length, const char* key)
        {
            const size_t key_len = strlen(key);
            if (length <= key_len || strncmp(s, key, key_len) != 0 || s[key_len] != '=')
                return nullptr;
            return s + key_len + 1;
        }

        bool MatchFlag(const char* s, size_t length, const char* flag)
        {
            return length == strlen(flag) && strncmp(s, flag, length) == 0;
        }

        // Name a module gets if none is given: the last component of its locator
        const char* GetBaseName(const char* locator)
        {
            const char* name = locator;
            for (const char* p = locator; *p != '\0'; p++)
                if (*p == '\\' || *p == '/')
                    name = p + 1;
            return *name != '\0' ? name : locator;
        }

        void AddModule(Options& options, const char* value, size_t length)
        {
            ModuleOption mo;
            const char* comma = static_cast<const char*>(memchr(value, ',', length));
            const size_t locator_len = comma != nullptr ? comma - value : length;
            if (locator_len == 0 || locator_len >= sizeof(mo.mo_locator)) {
                TRACE(PIPELINE, WARN, "ignoring module with a bad locator");
                return;
            }
            CopyString(mo.mo_locator, sizeof(mo.mo_locator), value, locator_len);
            if (comma != nullptr && comma + 1 < value + length)
                util::copy_utf8(mo.mo_name, sizeof(mo.mo_name), comma + 1, value + length - (comma + 1));
            else
                util::copy_utf8(
                    mo.mo_name, sizeof(mo.mo_name), GetBaseName(mo.mo_locator), strlen(GetBaseName(mo.mo_locator)));

            if (!options.o_modules.push_back(mo))
                TRACE(PIPELINE, WARN, "more than %d modules, ignoring '%s'", static_cast<int>(image::MaxModules), mo.mo_locator);
        }

        void ReadUefi(const LoaderContext& lc, char* buffer, size_t size)
        {
            size_t length;
            if (!firmware::efi::GetVariable(
                    lc.lc_platform.pd_efi_system_table, OptionsVariable, buffer, size - 1, length))
                return;
            buffer[length] = '\0';
        }

        void ReadMultiboot(const LoaderContext& lc, char* buffer, size_t size)
        {
            auto tag = firmware::multiboot::FindTag(lc.lc_physmem, lc.lc_platform.pd_multiboot_info, MULTIBOOT2_TAG_TYPE_CMDLINE);
            if (tag == nullptr)
                return;
            auto s = reinterpret_cast<const char*>(tag) + sizeof(MULTIBOOT2_TAG);
            CopyString(buffer, size, s, strnlen(s, tag->mt_size - sizeof(MULTIBOOT2_TAG)));
        }

        void ReadDeviceTree(const LoaderContext& lc, char* buffer, size_t size)
        {
            firmware::fdt::Blob blob;
            if (!blob.Attach(lc.lc_physmem, lc.lc_platform.pd_dtb))
                return;
            const auto chosen = blob.FindNode("/chosen");
            if (chosen == firmware::fdt::InvalidNode)
                return;
            auto bootargs = blob.GetProperty(chosen, "bootargs");
            if (!bootargs.IsValid())
                return;
            const char* s = bootargs.AsString();
            if (s != nullptr)
                CopyString(buffer, size, s, strnlen(s, bootargs.p_length));
        }

        void ReadStage1(const LoaderContext& lc, char* buffer, size_t size)
        {
            const addr_t cmdline = lc.lc_platform.pd_stage1_cmdline;
            if (cmdline == 0)
                return;
            size_t n = 0;
            for (; n < size - 1; n++) {
                if (!lc.lc_physmem.Read(cmdline + n, &buffer[n], 1) || buffer[n] == '\0')
                    break;
            }
            buffer[n] = '\0';
        }

    } // unnamed namespace

    void Parse(const char* s, Options& options)
    {
        options = Options{};
        CopyString(options.o_command_line, sizeof(options.o_command_line), s, strlen(s));

        const char* cur = s;
        while (true) {
            while (IsSpace(*cur))
                cur++;
            if (*cur == '\0')
                break;

            // append= takes everything that follows, spaces included
            if (strncmp(cur, "append=", 7) == 0) {
                const char* value = cur + 7;
                CopyString(options.o_command_line, sizeof(options.o_command_line), value, strlen(value));
                break;
            }

            const char* end = cur;
            while (*end != '\0' && !IsSpace(*end))
                end++;
            const size_t length = end - cur;

            if (auto value = MatchValue(cur, length, "kernel"); value != nullptr) {
                const size_t value_len = end - value;
                if (value_len > 0 && value_len < sizeof(options.o_kernel)) {
                    CopyString(options.o_kernel, sizeof(options.o_kernel), value, value_len);
                    options.o_has_kernel = true;
                }
            } else if (auto value = MatchValue(cur, length, "module"); value != nullptr) {
                AddModule(options, value, end - value);
            } else if (auto value = MatchValue(cur, length, "loglevel"); value != nullptr) {
                if (end - value == 1 && *value >= '0' && *value <= '3')
                    options.o_loglevel = *value - '0';
            } else if (MatchFlag(cur, length, "debug")) {
                options.o_debug = true;
            } else if (MatchFlag(cur, length, "no_decompress")) {
                options.o_no_decompress = true;
            } else if (MatchFlag(cur, length, "quiet")) {
                options.o_quiet = true;
            }
            cur = end;
        }
    }

    int GetLogLevel(const Options& options)
    {
        if (options.o_quiet)
            return LogLevelErrors;
        if (options.o_debug)
            return LogLevelAll;
        if (options.o_loglevel >= 0)
            return options.o_loglevel;
        return LogLevelWarnings;
    }

    void Apply(const Options& options)
    {
        int mask = trace::level::ERROR;
        switch (GetLogLevel(options)) {
            case LogLevelAll:
                mask = trace::level::ALL;
                break;
            case LogLevelInfo:
                mask |= trace::level::INFO;
                [[fallthrough]];
            case LogLevelWarnings:
                mask |= trace::level::WARN;
                break;
        }
        trace::SetAll(mask);
    }

    void ReadSource(const LoaderContext& lc, char* buffer, size_t size)
    {
        buffer[0] = '\0';
        switch (lc.lc_platform.pd_mode) {
            case FirmwareMode::UEFI:
                ReadUefi(lc, buffer, size);
                break;
            case FirmwareMode::DirectLongMode:
                ReadMultiboot(lc, buffer, size);
                break;
            case FirmwareMode::DeviceTree:
                ReadDeviceTree(lc, buffer, size);
                break;
            case FirmwareMode::LegacyBIOS:
                ReadStage1(lc, buffer, size);
                break;
        }
    }

} // namespace config
