/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <cstring>
#include <string>
#include <vector>
#include "loader/firmware/multiboot.h"
#include "loader/platform.h"

namespace fake
{
    // Assembles a Multiboot2 boot information structure, as GRUB would pass it
    class MultibootInfo
    {
      public:
        void AddCommandLine(const std::string& cmdline)
        {
            std::vector<uint8_t> payload(cmdline.begin(), cmdline.end());
            payload.push_back(0);
            AddTag(MULTIBOOT2_TAG_TYPE_CMDLINE, payload);
        }

        void AddModule(uint32_t start, uint32_t end, const std::string& string = "")
        {
            std::vector<uint8_t> payload(8);
            memcpy(&payload[0], &start, sizeof(start));
            memcpy(&payload[4], &end, sizeof(end));
            payload.insert(payload.end(), string.begin(), string.end());
            payload.push_back(0);
            AddTag(MULTIBOOT2_TAG_TYPE_MODULE, payload);
        }

        void AddMemory(uint64_t base, uint64_t length, uint32_t type)
        {
            MULTIBOOT2_MMAP_ENTRY me{};
            me.me_base = base;
            me.me_length = length;
            me.me_type = type;
            mi_Memory.push_back(me);
        }

        void AddFramebuffer(uint64_t base, uint32_t width, uint32_t height)
        {
            MULTIBOOT2_TAG_FRAMEBUFFER mf{};
            mf.mf_addr = base;
            mf.mf_pitch = width * 4;
            mf.mf_width = width;
            mf.mf_height = height;
            mf.mf_bpp = 32;
            mf.mf_type = MULTIBOOT2_FRAMEBUFFER_TYPE_RGB;
            mf.mf_red_field_position = 16;
            mf.mf_red_mask_size = 8;
            mf.mf_green_field_position = 8;
            mf.mf_green_mask_size = 8;
            mf.mf_blue_field_position = 0;
            mf.mf_blue_mask_size = 8;
            auto p = reinterpret_cast<const uint8_t*>(&mf);
            AddTag(MULTIBOOT2_TAG_TYPE_FRAMEBUFFER, std::vector<uint8_t>(p + sizeof(MULTIBOOT2_TAG), p + sizeof(mf)));
        }

        // The memory map tag goes last, followed by the end tag
        std::vector<uint8_t> Build() const
        {
            std::vector<uint8_t> info = mi_Tags;
            if (!mi_Memory.empty()) {
                std::vector<uint8_t> payload(8);
                const uint32_t entry_size = sizeof(MULTIBOOT2_MMAP_ENTRY), entry_version = 0;
                memcpy(&payload[0], &entry_size, sizeof(entry_size));
                memcpy(&payload[4], &entry_version, sizeof(entry_version));
                for (const auto& me : mi_Memory) {
                    auto p = reinterpret_cast<const uint8_t*>(&me);
                    payload.insert(payload.end(), p, p + sizeof(me));
                }
                Append(info, MULTIBOOT2_TAG_TYPE_MMAP, payload);
            }
            Append(info, MULTIBOOT2_TAG_TYPE_END, {});

            const uint32_t total = static_cast<uint32_t>(info.size());
            memcpy(&info[0], &total, sizeof(total));
            return info;
        }

        static EntryState MakeEntryState(addr_t info)
        {
            EntryState entry;
            entry.es_machine = ENTRY_MACHINE_X86_64;
            entry.es_xlen = 64;
            entry.es_multiboot_magic = MULTIBOOT2_BOOTLOADER_MAGIC;
            entry.es_multiboot_info = info;
            entry.es_loader_base = 0x10000;
            entry.es_loader_size = 0x10000;
            return entry;
        }

      private:
        static void Append(std::vector<uint8_t>& info, uint32_t type, const std::vector<uint8_t>& payload)
        {
            MULTIBOOT2_TAG tag{ type, static_cast<uint32_t>(sizeof(MULTIBOOT2_TAG) + payload.size()) };
            auto p = reinterpret_cast<const uint8_t*>(&tag);
            info.insert(info.end(), p, p + sizeof(tag));
            info.insert(info.end(), payload.begin(), payload.end());
            info.resize((info.size() + 7) & ~static_cast<size_t>(7));
        }

        void AddTag(uint32_t type, const std::vector<uint8_t>& payload) { Append(mi_Tags, type, payload); }

        // Starts out as the fixed part; mi_total_size is filled in by Build()
        std::vector<uint8_t> mi_Tags = std::vector<uint8_t>(sizeof(MULTIBOOT2_INFO));
        std::vector<MULTIBOOT2_MMAP_ENTRY> mi_Memory;
    };

} // namespace fake
