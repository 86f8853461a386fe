/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <initializer_list>
#include <string>
#include <vector>
#include "loader/firmware/fdt.h"
#include "loader/platform.h"

namespace fake
{
    /*
     * Writes a flattened device tree, version 17. Nodes are emitted in the
     * order they are opened; property names are deduplicated in the strings
     * block.
     */
    class FdtBuilder
    {
      public:
        FdtBuilder() { BeginNode(""); }

        FdtBuilder& BeginNode(const std::string& name)
        {
            PutToken(FDT_BEGIN_NODE);
            fb_Struct.insert(fb_Struct.end(), name.begin(), name.end());
            fb_Struct.push_back(0);
            Pad();
            return *this;
        }

        FdtBuilder& EndNode()
        {
            PutToken(FDT_END_NODE);
            return *this;
        }

        FdtBuilder& Property(const std::string& name, const std::vector<uint8_t>& value)
        {
            PutToken(FDT_PROP);
            PutToken(static_cast<uint32_t>(value.size()));
            PutToken(GetStringOffset(name));
            fb_Struct.insert(fb_Struct.end(), value.begin(), value.end());
            Pad();
            return *this;
        }

        FdtBuilder& String(const std::string& name, const std::string& value)
        {
            std::vector<uint8_t> bytes(value.begin(), value.end());
            bytes.push_back(0);
            return Property(name, bytes);
        }

        // A string list, such as 'compatible'
        FdtBuilder& Strings(const std::string& name, std::initializer_list<std::string> values)
        {
            std::vector<uint8_t> bytes;
            for (const auto& s : values) {
                bytes.insert(bytes.end(), s.begin(), s.end());
                bytes.push_back(0);
            }
            return Property(name, bytes);
        }

        FdtBuilder& Cells(const std::string& name, std::initializer_list<uint32_t> cells)
        {
            std::vector<uint8_t> bytes;
            for (auto cell : cells)
                PutBe32(bytes, cell);
            return Property(name, bytes);
        }

        // 'reg' with two address and two size cells per entry
        FdtBuilder& Reg64(std::initializer_list<uint64_t> values)
        {
            std::vector<uint8_t> bytes;
            for (auto v : values) {
                PutBe32(bytes, static_cast<uint32_t>(v >> 32));
                PutBe32(bytes, static_cast<uint32_t>(v));
            }
            return Property("reg", bytes);
        }

        FdtBuilder& AddReservation(uint64_t address, uint64_t size)
        {
            fb_Reservations.push_back({ address, size });
            return *this;
        }

        // Closes the root node and lays everything out
        std::vector<uint8_t> Build()
        {
            EndNode();
            PutToken(FDT_END);

            std::vector<uint8_t> rsvmap;
            for (const auto& r : fb_Reservations) {
                PutBe64(rsvmap, r.first);
                PutBe64(rsvmap, r.second);
            }
            PutBe64(rsvmap, 0);
            PutBe64(rsvmap, 0);

            constexpr uint32_t HeaderSize = sizeof(FDT_HEADER);
            const uint32_t off_rsvmap = (HeaderSize + 7) & ~7u;
            const uint32_t off_struct = off_rsvmap + static_cast<uint32_t>(rsvmap.size());
            const uint32_t off_strings = off_struct + static_cast<uint32_t>(fb_Struct.size());
            const uint32_t total = off_strings + static_cast<uint32_t>(fb_Strings.size());

            std::vector<uint8_t> blob;
            for (uint32_t v : { static_cast<uint32_t>(FDT_MAGIC), total, off_struct, off_strings, off_rsvmap, 17u, 16u,
                                0u, static_cast<uint32_t>(fb_Strings.size()), static_cast<uint32_t>(fb_Struct.size()) })
                PutBe32(blob, v);
            blob.resize(off_rsvmap);
            blob.insert(blob.end(), rsvmap.begin(), rsvmap.end());
            blob.insert(blob.end(), fb_Struct.begin(), fb_Struct.end());
            blob.insert(blob.end(), fb_Strings.begin(), fb_Strings.end());
            return blob;
        }

        static EntryState MakeEntryState(addr_t dtb, uint16_t machine = ENTRY_MACHINE_AARCH64)
        {
            EntryState entry;
            entry.es_machine = machine;
            entry.es_xlen = 64;
            entry.es_dtb = dtb;
            return entry;
        }

      private:
        static void PutBe32(std::vector<uint8_t>& v, uint32_t value)
        {
            for (int shift = 24; shift >= 0; shift -= 8)
                v.push_back(static_cast<uint8_t>(value >> shift));
        }

        static void PutBe64(std::vector<uint8_t>& v, uint64_t value)
        {
            PutBe32(v, static_cast<uint32_t>(value >> 32));
            PutBe32(v, static_cast<uint32_t>(value));
        }

        void PutToken(uint32_t token) { PutBe32(fb_Struct, token); }

        void Pad()
        {
            while (fb_Struct.size() % 4 != 0)
                fb_Struct.push_back(0);
        }

        uint32_t GetStringOffset(const std::string& name)
        {
            for (size_t offset = 0; offset < fb_Strings.size();) {
                const std::string s(reinterpret_cast<const char*>(&fb_Strings[offset]));
                if (s == name)
                    return static_cast<uint32_t>(offset);
                offset += s.size() + 1;
            }
            const auto offset = static_cast<uint32_t>(fb_Strings.size());
            fb_Strings.insert(fb_Strings.end(), name.begin(), name.end());
            fb_Strings.push_back(0);
            return offset;
        }

        std::vector<uint8_t> fb_Struct;
        std::vector<uint8_t> fb_Strings;
        std::vector<std::pair<uint64_t, uint64_t>> fb_Reservations;
    };

} // namespace fake
