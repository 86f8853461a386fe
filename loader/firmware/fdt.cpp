/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/firmware/fdt.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/trace.h"
#include <ferry/util/endian.h>

namespace firmware::fdt
{
    namespace
    {
        constexpr uint32_t BadOffset = 0xffffffff;

        uint32_t Align4(uint32_t v) { return (v + 3) & ~3u; }

        // Compares a node name such as 'memory@40000000' against a path component
        bool NameMatches(const char* name, const char* component, size_t component_len)
        {
            if (strncmp(name, component, component_len) != 0)
                return false;
            const char next = name[component_len];
            if (next == '\0')
                return true;
            // A component without unit address matches any unit address
            return next == '@' && memchr(component, '@', component_len) == nullptr;
        }

    } // unnamed namespace

    uint32_t Property::GetCell(unsigned int n) const
    {
        if (p_data == nullptr || (n + 1) * 4 > p_length)
            return 0;
        return util::get_be32(p_data + n * 4);
    }

    uint64_t Property::GetCells(unsigned int n, unsigned int cells) const
    {
        uint64_t value = 0;
        for (unsigned int i = 0; i < cells; i++)
            value = (value << 32) | GetCell(n + i);
        return value;
    }

    const char* Property::AsString() const
    {
        if (p_data == nullptr || p_length == 0 || p_data[p_length - 1] != '\0')
            return nullptr;
        return reinterpret_cast<const char*>(p_data);
    }

    bool Property::ContainsString(const char* s) const
    {
        if (AsString() == nullptr)
            return false;
        for (uint32_t offset = 0; offset < p_length;) {
            auto item = reinterpret_cast<const char*>(p_data + offset);
            if (strcmp(item, s) == 0)
                return true;
            offset += strlen(item) + 1;
        }
        return false;
    }

    bool Property::ContainsSubstring(const char* s) const
    {
        if (AsString() == nullptr)
            return false;
        for (uint32_t offset = 0; offset < p_length;) {
            auto item = reinterpret_cast<const char*>(p_data + offset);
            if (strstr(item, s) != nullptr)
                return true;
            offset += strlen(item) + 1;
        }
        return false;
    }

    bool Blob::Attach(const PhysicalMemory& physmem, addr_t phys)
    {
        b_Base = nullptr;
        auto header = physmem.MapAs<const FDT_HEADER>(phys);
        if (header == nullptr || util::get_be32(&header->fh_magic) != FDT_MAGIC)
            return false;

        const uint32_t total = util::get_be32(&header->fh_totalsize);
        const uint32_t version = util::get_be32(&header->fh_version);
        if (total < sizeof(FDT_HEADER) || total > MaxBlobSize || version < 16) {
            TRACE(FIRMWARE, WARN, "unusable device tree (size %u, version %u)", total, version);
            return false;
        }
        auto base = static_cast<const uint8_t*>(physmem.Map(phys, total));
        if (base == nullptr)
            return false;

        const uint32_t off_struct = util::get_be32(&header->fh_off_dt_struct);
        const uint32_t off_strings = util::get_be32(&header->fh_off_dt_strings);
        const uint32_t off_rsvmap = util::get_be32(&header->fh_off_mem_rsvmap);
        uint32_t size_struct = total - off_struct;
        if (version >= 17)
            size_struct = util::get_be32(&header->fh_size_dt_struct);
        const uint32_t size_strings = util::get_be32(&header->fh_size_dt_strings);
        if (off_struct > total || size_struct > total - off_struct || off_strings > total ||
            size_strings > total - off_strings || off_rsvmap > total)
            return false;

        b_Base = base;
        b_TotalSize = total;
        b_StructOffset = off_struct;
        b_StructSize = size_struct;
        b_StringsOffset = off_strings;
        b_StringsSize = size_strings;
        b_RsvmapOffset = off_rsvmap;
        return true;
    }

    uint32_t Blob::GetTotalSize() const { return b_TotalSize; }

    uint32_t Blob::ReadToken(uint32_t offset) const
    {
        if (b_Base == nullptr || offset == BadOffset || offset + 4 > b_StructSize)
            return FDT_END;
        return util::get_be32(b_Base + b_StructOffset + offset);
    }

    uint32_t Blob::SkipNodeName(Node node) const
    {
        if (node < 0 || ReadToken(node) != FDT_BEGIN_NODE)
            return BadOffset;
        auto name = reinterpret_cast<const char*>(b_Base + b_StructOffset + node + 4);
        const uint32_t max = b_StructSize - (node + 4);
        const size_t len = strnlen(name, max);
        if (len == max)
            return BadOffset;
        return Align4(node + 4 + len + 1);
    }

    uint32_t Blob::SkipProperty(uint32_t offset) const
    {
        if (offset + 12 > b_StructSize)
            return BadOffset;
        const uint32_t len = util::get_be32(b_Base + b_StructOffset + offset + 4);
        if (len > b_StructSize - (offset + 12))
            return BadOffset;
        return Align4(offset + 12 + len);
    }

    uint32_t Blob::SkipNode(Node node) const
    {
        uint32_t offset = SkipNodeName(node);
        int depth = 1;
        while (offset != BadOffset) {
            switch (ReadToken(offset)) {
                case FDT_BEGIN_NODE:
                    if (++depth > MaxDepth)
                        return BadOffset;
                    offset = SkipNodeName(offset);
                    break;
                case FDT_END_NODE:
                    offset += 4;
                    if (--depth == 0)
                        return offset;
                    break;
                case FDT_PROP:
                    offset = SkipProperty(offset);
                    break;
                case FDT_NOP:
                    offset += 4;
                    break;
                default:
                    return BadOffset;
            }
        }
        return BadOffset;
    }

    Node Blob::GetRoot() const
    {
        uint32_t offset = 0;
        while (ReadToken(offset) == FDT_NOP)
            offset += 4;
        return ReadToken(offset) == FDT_BEGIN_NODE ? static_cast<Node>(offset) : InvalidNode;
    }

    Node Blob::FirstChild(Node parent) const
    {
        uint32_t offset = SkipNodeName(parent);
        while (offset != BadOffset) {
            switch (ReadToken(offset)) {
                case FDT_BEGIN_NODE:
                    return static_cast<Node>(offset);
                case FDT_PROP:
                    offset = SkipProperty(offset);
                    break;
                case FDT_NOP:
                    offset += 4;
                    break;
                default:
                    return InvalidNode;
            }
        }
        return InvalidNode;
    }

    Node Blob::NextSibling(Node node) const
    {
        uint32_t offset = SkipNode(node);
        while (ReadToken(offset) == FDT_NOP)
            offset += 4;
        return ReadToken(offset) == FDT_BEGIN_NODE ? static_cast<Node>(offset) : InvalidNode;
    }

    const char* Blob::GetName(Node node) const
    {
        if (SkipNodeName(node) == BadOffset)
            return "";
        return reinterpret_cast<const char*>(b_Base + b_StructOffset + node + 4);
    }

    Node Blob::FindNode(const char* path) const
    {
        Node node = GetRoot();
        if (path[0] != '/')
            return InvalidNode;

        const char* p = path + 1;
        while (node != InvalidNode && *p != '\0') {
            const char* sep = strchr(p, '/');
            const size_t len = sep != nullptr ? sep - p : strlen(p);

            Node match = InvalidNode;
            for (Node child = FirstChild(node); child != InvalidNode; child = NextSibling(child)) {
                if (NameMatches(GetName(child), p, len)) {
                    match = child;
                    break;
                }
            }
            node = match;
            p += len;
            if (*p == '/')
                p++;
        }
        return node;
    }

    Property Blob::GetProperty(Node node, const char* name) const
    {
        Property prop;
        uint32_t offset = SkipNodeName(node);
        while (offset != BadOffset) {
            const uint32_t token = ReadToken(offset);
            if (token == FDT_NOP) {
                offset += 4;
                continue;
            }
            if (token != FDT_PROP)
                break;

            const uint32_t next = SkipProperty(offset);
            if (next == BadOffset)
                break;
            const uint32_t len = util::get_be32(b_Base + b_StructOffset + offset + 4);
            const uint32_t nameoff = util::get_be32(b_Base + b_StructOffset + offset + 8);
            if (nameoff < b_StringsSize) {
                auto pname = reinterpret_cast<const char*>(b_Base + b_StringsOffset + nameoff);
                if (strncmp(pname, name, b_StringsSize - nameoff) == 0) {
                    prop.p_data = b_Base + b_StructOffset + offset + 12;
                    prop.p_length = len;
                    return prop;
                }
            }
            offset = next;
        }
        return prop;
    }

    unsigned int Blob::GetAddressCells(Node node) const
    {
        const auto prop = GetProperty(node, "#address-cells");
        return prop.IsValid() ? prop.GetCell(0) : 2;
    }

    unsigned int Blob::GetSizeCells(Node node) const
    {
        const auto prop = GetProperty(node, "#size-cells");
        return prop.IsValid() ? prop.GetCell(0) : 1;
    }

    bool Blob::GetReservation(unsigned int n, uint64_t& address, uint64_t& size) const
    {
        const uint64_t offset = b_RsvmapOffset + static_cast<uint64_t>(n) * 16;
        if (b_Base == nullptr || offset + 16 > b_TotalSize)
            return false;
        address = util::get_be64(b_Base + offset);
        size = util::get_be64(b_Base + offset + 8);
        return true;
    }

} // namespace firmware::fdt
