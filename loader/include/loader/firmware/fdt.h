/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>

class PhysicalMemory;

#define FDT_MAGIC 0xd00dfeed

/* All fields are big endian */
struct FDT_HEADER {
    /* 00 */ uint32_t fh_magic;
    /* 04 */ uint32_t fh_totalsize;
    /* 08 */ uint32_t fh_off_dt_struct;
    /* 0c */ uint32_t fh_off_dt_strings;
    /* 10 */ uint32_t fh_off_mem_rsvmap;
    /* 14 */ uint32_t fh_version;
    /* 18 */ uint32_t fh_last_comp_version;
    /* 1c */ uint32_t fh_boot_cpuid_phys;
    /* 20 */ uint32_t fh_size_dt_strings;
    /* 24 */ uint32_t fh_size_dt_struct;
} __attribute__((packed));

#define FDT_BEGIN_NODE 1
#define FDT_END_NODE 2
#define FDT_PROP 3
#define FDT_NOP 4
#define FDT_END 9

namespace firmware::fdt
{
    static constexpr uint32_t MaxBlobSize = 2 * 1024 * 1024;
    static constexpr int MaxDepth = 16;

    // A node is identified by the offset of its FDT_BEGIN_NODE token
    using Node = int;
    static constexpr Node InvalidNode = -1;

    struct Property {
        const uint8_t* p_data = nullptr;
        uint32_t p_length = 0;

        bool IsValid() const { return p_data != nullptr; }
        // Reads big-endian cell 'n'
        uint32_t GetCell(unsigned int n) const;
        // Reads a value of 'cells' cells starting at cell 'n'
        uint64_t GetCells(unsigned int n, unsigned int cells) const;
        // Whether this is a string list containing 's'
        bool ContainsString(const char* s) const;
        bool ContainsSubstring(const char* s) const;
        const char* AsString() const;
    };

    class Blob
    {
      public:
        // Validates the header; false if there is no usable blob at 'phys'
        bool Attach(const PhysicalMemory& physmem, addr_t phys);

        uint32_t GetTotalSize() const;

        Node GetRoot() const;
        Node FindNode(const char* path) const;
        const char* GetName(Node node) const;
        Property GetProperty(Node node, const char* name) const;

        // Calls 'callback(Node)' for each direct child of 'parent'
        template<typename Callback>
        void ForEachChild(Node parent, Callback callback) const
        {
            for (Node child = FirstChild(parent); child != InvalidNode; child = NextSibling(child))
                callback(child);
        }

        // #address-cells / #size-cells in effect for the children of 'node'
        unsigned int GetAddressCells(Node node) const;
        unsigned int GetSizeCells(Node node) const;

        // Calls 'callback(uint64_t address, uint64_t size)' per memory reservation block entry
        template<typename Callback>
        void ForEachReservation(Callback callback) const
        {
            for (unsigned int n = 0;; n++) {
                uint64_t address, size;
                if (!GetReservation(n, address, size) || (address == 0 && size == 0))
                    break;
                callback(address, size);
            }
        }

        Node FirstChild(Node parent) const;
        Node NextSibling(Node node) const;

      private:
        bool GetReservation(unsigned int n, uint64_t& address, uint64_t& size) const;
        uint32_t ReadToken(uint32_t offset) const;
        // Returns the offset just beyond the FDT_BEGIN_NODE name at 'node'
        uint32_t SkipNodeName(Node node) const;
        // Returns the offset beyond the FDT_PROP at 'offset'
        uint32_t SkipProperty(uint32_t offset) const;
        // Returns the offset just beyond the FDT_END_NODE matching 'node'
        uint32_t SkipNode(Node node) const;

        const uint8_t* b_Base = nullptr;
        uint32_t b_TotalSize = 0;
        uint32_t b_StructOffset = 0;
        uint32_t b_StructSize = 0;
        uint32_t b_StringsOffset = 0;
        uint32_t b_StringsSize = 0;
        uint32_t b_RsvmapOffset = 0;
    };

} // namespace firmware::fdt
