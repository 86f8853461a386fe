/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <gtest/gtest.h>
#include <cstring>
#include <memory>
#include <vector>
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"

namespace fake
{
    /*
     * Host buffers standing in for the parts of the physical address space a
     * test touches; anything else is unreachable, just like a hole would be.
     */
    class Machine
    {
      public:
        Machine() : m_Scratch(std::make_unique<Scratch>()) {}
        Machine(const Machine&) = delete;
        Machine& operator=(const Machine&) = delete;

        uint8_t* AddMemory(addr_t phys, size_t length, uint8_t fill = 0)
        {
            auto& buffer = m_Buffers.emplace_back(std::make_unique<uint8_t[]>(length));
            memset(buffer.get(), fill, length);
            EXPECT_TRUE(m_PhysMem.AddAperture(phys, length, buffer.get()));
            return buffer.get();
        }

        void Write(addr_t phys, const void* data, size_t length)
        {
            ASSERT_TRUE(m_PhysMem.Write(phys, data, length));
        }

        void Write(addr_t phys, const std::vector<uint8_t>& data) { Write(phys, data.data(), data.size()); }

        uint8_t* At(addr_t phys, size_t length = 1) const
        {
            return static_cast<uint8_t*>(m_PhysMem.Map(phys, length));
        }

        PhysicalMemory& GetPhysicalMemory() { return m_PhysMem; }
        Scratch& GetScratch() { return *m_Scratch; }

      private:
        PhysicalMemory m_PhysMem;
        std::unique_ptr<Scratch> m_Scratch;
        std::vector<std::unique_ptr<uint8_t[]>> m_Buffers;
    };

    // A platform descriptor plus the context the stages take
    struct Context {
        explicit Context(Machine& machine) : c_Context{ c_Platform, machine.GetPhysicalMemory(), machine.GetScratch() }
        {
        }
        Context(const Context&) = delete;
        Context& operator=(const Context&) = delete;

        PlatformDescriptor c_Platform;
        LoaderContext c_Context;
    };

} // namespace fake
