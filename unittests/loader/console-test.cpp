/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <string>
#include "loader/console.h"
#include "loader/lib.h"
#include "loader/trace.h"
#include "loader/fake-bios.h"
#include "loader/fake-memory.h"
#include "loader/fake-uefi.h"

using console::Backend;

namespace
{
    struct ConsoleTest : ::testing::Test {
        void SetUp() override { console::ClearBacklog(); }

        void TearDown() override
        {
            console::SetOutput(console::Output{});
            console::ClearBacklog();
            trace::SetAll(trace::level::ERROR | trace::level::WARN);
        }

        std::string GetBacklog() const { return console::GetBacklog(); }
    };
} // unnamed namespace

TEST_F(ConsoleTest, KeepsABacklog)
{
    EXPECT_EQ("", GetBacklog());
    console::PutString("hello ");
    kprintf("%s %d\n", "world", 42);
    EXPECT_EQ("hello world 42\n", GetBacklog());

    console::ClearBacklog();
    EXPECT_EQ("", GetBacklog());
}

TEST_F(ConsoleTest, BacklogKeepsTheMostRecentOutput)
{
    for (size_t n = 0; n < console::BacklogSize; n++)
        console::PutChar('a' + n % 26);
    EXPECT_EQ(console::BacklogSize, GetBacklog().size());

    // Full: the oldest half goes
    console::PutChar('!');
    const auto backlog = GetBacklog();
    ASSERT_EQ(console::BacklogSize / 2 + 1, backlog.size());
    EXPECT_EQ('a' + (console::BacklogSize / 2) % 26, backlog[0]);
    EXPECT_EQ('!', backlog.back());
}

TEST_F(ConsoleTest, RefusesIncompleteBackends)
{
    console::Output output;
    output.o_backend = Backend::UefiConOut;
    console::SetOutput(output);
    EXPECT_EQ(Backend::None, console::GetBackend());

    output.o_backend = Backend::BiosTeletype;
    console::SetOutput(output);
    EXPECT_EQ(Backend::None, console::GetBackend());

    output.o_backend = Backend::Pl011;
    console::SetOutput(output);
    EXPECT_EQ(Backend::None, console::GetBackend());

    // Still recorded
    console::PutString("x");
    EXPECT_EQ("x", GetBacklog());
}

TEST_F(ConsoleTest, WritesToTheUefiConsole)
{
    fake::Uefi uefi;
    console::Output output;
    output.o_backend = Backend::UefiConOut;
    output.o_conout = uefi.GetSystemTable()->ConOut;
    console::SetOutput(output);
    ASSERT_EQ(Backend::UefiConOut, console::GetBackend());

    console::PutString("boot\n");
    EXPECT_EQ("boot\r\n", uefi.GetConsoleOutput());
    EXPECT_EQ("boot\n", GetBacklog());
}

TEST_F(ConsoleTest, WritesToTheBiosTeletype)
{
    fake::Machine machine;
    fake::Bios bios(machine.GetPhysicalMemory());
    console::Output output;
    output.o_backend = Backend::BiosTeletype;
    output.o_realmode_call = &fake::Bios::Call;
    console::SetOutput(output);
    ASSERT_EQ(Backend::BiosTeletype, console::GetBackend());

    console::PutString("ok\n");
    EXPECT_EQ("ok\r\n", bios.GetTeletype());
}

TEST_F(ConsoleTest, WritesToAPl011)
{
    constexpr addr_t UartBase = 0x09000000;
    fake::Machine machine;
    auto uart = machine.AddMemory(UartBase, 0x1000);

    console::Output output;
    output.o_backend = Backend::Pl011;
    output.o_physmem = &machine.GetPhysicalMemory();
    output.o_uart_base = UartBase;
    console::SetOutput(output);
    ASSERT_EQ(Backend::Pl011, console::GetBackend());

    // The data register only shows the last character
    console::PutChar('Z');
    EXPECT_EQ('Z', uart[0]);
    console::PutChar('\n');
    EXPECT_EQ('\n', uart[0]);
}

TEST_F(ConsoleTest, TracesGoToTheConsole)
{
    trace::SetAll(trace::level::ERROR);
    TRACE(IMAGE, INFO, "not shown %d", 1);
    EXPECT_EQ("", GetBacklog());

    trace::Enable(trace::SubSystem::IMAGE, trace::level::INFO);
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::IMAGE, trace::level::INFO));
    EXPECT_FALSE(trace::IsEnabled(trace::SubSystem::MEMMAP, trace::level::INFO));
    TRACE(IMAGE, INFO, "shown %d", 2);
    const auto backlog = GetBacklog();
    EXPECT_NE(std::string::npos, backlog.find(": shown 2\n"));
    EXPECT_NE(std::string::npos, backlog.find("TestBody"));

    trace::Disable(trace::SubSystem::IMAGE, trace::level::INFO);
    console::ClearBacklog();
    TRACE(IMAGE, INFO, "hidden again");
    EXPECT_EQ("", GetBacklog());
}
