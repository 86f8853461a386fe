/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include <gtest/gtest.h>
#include <cstring>
#include <string>
#include "loader/config.h"
#include "loader/trace.h"
#include "loader/fake-fdt.h"
#include "loader/fake-memory.h"
#include "loader/fake-multiboot.h"
#include "loader/fake-uefi.h"

using namespace config;

namespace
{
    Options ParseOptions(const char* s)
    {
        Options options;
        Parse(s, options);
        return options;
    }

    struct ConfigTraceTest : ::testing::Test {
        void TearDown() override { trace::SetAll(trace::level::ERROR | trace::level::WARN); }
    };
} // unnamed namespace

TEST(Config, ParsesNothing)
{
    const auto options = ParseOptions("");
    EXPECT_FALSE(options.o_has_kernel);
    EXPECT_STREQ("", options.o_command_line);
    EXPECT_TRUE(options.o_modules.empty());
    EXPECT_FALSE(options.o_debug);
    EXPECT_FALSE(options.o_no_decompress);
    EXPECT_FALSE(options.o_quiet);
    EXPECT_EQ(-1, options.o_loglevel);
}

TEST(Config, ParsesKnownOptions)
{
    const auto options = ParseOptions("  kernel=\\EFI\\ferry\\kernel.img\tdebug no_decompress loglevel=2 quiet\n");
    ASSERT_TRUE(options.o_has_kernel);
    EXPECT_STREQ("\\EFI\\ferry\\kernel.img", options.o_kernel);
    EXPECT_TRUE(options.o_debug);
    EXPECT_TRUE(options.o_no_decompress);
    EXPECT_TRUE(options.o_quiet);
    EXPECT_EQ(2, options.o_loglevel);
}

TEST(Config, PassesTheWholeStringToTheKernel)
{
    const auto options = ParseOptions("kernel=lba:64 root=/dev/sda1 console=ttyS0");
    EXPECT_STREQ("kernel=lba:64 root=/dev/sda1 console=ttyS0", options.o_command_line);
    EXPECT_STREQ("lba:64", options.o_kernel);
}

TEST(Config, AppendReplacesTheKernelCommandLine)
{
    const auto options = ParseOptions("kernel=mod:0 append=root=/dev/vda quiet  init=/bin/sh");
    EXPECT_STREQ("root=/dev/vda quiet  init=/bin/sh", options.o_command_line);
    // Whatever follows append= is not for us
    EXPECT_FALSE(options.o_quiet);
    EXPECT_STREQ("mod:0", options.o_kernel);

    EXPECT_STREQ("", ParseOptions("debug append=").o_command_line);
}

TEST(Config, IgnoresLookalikes)
{
    const auto options = ParseOptions("kernel= kernels=x debugging loglevel=7 loglevel=12 quiet=1 kernel");
    EXPECT_FALSE(options.o_has_kernel);
    EXPECT_FALSE(options.o_debug);
    EXPECT_FALSE(options.o_quiet);
    EXPECT_EQ(-1, options.o_loglevel);
}

TEST(Config, RejectsOverlongKernelLocators)
{
    const std::string s = "kernel=" + std::string(Locator::MaxPathLength, 'k');
    EXPECT_FALSE(ParseOptions(s.c_str()).o_has_kernel);
}

TEST(Config, LastKernelWins)
{
    EXPECT_STREQ("lba:2", ParseOptions("kernel=lba:1 kernel=lba:2").o_kernel);
}

TEST(Config, ParsesModules)
{
    const auto options =
        ParseOptions("module=\\boot\\initrd.img module=lba:4096+8192,symbols module=mod:1 module=,x module=/a/b/");
    ASSERT_EQ(4u, options.o_modules.size());
    EXPECT_STREQ("\\boot\\initrd.img", options.o_modules[0].mo_locator);
    EXPECT_STREQ("initrd.img", options.o_modules[0].mo_name);
    EXPECT_STREQ("lba:4096+8192", options.o_modules[1].mo_locator);
    EXPECT_STREQ("symbols", options.o_modules[1].mo_name);
    EXPECT_STREQ("mod:1", options.o_modules[2].mo_locator);
    EXPECT_STREQ("mod:1", options.o_modules[2].mo_name);
    // Nothing after the last separator; the whole locator names it
    EXPECT_STREQ("/a/b/", options.o_modules[3].mo_name);
}

TEST(Config, ModuleNamesStayValidUtf8)
{
    // The e-acute would straddle the last byte of the name
    const std::string name = std::string(Module::NameLength - 2, 'a') + "\xc3\xa9";
    auto options = ParseOptions(("module=lba:100," + name).c_str());
    ASSERT_EQ(1u, options.o_modules.size());
    EXPECT_EQ(std::string(Module::NameLength - 2, 'a'), options.o_modules[0].mo_name);

    options = ParseOptions("module=lba:100,ram\xff" "disk\xc3\xa9");
    ASSERT_EQ(1u, options.o_modules.size());
    EXPECT_STREQ("ram?disk\xc3\xa9", options.o_modules[0].mo_name);
}

TEST(Config, LimitsTheNumberOfModules)
{
    std::string s;
    for (size_t n = 0; n < image::MaxModules + 2; n++)
        s += "module=mod:" + std::to_string(n) + " ";
    const auto options = ParseOptions(s.c_str());
    ASSERT_EQ(image::MaxModules, options.o_modules.size());
    EXPECT_STREQ("mod:0", options.o_modules[0].mo_locator);
}

TEST(Config, TruncatesTheCommandLine)
{
    const std::string s(MaxLength + 100, 'a');
    const auto options = ParseOptions(s.c_str());
    EXPECT_EQ(MaxLength - 1, strlen(options.o_command_line));
}

TEST(Config, PicksTheLogLevel)
{
    EXPECT_EQ(LogLevelWarnings, GetLogLevel(ParseOptions("")));
    EXPECT_EQ(LogLevelErrors, GetLogLevel(ParseOptions("loglevel=0")));
    EXPECT_EQ(LogLevelInfo, GetLogLevel(ParseOptions("loglevel=2")));
    EXPECT_EQ(LogLevelAll, GetLogLevel(ParseOptions("loglevel=1 debug")));
    EXPECT_EQ(LogLevelErrors, GetLogLevel(ParseOptions("debug quiet loglevel=3")));
}

TEST_F(ConfigTraceTest, AppliesTheLogLevel)
{
    Apply(ParseOptions("quiet"));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::IMAGE, trace::level::ERROR));
    EXPECT_FALSE(trace::IsEnabled(trace::SubSystem::IMAGE, trace::level::WARN));

    Apply(ParseOptions(""));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::PROBE, trace::level::WARN));
    EXPECT_FALSE(trace::IsEnabled(trace::SubSystem::PROBE, trace::level::INFO));

    Apply(ParseOptions("loglevel=2"));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::PIPELINE, trace::level::INFO));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::PIPELINE, trace::level::WARN));
    EXPECT_FALSE(trace::IsEnabled(trace::SubSystem::PIPELINE, trace::level::FUNC));

    Apply(ParseOptions("debug"));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::HANDOFF, trace::level::FUNC));
    EXPECT_TRUE(trace::IsEnabled(trace::SubSystem::MEMMAP, trace::level::INFO));
}

TEST(Config, ReadsTheUefiVariable)
{
    fake::Machine machine;
    fake::Context ctx(machine);
    fake::Uefi uefi;
    ctx.c_Platform.pd_mode = FirmwareMode::UEFI;
    ctx.c_Platform.pd_efi_system_table = uefi.GetSystemTable();

    char buffer[MaxLength];
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("", buffer);

    uefi.SetOptions("kernel=\\kernel debug");
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("kernel=\\kernel debug", buffer);

    // Too large for the buffer: treated as absent
    char small[8];
    ReadSource(ctx.c_Context, small, sizeof(small));
    EXPECT_STREQ("", small);
}

TEST(Config, ReadsTheMultibootCommandLine)
{
    constexpr addr_t InfoAddress = 0x9000;
    fake::Machine machine;
    machine.AddMemory(0, 0x10000);
    fake::MultibootInfo mb;
    mb.AddMemory(0, 0x9fc00, 1);
    mb.AddCommandLine("kernel=mod:0 loglevel=2");
    machine.Write(InfoAddress, mb.Build());

    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::DirectLongMode;
    ctx.c_Platform.pd_multiboot_info = InfoAddress;
    char buffer[MaxLength];
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("kernel=mod:0 loglevel=2", buffer);

    char small[7];
    ReadSource(ctx.c_Context, small, sizeof(small));
    EXPECT_STREQ("kernel", small);
}

TEST(Config, ReadsTheDeviceTreeBootArguments)
{
    constexpr addr_t DtbAddress = 0x40000000;
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    fake::FdtBuilder fdt;
    fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
    fdt.BeginNode("chosen").String("bootargs", "kernel=lba:2048 console=ttyAMA0").EndNode();
    machine.Write(DtbAddress, fdt.Build());

    fake::Context ctx(machine);
    ctx.c_Platform.pd_arch = Architecture::ARM64;
    ctx.c_Platform.pd_mode = FirmwareMode::DeviceTree;
    ctx.c_Platform.pd_dtb = DtbAddress;
    char buffer[MaxLength];
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("kernel=lba:2048 console=ttyAMA0", buffer);
}

TEST(Config, DeviceTreeWithoutChosenGivesNothing)
{
    constexpr addr_t DtbAddress = 0x40000000;
    fake::Machine machine;
    machine.AddMemory(DtbAddress, 0x10000);
    fake::FdtBuilder fdt;
    fdt.Cells("#address-cells", { 2 }).Cells("#size-cells", { 2 });
    machine.Write(DtbAddress, fdt.Build());

    fake::Context ctx(machine);
    ctx.c_Platform.pd_mode = FirmwareMode::DeviceTree;
    ctx.c_Platform.pd_dtb = DtbAddress;
    char buffer[MaxLength];
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("", buffer);
}

TEST(Config, ReadsTheStage1CommandLine)
{
    constexpr addr_t CommandLine = 0x600;
    fake::Machine machine;
    machine.AddMemory(0, 0x1000);
    const char cmdline[] = "kernel=lba:2048 quiet";
    machine.Write(CommandLine, cmdline, sizeof(cmdline));

    fake::Context ctx(machine);
    char buffer[MaxLength];
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("", buffer);

    ctx.c_Platform.pd_stage1_cmdline = CommandLine;
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("kernel=lba:2048 quiet", buffer);
}

TEST(Config, Stage1CommandLineStopsAtUnmappedMemory)
{
    fake::Machine machine;
    auto p = machine.AddMemory(0x1000, 4);
    memcpy(p, "abcd", 4);

    fake::Context ctx(machine);
    ctx.c_Platform.pd_stage1_cmdline = 0x1000;
    char buffer[MaxLength];
    ReadSource(ctx.c_Context, buffer, sizeof(buffer));
    EXPECT_STREQ("abcd", buffer);
}
