/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/pipeline.h"
#include "loader/lib.h"
#include "loader/md.h"
#include "loader/physmem.h"
#include "loader/trace.h"
#include <ferry/util/algorithm.h>
#include <ferry/util/checked.h>
#include <ferry/util/utf8.h>

namespace pipeline
{
    const char* StateName(State state)
    {
        switch (state) {
            case State::Uninitialized:
                return "Uninitialized";
            case State::Probed:
                return "Probed";
            case State::MapAcquired:
                return "MapAcquired";
            case State::DeviceSelected:
                return "DeviceSelected";
            case State::ImageLoaded:
                return "ImageLoaded";
            case State::Expanded:
                return "Expanded";
            case State::BootInfoBuilt:
                return "BootInfoBuilt";
            case State::Prepared:
                return "Prepared";
            case State::JumpedAway:
                return "JumpedAway";
            case State::Halted:
                return "Halted";
        }
        return "?";
    }

    Pipeline::Pipeline(PhysicalMemory& physmem, Scratch& scratch) : p_Context{ p_Platform, physmem, scratch } {}

    void Pipeline::SetState(State state)
    {
        TRACE(PIPELINE, INFO, "%s -> %s", StateName(p_State), StateName(state));
        p_State = state;
    }

    Result Pipeline::Halt(Result result)
    {
        p_Error = result.AsErrorKind();
        SetState(State::Halted);
        kprintf("BOOT_HALT: %s\n", ErrorKindName(p_Error));
        return result;
    }

    void Pipeline::ReadOptions()
    {
        config::ReadSource(p_Context, p_OptionString, sizeof(p_OptionString));
        config::Parse(p_OptionString, p_Options);
        config::Apply(p_Options);

        bootdevice::GetDefaultLocator(p_Platform, p_Locator);
        if (p_Options.o_has_kernel) {
            Locator locator;
            if (bootdevice::ParseLocator(p_Options.o_kernel, locator))
                p_Locator = locator;
            else
                TRACE(PIPELINE, WARN, "ignoring unrecognized kernel locator '%s'", p_Options.o_kernel);
        }
    }

    Result Pipeline::LoadKernel(bootdevice::Stream& stream, memmap::MemoryMap& map)
    {
        const auto& lc = p_Context;
        RESULT_PROPAGATE_FAILURE(image::Inspect(lc, stream, p_Options.o_no_decompress, p_Image));
        RESULT_PROPAGATE_FAILURE(image::CheckFits(p_Image, map));

        // A raw kernel goes straight to where it will run
        if (p_Image.ki_compression == Compression::None) {
            RESULT_PROPAGATE_FAILURE(decompress::AllocateStaging(lc, map, p_Image, p_Staging));
            return image::Load(lc, stream, p_Staging.sr_base, p_Image);
        }

        // Compressed blobs the firmware already placed in memory are decoded from there
        addr_t address;
        if (stream.GetDirectAddress(address)) {
            p_Image.ki_base = address + sizeof(FERRY_KERNEL_HEADER);
            p_Image.ki_length = p_Image.ki_payload_size;
            TRACE(IMAGE, INFO, "payload used in place at %llx", static_cast<unsigned long long>(p_Image.ki_base));
            return Result::Success();
        }

        uint64_t size;
        addr_t base;
        if (!util::checked_align_up(p_Image.ki_payload_size, static_cast<uint64_t>(PAGE_SIZE), size) ||
            !memmap::FindFree(
                map, size, PAGE_SIZE, platform::GetAllocationMinimum(p_Platform), ~static_cast<addr_t>(0), false,
                base) ||
            !memmap::Claim(lc, map, base, size)) {
            TRACE(IMAGE, ERROR, "no room for the compressed kernel");
            return RESULT_MAKE_FAILURE(InsufficientStagingMemory);
        }
        RESULT_PROPAGATE_FAILURE(image::Load(lc, stream, base, p_Image));
        p_Image.ki_owned = true;
        return Result::Success();
    }

    Result Pipeline::LoadModules(const bootdevice::DeviceList& devices, memmap::MemoryMap& map)
    {
        p_Modules.clear();
        for (const auto& mo : p_Options.o_modules) {
            Locator locator;
            if (!bootdevice::ParseLocator(mo.mo_locator, locator)) {
                TRACE(IMAGE, WARN, "ignoring module '%s': bad locator", mo.mo_locator);
                continue;
            }

            // mod:<n> refers to a firmware blob; anything else lives on the boot device
            const BootDevice* device = &p_Device;
            if (locator.l_type == Locator::Type::Module) {
                auto it = util::find_if(
                    devices, [&](const BootDevice& d) { return bootdevice::CanLocate(d, locator); });
                if (it == devices.end()) {
                    TRACE(IMAGE, ERROR, "module '%s' not found", mo.mo_locator);
                    return RESULT_MAKE_FAILURE(DeviceReadFailed);
                }
                device = &*it;
            }

            bootdevice::Stream stream(p_Context);
            RESULT_PROPAGATE_FAILURE(stream.Open(*device, locator));

            Module module;
            addr_t address;
            if (stream.GetDirectAddress(address) &&
                memmap::IsWithinRegionOfType(map, address, stream.GetSize(), memmap::RegionType::Bootloader)) {
                util::copy_utf8(module.m_name, sizeof(module.m_name), mo.mo_name, strlen(mo.mo_name));
                module.m_base = address;
                module.m_length = stream.GetSize();
                module.m_type = image::ModuleTypeFromName(module.m_name);
            } else {
                RESULT_PROPAGATE_FAILURE(image::LoadModule(p_Context, stream, mo.mo_name, map, module));
            }
            if (!p_Modules.push_back(module))
                return RESULT_MAKE_FAILURE(InsufficientStagingMemory);
        }
        return Result::Success();
    }

    Result Pipeline::LoadFromDevice(const bootdevice::DeviceList& devices, memmap::MemoryMap& map)
    {
        bootdevice::Stream stream(p_Context);
        RESULT_PROPAGATE_FAILURE(stream.Open(p_Device, p_Locator));
        RESULT_PROPAGATE_FAILURE(LoadKernel(stream, map));
        return LoadModules(devices, map);
    }

    Result Pipeline::SelectAndLoad()
    {
        bootdevice::ExcludeList exclude;
        Result last_error = RESULT_MAKE_FAILURE(NoBootableDevice);
        while (true) {
            // Every attempt starts from scratch
            bootdevice::DeviceList devices;
            ++p_Enumerations;
            size_t index;
            if (auto result = bootdevice::Enumerate(p_Context, devices); result.IsFailure())
                return exclude.empty() ? result : last_error;
            if (auto result =
                    bootdevice::Select(p_Context, devices, p_Platform.pd_mode, p_Locator, exclude, index);
                result.IsFailure())
                return exclude.empty() ? result : last_error;
            p_Device = devices[index];
            SetState(State::DeviceSelected);

            memmap::MemoryMap map = p_Map;
            p_Image = KernelImage{};
            p_Staging = StagingRegion{};
            auto result = LoadFromDevice(devices, map);
            if (result.IsSuccess()) {
                p_Map = map;
                SetState(State::ImageLoaded);
                return result;
            }

            memmap::ReleaseAllClaims(p_Context);
            if (!IsDeviceError(result.AsErrorKind()))
                return result;
            TRACE(
                PIPELINE, WARN, "%s: %s, trying the next device", p_Device.bd_name,
                ErrorKindName(result.AsErrorKind()));
            if (!exclude.push_back(bootdevice::GetId(p_Device)))
                return result;
            last_error = result;
        }
    }

    Result Pipeline::Finish()
    {
        const auto& lc = p_Context;
        if (p_Image.ki_compression != Compression::None)
            RESULT_PROPAGATE_FAILURE(decompress::AllocateStaging(lc, p_Map, p_Image, p_Staging));
        RESULT_PROPAGATE_FAILURE(decompress::Expand(lc, p_Map, p_Image, p_Staging));
        SetState(State::Expanded);

        RESULT_PROPAGATE_FAILURE(handoff::ReserveArena(lc, p_Map, p_Arena));
        const bool want_framebuffer =
            p_HaveFramebuffer && (p_Image.ki_flags & FERRY_KERNEL_FLAG_NO_FRAMEBUFFER) == 0;
        RESULT_PROPAGATE_FAILURE(bootinfo::Build(
            lc, p_Map, p_Options.o_command_line, p_Modules, want_framebuffer ? &p_Framebuffer : nullptr,
            p_BootInfo));
        SetState(State::BootInfoBuilt);

        RESULT_PROPAGATE_FAILURE(handoff::Prepare(lc, p_Image, p_BootInfo, p_Arena, p_Map, p_Handoff));
        SetState(State::Prepared);
        return Result::Success();
    }

    Result Pipeline::Run(const EntryState& entry)
    {
        if (auto result = platform::Probe(entry, p_Context.lc_physmem, p_Platform); result.IsFailure())
            return Halt(result);
        SetState(State::Probed);

        ReadOptions();
        p_HaveFramebuffer = framebuffer::Discover(p_Context, p_Framebuffer);
        if (auto result = memmap::Acquire(p_Context, p_HaveFramebuffer ? &p_Framebuffer : nullptr, p_Map);
            result.IsFailure())
            return Halt(result);
        SetState(State::MapAcquired);

        if (auto result = SelectAndLoad(); result.IsFailure())
            return Halt(result);
        if (auto result = Finish(); result.IsFailure())
            return Halt(result);

        // From here on, everything we claimed belongs to the kernel
        memmap::ForgetClaims(p_Context);
        if (p_Options.o_debug)
            memmap::Dump(p_Map);
        return Result::Success();
    }

    void Pipeline::Boot(const EntryState& entry)
    {
        if (Run(entry).IsSuccess()) {
            if (auto result = handoff::ExitFirmware(p_Context); result.IsSuccess()) {
                p_State = State::JumpedAway;
                md::Jump(p_Handoff);
            } else {
                Halt(result);
            }
        }
        md::Halt();
    }

} // namespace pipeline
