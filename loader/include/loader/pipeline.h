/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#pragma once

#include <ferry/types.h>
#include "loader/bootdevice.h"
#include "loader/bootinfo.h"
#include "loader/config.h"
#include "loader/decompress.h"
#include "loader/framebuffer.h"
#include "loader/handoff.h"
#include "loader/image.h"
#include "loader/memorymap.h"
#include "loader/platform.h"
#include "loader/result.h"
#include "loader/scratch.h"

class PhysicalMemory;

namespace pipeline
{
    enum class State {
        Uninitialized,
        Probed,
        MapAcquired,
        DeviceSelected,
        ImageLoaded,
        Expanded,
        BootInfoBuilt,
        Prepared,
        JumpedAway,
        Halted,
    };

    const char* StateName(State state);

    /*
     * Drives a boot from firmware entry to the kernel. States only move
     * forward; the one exception is a failure while loading the image, which
     * goes back to device selection with everything re-enumerated.
     */
    class Pipeline
    {
      public:
        Pipeline(PhysicalMemory& physmem, Scratch& scratch);
        Pipeline(const Pipeline&) = delete;
        Pipeline& operator=(const Pipeline&) = delete;

        /*
         * Takes everything up to Prepared. On failure, the halt line is
         * written and the state becomes Halted.
         */
        Result Run(const EntryState& entry);

        // Run(), then leave the firmware and jump to the kernel; halts on failure
        [[noreturn]] void Boot(const EntryState& entry);

        State GetState() const { return p_State; }
        ErrorKind GetError() const { return p_Error; }
        unsigned int GetEnumerationCount() const { return p_Enumerations; }

        const PlatformDescriptor& GetPlatform() const { return p_Platform; }
        const config::Options& GetOptions() const { return p_Options; }
        const memmap::MemoryMap& GetMemoryMap() const { return p_Map; }
        const BootDevice& GetSelectedDevice() const { return p_Device; }
        const KernelImage& GetKernelImage() const { return p_Image; }
        const StagingRegion& GetStaging() const { return p_Staging; }
        const image::ModuleList& GetModules() const { return p_Modules; }
        const BootInfo& GetBootInfo() const { return p_BootInfo; }
        const HandoffContext& GetHandoffContext() const { return p_Handoff; }
        const LoaderContext& GetContext() const { return p_Context; }

      private:
        void SetState(State state);
        Result Halt(Result result);

        void ReadOptions();
        Result SelectAndLoad();
        Result LoadFromDevice(const bootdevice::DeviceList& devices, memmap::MemoryMap& map);
        Result LoadKernel(bootdevice::Stream& stream, memmap::MemoryMap& map);
        Result LoadModules(const bootdevice::DeviceList& devices, memmap::MemoryMap& map);
        Result Finish();

        PlatformDescriptor p_Platform;
        LoaderContext p_Context;
        State p_State = State::Uninitialized;
        ErrorKind p_Error = ErrorKind::None;
        unsigned int p_Enumerations = 0;

        char p_OptionString[config::MaxLength] = {};
        config::Options p_Options;
        Locator p_Locator;
        Framebuffer p_Framebuffer;
        bool p_HaveFramebuffer = false;

        memmap::MemoryMap p_Map;
        BootDevice p_Device;
        KernelImage p_Image;
        StagingRegion p_Staging;
        image::ModuleList p_Modules;
        HandoffArena p_Arena;
        BootInfo p_BootInfo;
        HandoffContext p_Handoff;
    };

} // namespace pipeline
