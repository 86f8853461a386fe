/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/framebuffer.h"
#include "loader/firmware/fdt.h"
#include "loader/firmware/multiboot.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"

namespace framebuffer
{
    namespace
    {
        void SetChannel(uint32_t mask, uint8_t& size, uint8_t& shift)
        {
            size = 0;
            shift = 0;
            if (mask == 0)
                return;
            shift = __builtin_ctz(mask);
            size = __builtin_popcount(mask);
        }

        bool FromUefi(const LoaderContext& lc, Framebuffer& fb)
        {
            using namespace firmware::efi;
            auto st = lc.lc_platform.pd_efi_system_table;
            void* interface = nullptr;
            if (st->BootServices->LocateProtocol == nullptr ||
                EFI_ERROR(st->BootServices->LocateProtocol(&GraphicsOutputProtocolGuid, nullptr, &interface)) ||
                interface == nullptr)
                return false;

            auto gop = static_cast<EFI_GRAPHICS_OUTPUT_PROTOCOL*>(interface);
            if (gop->Mode == nullptr || gop->Mode->Info == nullptr)
                return false;
            const auto& info = *gop->Mode->Info;

            fb.fb_base = gop->Mode->FrameBufferBase;
            fb.fb_width = info.HorizontalResolution;
            fb.fb_height = info.VerticalResolution;
            fb.fb_bpp = 32;
            fb.fb_pitch = info.PixelsPerScanLine * 4;
            switch (info.PixelFormat) {
                case PixelRedGreenBlueReserved8BitPerColor:
                    SetChannel(0x000000ff, fb.fb_red_size, fb.fb_red_shift);
                    SetChannel(0x0000ff00, fb.fb_green_size, fb.fb_green_shift);
                    SetChannel(0x00ff0000, fb.fb_blue_size, fb.fb_blue_shift);
                    return true;
                case PixelBlueGreenRedReserved8BitPerColor:
                    SetChannel(0x00ff0000, fb.fb_red_size, fb.fb_red_shift);
                    SetChannel(0x0000ff00, fb.fb_green_size, fb.fb_green_shift);
                    SetChannel(0x000000ff, fb.fb_blue_size, fb.fb_blue_shift);
                    return true;
                case PixelBitMask:
                    SetChannel(info.PixelInformation.RedMask, fb.fb_red_size, fb.fb_red_shift);
                    SetChannel(info.PixelInformation.GreenMask, fb.fb_green_size, fb.fb_green_shift);
                    SetChannel(info.PixelInformation.BlueMask, fb.fb_blue_size, fb.fb_blue_shift);
                    return true;
                default:
                    return false; // no linear framebuffer
            }
        }

        bool FromMultiboot(const LoaderContext& lc, Framebuffer& fb)
        {
            auto tag = firmware::multiboot::FindTag(
                lc.lc_physmem, lc.lc_platform.pd_multiboot_info, MULTIBOOT2_TAG_TYPE_FRAMEBUFFER);
            if (tag == nullptr || tag->mt_size < sizeof(MULTIBOOT2_TAG_FRAMEBUFFER))
                return false;
            auto mf = reinterpret_cast<const MULTIBOOT2_TAG_FRAMEBUFFER*>(tag);
            if (mf->mf_type != MULTIBOOT2_FRAMEBUFFER_TYPE_RGB)
                return false;

            fb.fb_base = mf->mf_addr;
            fb.fb_width = mf->mf_width;
            fb.fb_height = mf->mf_height;
            fb.fb_pitch = mf->mf_pitch;
            fb.fb_bpp = mf->mf_bpp;
            fb.fb_red_size = mf->mf_red_mask_size;
            fb.fb_red_shift = mf->mf_red_field_position;
            fb.fb_green_size = mf->mf_green_mask_size;
            fb.fb_green_shift = mf->mf_green_field_position;
            fb.fb_blue_size = mf->mf_blue_mask_size;
            fb.fb_blue_shift = mf->mf_blue_field_position;
            return true;
        }

        bool FromVbe(const LoaderContext& lc, Framebuffer& fb)
        {
            ModeInfoBlock mib;
            if (!firmware::bios::GetCurrentVideoMode(lc.lc_platform, lc.lc_physmem, mib))
                return false;
            constexpr uint16_t required =
                VBE_MODEATTR_SUPPORTED | VBE_MODEATTR_GRAPHICS | VBE_MODEATTR_FRAMEBUFFER;
            if ((mib.ModeAttributes & required) != required || mib.MemoryModel != VBE_MEMMODEL_DIRECTCOLOR)
                return false;

            fb.fb_base = mib.PhysBasePtr;
            fb.fb_width = mib.XResolution;
            fb.fb_height = mib.YResolution;
            fb.fb_pitch = mib.BytesPerScanLine;
            fb.fb_bpp = mib.BitsPerPixel;
            fb.fb_red_size = mib.RedMaskSize;
            fb.fb_red_shift = mib.RedFieldPosition;
            fb.fb_green_size = mib.GreenMaskSize;
            fb.fb_green_shift = mib.GreenFieldPosition;
            fb.fb_blue_size = mib.BlueMaskSize;
            fb.fb_blue_shift = mib.BlueFieldPosition;
            return true;
        }

        bool FromDeviceTree(const LoaderContext& lc, Framebuffer& fb)
        {
            using namespace firmware::fdt;
            Blob blob;
            if (lc.lc_platform.pd_dtb == 0 || !blob.Attach(lc.lc_physmem, lc.lc_platform.pd_dtb))
                return false;
            const Node chosen = blob.FindNode("/chosen");
            if (chosen == InvalidNode)
                return false;

            const unsigned int acells = blob.GetAddressCells(chosen);
            bool found = false;
            blob.ForEachChild(chosen, [&](Node node) {
                if (found || !blob.GetProperty(node, "compatible").ContainsString("simple-framebuffer"))
                    return;
                if (auto status = blob.GetProperty(node, "status").AsString();
                    status != nullptr && strcmp(status, "okay") != 0)
                    return;
                const auto reg = blob.GetProperty(node, "reg");
                const auto format = blob.GetProperty(node, "format").AsString();
                if (!reg.IsValid() || format == nullptr)
                    return;

                uint32_t red, blue;
                if (strcmp(format, "a8r8g8b8") == 0 || strcmp(format, "x8r8g8b8") == 0) {
                    red = 0x00ff0000;
                    blue = 0x000000ff;
                } else if (strcmp(format, "a8b8g8r8") == 0 || strcmp(format, "x8b8g8r8") == 0) {
                    red = 0x000000ff;
                    blue = 0x00ff0000;
                } else {
                    return;
                }

                fb.fb_base = reg.GetCells(0, acells);
                fb.fb_width = blob.GetProperty(node, "width").GetCell(0);
                fb.fb_height = blob.GetProperty(node, "height").GetCell(0);
                fb.fb_pitch = blob.GetProperty(node, "stride").GetCell(0);
                fb.fb_bpp = 32;
                SetChannel(red, fb.fb_red_size, fb.fb_red_shift);
                SetChannel(0x0000ff00, fb.fb_green_size, fb.fb_green_shift);
                SetChannel(blue, fb.fb_blue_size, fb.fb_blue_shift);
                found = true;
            });
            return found;
        }

    } // unnamed namespace

    bool IsUsable(const Framebuffer& fb)
    {
        return fb.fb_base != 0 && fb.fb_bpp == 32 && fb.fb_width > 0 && fb.fb_height > 0 &&
               fb.fb_pitch >= fb.fb_width * 4;
    }

    bool Discover(const LoaderContext& lc, Framebuffer& fb)
    {
        fb = Framebuffer{};
        bool found = false;
        switch (lc.lc_platform.pd_mode) {
            case FirmwareMode::UEFI:
                found = FromUefi(lc, fb);
                break;
            case FirmwareMode::DirectLongMode:
                found = FromMultiboot(lc, fb);
                break;
            case FirmwareMode::LegacyBIOS:
                found = FromVbe(lc, fb);
                break;
            case FirmwareMode::DeviceTree:
                found = FromDeviceTree(lc, fb);
                break;
        }
        if (!found || !IsUsable(fb)) {
            TRACE(FIRMWARE, INFO, "no usable framebuffer");
            return false;
        }

        TRACE(
            FIRMWARE, INFO, "framebuffer at %llx, %ux%u pitch %u", static_cast<unsigned long long>(fb.fb_base),
            fb.fb_width, fb.fb_height, fb.fb_pitch);
        return true;
    }

} // namespace framebuffer
