/*-
 * SPDX-License-Identifier: Zlib
 *
 * Copyright (c) 2009-2021 Rink Springer <rink@rink.nu>
 * For conditions of distribution and use, see LICENSE file
 */
#include "loader/bootinfo.h"
#include "loader/lib.h"
#include "loader/physmem.h"
#include "loader/platform.h"
#include "loader/scratch.h"
#include "loader/trace.h"
#include <ferry/util/checked.h>

namespace bootinfo
{
    namespace
    {
        constexpr size_t Align(size_t n) { return ROUND_UP(n, FERRY_BOOTINFO_SECTION_ALIGN); }

        // Bytes a section with a payload of 'length' bytes occupies, padding included
        constexpr size_t SectionSize(size_t length) { return Align(sizeof(FERRY_BOOTINFO_SECTION) + length); }

        bool IsZero(const uint8_t* p, size_t length)
        {
            for (size_t n = 0; n < length; n++)
                if (p[n] != 0)
                    return false;
            return true;
        }

        // Appends payloads to a fixed buffer
        class PayloadWriter
        {
          public:
            PayloadWriter(uint8_t* buffer, size_t size) : pw_Buffer(buffer), pw_Size(size) {}

            uint8_t* Append(const void* data, size_t length)
            {
                if (length > pw_Size - pw_Used)
                    return nullptr;
                uint8_t* p = pw_Buffer + pw_Used;
                memcpy(p, data, length);
                pw_Used += length;
                return p;
            }

            uint8_t* Current() const { return pw_Buffer + pw_Used; }

          private:
            uint8_t* pw_Buffer;
            size_t pw_Size;
            size_t pw_Used = 0;
        };

        bool AddSection(BootInfoView& view, uint32_t tag, const uint8_t* payload, size_t length)
        {
            if (payload == nullptr)
                return false;
            Section s;
            s.s_tag = tag;
            s.s_payload = payload;
            s.s_length = static_cast<uint32_t>(length);
            return view.bv_sections.push_back(s);
        }

        bool EncodeMemoryMap(PayloadWriter& pw, BootInfoView& view, const memmap::MemoryMap& map)
        {
            uint8_t* start = pw.Current();
            const FERRY_BOOTINFO_MEMORY_MAP mm{ static_cast<uint32_t>(map.size()),
                                                sizeof(FERRY_BOOTINFO_MEMORY_ENTRY) };
            if (pw.Append(&mm, sizeof(mm)) == nullptr)
                return false;
            for (const auto& r : map) {
                FERRY_BOOTINFO_MEMORY_ENTRY me{};
                me.me_base = r.mr_base;
                me.me_length = r.mr_length;
                me.me_type = static_cast<uint32_t>(r.mr_type);
                me.me_attributes = r.mr_attributes;
                if (pw.Append(&me, sizeof(me)) == nullptr)
                    return false;
            }
            return AddSection(view, FERRY_BOOTINFO_TAG_MEMORY_MAP, start, pw.Current() - start);
        }

        bool EncodeModules(PayloadWriter& pw, BootInfoView& view, const image::ModuleList& modules)
        {
            uint8_t* start = pw.Current();
            const FERRY_BOOTINFO_MODULES md{ static_cast<uint32_t>(modules.size()), sizeof(FERRY_BOOTINFO_MODULE) };
            if (pw.Append(&md, sizeof(md)) == nullptr)
                return false;
            for (const auto& m : modules) {
                FERRY_BOOTINFO_MODULE mod{};
                mod.mod_base = m.m_base;
                mod.mod_length = m.m_length;
                mod.mod_type = static_cast<uint32_t>(m.m_type);
                strncpy(mod.mod_name, m.m_name, sizeof(mod.mod_name) - 1);
                if (pw.Append(&mod, sizeof(mod)) == nullptr)
                    return false;
            }
            return AddSection(view, FERRY_BOOTINFO_TAG_MODULES, start, pw.Current() - start);
        }

        bool EncodeFramebuffer(PayloadWriter& pw, BootInfoView& view, const Framebuffer& fb)
        {
            FERRY_BOOTINFO_FRAMEBUFFER bf{};
            bf.fb_base = fb.fb_base;
            bf.fb_width = fb.fb_width;
            bf.fb_height = fb.fb_height;
            bf.fb_pitch = fb.fb_pitch;
            bf.fb_bpp = fb.fb_bpp;
            bf.fb_red_size = fb.fb_red_size;
            bf.fb_red_shift = fb.fb_red_shift;
            bf.fb_green_size = fb.fb_green_size;
            bf.fb_green_shift = fb.fb_green_shift;
            bf.fb_blue_size = fb.fb_blue_size;
            bf.fb_blue_shift = fb.fb_blue_shift;
            return AddSection(view, FERRY_BOOTINFO_TAG_FRAMEBUFFER, pw.Append(&bf, sizeof(bf)), sizeof(bf));
        }

        bool GetFirmwareHandoff(const PlatformDescriptor& pd, FERRY_BOOTINFO_FIRMWARE& fw)
        {
            fw = FERRY_BOOTINFO_FIRMWARE{};
            if (pd.pd_mode == FirmwareMode::UEFI) {
                fw.fw_kind = FERRY_FIRMWARE_UEFI;
                fw.fw_address = reinterpret_cast<uintptr_t>(pd.pd_efi_system_table);
                return true;
            }
            if (pd.pd_mode == FirmwareMode::DeviceTree) {
                fw.fw_kind = FERRY_FIRMWARE_DEVICE_TREE;
                fw.fw_address = pd.pd_dtb;
                return true;
            }
            return false;
        }

        bool DecodeMemoryMap(const Section& s, BootInfoView& view)
        {
            FERRY_BOOTINFO_MEMORY_MAP mm;
            if (s.s_length < sizeof(mm))
                return false;
            memcpy(&mm, s.s_payload, sizeof(mm));
            uint64_t needed;
            if (mm.mm_entry_size < sizeof(FERRY_BOOTINFO_MEMORY_ENTRY) ||
                !util::checked_mul(static_cast<uint64_t>(mm.mm_count), static_cast<uint64_t>(mm.mm_entry_size), needed) ||
                needed > s.s_length - sizeof(mm) || mm.mm_count > memmap::MaxRegions)
                return false;

            view.bv_memory_map.clear();
            for (uint32_t n = 0; n < mm.mm_count; n++) {
                FERRY_BOOTINFO_MEMORY_ENTRY me;
                memcpy(&me, s.s_payload + sizeof(mm) + n * mm.mm_entry_size, sizeof(me));
                memmap::MemoryRegion r;
                r.mr_base = me.me_base;
                r.mr_length = me.me_length;
                r.mr_type = static_cast<memmap::RegionType>(me.me_type);
                r.mr_attributes = me.me_attributes;
                if (!view.bv_memory_map.push_back(r))
                    return false;
            }
            return true;
        }

        bool DecodeModules(const Section& s, BootInfoView& view)
        {
            FERRY_BOOTINFO_MODULES md;
            if (s.s_length < sizeof(md))
                return false;
            memcpy(&md, s.s_payload, sizeof(md));
            uint64_t needed;
            if (md.md_entry_size < sizeof(FERRY_BOOTINFO_MODULE) ||
                !util::checked_mul(static_cast<uint64_t>(md.md_count), static_cast<uint64_t>(md.md_entry_size), needed) ||
                needed > s.s_length - sizeof(md) || md.md_count > image::MaxModules)
                return false;

            view.bv_modules.clear();
            for (uint32_t n = 0; n < md.md_count; n++) {
                FERRY_BOOTINFO_MODULE mod;
                memcpy(&mod, s.s_payload + sizeof(md) + n * md.md_entry_size, sizeof(mod));
                Module m;
                m.m_base = mod.mod_base;
                m.m_length = mod.mod_length;
                m.m_type = static_cast<ModuleType>(mod.mod_type);
                memcpy(m.m_name, mod.mod_name, strnlen(mod.mod_name, sizeof(m.m_name) - 1));
                if (!view.bv_modules.push_back(m))
                    return false;
            }
            return true;
        }

        bool DecodeSection(const Section& s, BootInfoView& view)
        {
            switch (s.s_tag) {
                case FERRY_BOOTINFO_TAG_MEMORY_MAP:
                    return DecodeMemoryMap(s, view);
                case FERRY_BOOTINFO_TAG_COMMAND_LINE:
                    if (s.s_length == 0 || memchr(s.s_payload, '\0', s.s_length) == nullptr)
                        return false;
                    view.bv_command_line = reinterpret_cast<const char*>(s.s_payload);
                    return true;
                case FERRY_BOOTINFO_TAG_MODULES:
                    return DecodeModules(s, view);
                case FERRY_BOOTINFO_TAG_FRAMEBUFFER: {
                    FERRY_BOOTINFO_FRAMEBUFFER bf;
                    if (s.s_length < sizeof(bf))
                        return false;
                    memcpy(&bf, s.s_payload, sizeof(bf));
                    auto& fb = view.bv_framebuffer;
                    fb.fb_base = bf.fb_base;
                    fb.fb_width = bf.fb_width;
                    fb.fb_height = bf.fb_height;
                    fb.fb_pitch = bf.fb_pitch;
                    fb.fb_bpp = bf.fb_bpp;
                    fb.fb_red_size = bf.fb_red_size;
                    fb.fb_red_shift = bf.fb_red_shift;
                    fb.fb_green_size = bf.fb_green_size;
                    fb.fb_green_shift = bf.fb_green_shift;
                    fb.fb_blue_size = bf.fb_blue_size;
                    fb.fb_blue_shift = bf.fb_blue_shift;
                    view.bv_has_framebuffer = true;
                    return true;
                }
                case FERRY_BOOTINFO_TAG_FIRMWARE: {
                    FERRY_BOOTINFO_FIRMWARE fw;
                    if (s.s_length < sizeof(fw))
                        return false;
                    memcpy(&fw, s.s_payload, sizeof(fw));
                    view.bv_has_firmware = true;
                    view.bv_firmware_kind = fw.fw_kind;
                    view.bv_firmware_address = fw.fw_address;
                    return true;
                }
                default:
                    return true; // kept verbatim in bv_sections
            }
        }

    } // unnamed namespace

    bool Parse(const void* data, size_t length, BootInfoView& view)
    {
        view = BootInfoView{};
        auto bytes = static_cast<const uint8_t*>(data);
        FERRY_BOOTINFO_HEADER bh;
        if (length < sizeof(bh))
            return false;
        memcpy(&bh, bytes, sizeof(bh));
        if (bh.bh_magic != FERRY_BOOTINFO_MAGIC || bh.bh_version_major != FERRY_BOOTINFO_VERSION_MAJOR ||
            bh.bh_first_section != sizeof(bh) || bh.bh_total_length > length ||
            bh.bh_total_length > FERRY_BOOTINFO_MAX_LENGTH)
            return false;
        view.bv_version_major = bh.bh_version_major;
        view.bv_version_minor = bh.bh_version_minor;

        size_t offset = bh.bh_first_section;
        while (true) {
            FERRY_BOOTINFO_SECTION bs;
            if (offset + sizeof(bs) > bh.bh_total_length)
                return false;
            memcpy(&bs, bytes + offset, sizeof(bs));
            if (bs.bs_length < sizeof(bs) || bs.bs_length > bh.bh_total_length - offset)
                return false;
            if (bs.bs_tag == FERRY_BOOTINFO_TAG_END) {
                // Anything beyond the terminator would be lost on a round trip
                return bs.bs_length == sizeof(bs) && offset + sizeof(bs) == bh.bh_total_length;
            }

            const size_t next = offset + SectionSize(bs.bs_length - sizeof(bs));
            if (next > bh.bh_total_length || !IsZero(bytes + offset + bs.bs_length, next - offset - bs.bs_length))
                return false;

            Section s;
            s.s_tag = bs.bs_tag;
            s.s_payload = bytes + offset + sizeof(bs);
            s.s_length = bs.bs_length - sizeof(bs);
            if (!view.bv_sections.push_back(s) || !DecodeSection(s, view))
                return false;
            offset = next;
        }
    }

    size_t GetSerializedSize(const BootInfoView& view)
    {
        size_t size = sizeof(FERRY_BOOTINFO_HEADER);
        for (const auto& s : view.bv_sections)
            size += SectionSize(s.s_length);
        return size + sizeof(FERRY_BOOTINFO_SECTION);
    }

    Result Serialize(const BootInfoView& view, void* buffer, size_t size, size_t& length)
    {
        length = GetSerializedSize(view);
        if (length > size || length > FERRY_BOOTINFO_MAX_LENGTH) {
            TRACE(BOOTINFO, ERROR, "boot information needs %zu bytes, %zu available", length, size);
            return RESULT_MAKE_FAILURE(BootInfoTooLarge);
        }

        auto out = static_cast<uint8_t*>(buffer);
        memset(out, 0, length);
        FERRY_BOOTINFO_HEADER bh;
        bh.bh_magic = FERRY_BOOTINFO_MAGIC;
        bh.bh_version_major = view.bv_version_major;
        bh.bh_version_minor = view.bv_version_minor;
        bh.bh_total_length = static_cast<uint32_t>(length);
        bh.bh_first_section = sizeof(bh);
        memcpy(out, &bh, sizeof(bh));

        size_t offset = sizeof(bh);
        for (const auto& s : view.bv_sections) {
            const FERRY_BOOTINFO_SECTION bs{ s.s_tag, static_cast<uint32_t>(sizeof(FERRY_BOOTINFO_SECTION) + s.s_length) };
            memcpy(out + offset, &bs, sizeof(bs));
            if (s.s_length > 0)
                memcpy(out + offset + sizeof(bs), s.s_payload, s.s_length);
            offset += SectionSize(s.s_length);
        }
        const FERRY_BOOTINFO_SECTION end{ FERRY_BOOTINFO_TAG_END, sizeof(FERRY_BOOTINFO_SECTION) };
        memcpy(out + offset, &end, sizeof(end));
        return Result::Success();
    }

    Result Build(
        const LoaderContext& lc, memmap::MemoryMap& map, const char* command_line,
        const image::ModuleList& modules, const Framebuffer* fb, BootInfo& info)
    {
        const auto& pd = lc.lc_platform;
        FERRY_BOOTINFO_FIRMWARE fw;
        const bool have_firmware = GetFirmwareHandoff(pd, fw);
        const size_t cmdline_length = strlen(command_line) + 1;

        // Claiming our own region splits at most one region into three
        size_t bound = sizeof(FERRY_BOOTINFO_HEADER) +
                       SectionSize(sizeof(FERRY_BOOTINFO_MEMORY_MAP) + (map.size() + 2) * sizeof(FERRY_BOOTINFO_MEMORY_ENTRY)) +
                       SectionSize(cmdline_length) +
                       SectionSize(sizeof(FERRY_BOOTINFO_MODULES) + modules.size() * sizeof(FERRY_BOOTINFO_MODULE)) +
                       sizeof(FERRY_BOOTINFO_SECTION);
        if (fb != nullptr)
            bound += SectionSize(sizeof(FERRY_BOOTINFO_FRAMEBUFFER));
        if (have_firmware)
            bound += SectionSize(sizeof(FERRY_BOOTINFO_FIRMWARE));
        if (bound > FERRY_BOOTINFO_MAX_LENGTH || bound > sizeof(lc.lc_scratch.s_firmware)) {
            TRACE(BOOTINFO, ERROR, "boot information would take %zu bytes", bound);
            return RESULT_MAKE_FAILURE(BootInfoTooLarge);
        }

        const uint64_t region_size = ROUND_UP(bound, PAGE_SIZE);
        addr_t base;
        if (!memmap::FindFree(map, region_size, PAGE_SIZE, platform::GetAllocationMinimum(pd), GiB(4), false, base) ||
            !memmap::Claim(lc, map, base, region_size)) {
            TRACE(BOOTINFO, ERROR, "no room for %llu bytes of boot information", static_cast<unsigned long long>(region_size));
            return RESULT_MAKE_FAILURE(BootInfoTooLarge);
        }

        // Payloads are assembled in scratch space and then serialized into place
        BootInfoView view;
        PayloadWriter pw(lc.lc_scratch.s_firmware, sizeof(lc.lc_scratch.s_firmware));
        bool ok = EncodeMemoryMap(pw, view, map);
        ok = ok && AddSection(view, FERRY_BOOTINFO_TAG_COMMAND_LINE, pw.Append(command_line, cmdline_length), cmdline_length);
        ok = ok && EncodeModules(pw, view, modules);
        if (fb != nullptr)
            ok = ok && EncodeFramebuffer(pw, view, *fb);
        if (have_firmware)
            ok = ok && AddSection(view, FERRY_BOOTINFO_TAG_FIRMWARE, pw.Append(&fw, sizeof(fw)), sizeof(fw));
        if (!ok)
            return RESULT_MAKE_FAILURE(BootInfoTooLarge);

        auto dest = lc.lc_physmem.Map(base, region_size);
        if (dest == nullptr)
            return RESULT_MAKE_FAILURE(BootInfoTooLarge);
        size_t length;
        RESULT_PROPAGATE_FAILURE(Serialize(view, dest, region_size, length));

        info.bi_base = base;
        info.bi_length = static_cast<uint32_t>(length);
        info.bi_region_size = region_size;
        TRACE(
            BOOTINFO, INFO, "%u bytes at %llx, %d sections", info.bi_length, static_cast<unsigned long long>(base),
            static_cast<int>(view.bv_sections.size()));
        return Result::Success();
    }

} // namespace bootinfo
