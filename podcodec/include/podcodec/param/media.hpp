/*
 * File: media.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-24
 * License: MIT
 */

#pragma once

#include <cstdint>

#include "podcodec/pod/primitive.hpp"

// Well-known ids carried as Id values inside parameter objects.
namespace podcodec::param {

    enum class media_type : std::uint32_t {
        unknown = 0,
        audio = 1,
        video = 2,
        image = 3,
        binary = 4,
        stream = 5,
        application = 6,
    };

    enum class media_subtype : std::uint32_t {
        unknown = 0,
        raw = 1,
        dsp = 2,
        iec958 = 3,
        dsd = 4,

        audio_start = 0x10000,
        mp3 = 0x10001,
        aac = 0x10002,
        vorbis = 0x10003,
        wma = 0x10004,
        ra = 0x10005,
        sbc = 0x10006,
        adpcm = 0x10007,
        g723 = 0x10008,
        g726 = 0x10009,
        g729 = 0x1000a,
        amr = 0x1000b,
        gsm = 0x1000c,

        video_start = 0x20000,
        h264 = 0x20001,
        mjpg = 0x20002,
        dv = 0x20003,
        mpegts = 0x20004,
        h263 = 0x20005,
        mpeg1 = 0x20006,
        mpeg2 = 0x20007,
        mpeg4 = 0x20008,
        xvid = 0x20009,
        vc1 = 0x2000a,
        vp8 = 0x2000b,
        vp9 = 0x2000c,
        bayer = 0x2000d,

        image_start = 0x30000,
        jpeg = 0x30001,

        binary_start = 0x40000,

        stream_start = 0x50000,
        midi = 0x50001,

        application_start = 0x60000,
        control = 0x60001,
    };

    enum class audio_format : std::uint32_t {
        unknown = 0,
        encoded = 1,

        start_interleaved = 0x100,
        s8 = 0x101,
        u8 = 0x102,
        s16_le = 0x103,
        s16_be = 0x104,
        u16_le = 0x105,
        u16_be = 0x106,
        s24_32_le = 0x107,
        s24_32_be = 0x108,
        u24_32_le = 0x109,
        u24_32_be = 0x10a,
        s32_le = 0x10b,
        s32_be = 0x10c,
        u32_le = 0x10d,
        u32_be = 0x10e,
        s24_le = 0x10f,
        s24_be = 0x110,
        u24_le = 0x111,
        u24_be = 0x112,
        s20_le = 0x113,
        s20_be = 0x114,
        u20_le = 0x115,
        u20_be = 0x116,
        s18_le = 0x117,
        s18_be = 0x118,
        u18_le = 0x119,
        u18_be = 0x11a,
        f32_le = 0x11b,
        f32_be = 0x11c,
        f64_le = 0x11d,
        f64_be = 0x11e,
        ulaw = 0x11f,
        alaw = 0x120,

        start_planar = 0x200,
        u8p = 0x201,
        s16p = 0x202,
        s24_32p = 0x203,
        s32p = 0x204,
        s24p = 0x205,
        f32p = 0x206,
        f64p = 0x207,
        s8p = 0x208,
    };

    enum class direction : std::uint32_t {
        input = 0,
        output = 1,
    };

    enum class availability : std::uint32_t {
        unknown = 0,
        no = 1,
        yes = 2,
    };

    enum class port_config_mode : std::uint32_t {
        none = 0,
        passthrough = 1,
        convert = 2,
        dsp = 3,
    };

    template <typename EnumT>
    constexpr inline pod::id to_id(EnumT value) noexcept {
        return pod::id{ static_cast<std::uint32_t>(value) };
    }

    template <typename EnumT>
    constexpr inline EnumT from_id(pod::id value) noexcept {
        return static_cast<EnumT>(value.value);
    }

} // namespace podcodec::param
