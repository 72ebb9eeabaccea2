/*
 * File: catalogs.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-25
 * License: MIT
 */

#pragma once

#include "podcodec/param/catalog.hpp"

namespace podcodec::param {

    struct prop_info_catalog {
        static constexpr std::string_view name = "PropInfo";
        static constexpr type object_type = type::object_prop_info;

        enum class key : std::uint32_t {
            id = 1,
            name = 2,
            type = 3,
            labels = 4,
            container = 5,
            params = 6,
            description = 7,
        };

        static constexpr std::array descriptors = {
            plain(key::id, "id", type::id),
            plain(key::name, "name", type::string),
            any_pod(key::type, "type"),
            plain(key::labels, "labels", type::structure),
            plain(key::container, "container", type::id),
            plain(key::params, "params", type::boolean),
            plain(key::description, "description", type::string),
        };
    };

    struct props_catalog {
        static constexpr std::string_view name = "Props";
        static constexpr type object_type = type::object_props;

        enum class key : std::uint32_t {
            device = 0x101,
            device_name = 0x102,
            device_fd = 0x103,
            card = 0x104,
            card_name = 0x105,
            min_latency = 0x106,
            max_latency = 0x107,
            periods = 0x108,
            period_size = 0x109,
            period_event = 0x10a,
            live = 0x10b,
            rate = 0x10c,
            quality = 0x10d,
            bluetooth_audio_codec = 0x10e,

            wave_type = 0x10001,
            frequency = 0x10002,
            volume = 0x10003,
            mute = 0x10004,
            pattern_type = 0x10005,
            dither_type = 0x10006,
            truncate = 0x10007,
            channel_volumes = 0x10008,
            volume_base = 0x10009,
            volume_step = 0x1000a,
            channel_map = 0x1000b,
            monitor_mute = 0x1000c,
            monitor_volumes = 0x1000d,
            latency_offset_nsec = 0x1000e,
            soft_mute = 0x1000f,
            soft_volumes = 0x10010,
            iec958_codecs = 0x10011,

            brightness = 0x20001,
            contrast = 0x20002,
            saturation = 0x20003,
            hue = 0x20004,
            gamma = 0x20005,
            exposure = 0x20006,
            gain = 0x20007,
            sharpness = 0x20008,

            params = 0x80001,
        };

        static constexpr std::array descriptors = {
            plain(key::device, "device", type::string),
            plain(key::device_name, "deviceName", type::string),
            plain(key::device_fd, "deviceFd", type::fd),
            plain(key::card, "card", type::string),
            plain(key::card_name, "cardName", type::string),
            plain(key::min_latency, "minLatency", type::int32),
            plain(key::max_latency, "maxLatency", type::int32),
            plain(key::periods, "periods", type::int32),
            plain(key::period_size, "periodSize", type::int32),
            plain(key::period_event, "periodEvent", type::boolean),
            plain(key::live, "live", type::boolean),
            plain(key::rate, "rate", type::float64),
            plain(key::quality, "quality", type::int32),
            plain(key::bluetooth_audio_codec, "bluetoothAudioCodec", type::id),

            plain(key::wave_type, "waveType", type::id),
            plain(key::frequency, "frequency", type::int32),
            plain(key::volume, "volume", type::float32),
            plain(key::mute, "mute", type::boolean),
            plain(key::pattern_type, "patternType", type::id),
            plain(key::dither_type, "ditherType", type::id),
            plain(key::truncate, "truncate", type::boolean),
            array_of(key::channel_volumes, "channelVolumes", type::float32),
            plain(key::volume_base, "volumeBase", type::float32),
            plain(key::volume_step, "volumeStep", type::float32),
            array_of(key::channel_map, "channelMap", type::id),
            plain(key::monitor_mute, "monitorMute", type::boolean),
            array_of(key::monitor_volumes, "monitorVolumes", type::float32),
            plain(key::latency_offset_nsec, "latencyOffsetNsec", type::int64),
            plain(key::soft_mute, "softMute", type::boolean),
            array_of(key::soft_volumes, "softVolumes", type::float32),
            array_of(key::iec958_codecs, "iec958Codecs", type::id),

            plain(key::brightness, "brightness", type::int32),
            plain(key::contrast, "contrast", type::int32),
            plain(key::saturation, "saturation", type::int32),
            plain(key::hue, "hue", type::int32),
            plain(key::gamma, "gamma", type::int32),
            plain(key::exposure, "exposure", type::int32),
            plain(key::gain, "gain", type::int32),
            plain(key::sharpness, "sharpness", type::int32),

            plain(key::params, "params", type::structure),
        };
    };

    enum class format_key : std::uint32_t {
        media_type = 1,
        media_subtype = 2,

        audio_format = 0x10001,
        audio_flags = 0x10002,
        audio_rate = 0x10003,
        audio_channels = 0x10004,
        audio_position = 0x10005,
        audio_iec958_codec = 0x10006,
        audio_bitorder = 0x10007,
        audio_interleave = 0x10008,

        video_format = 0x20001,
        video_modifier = 0x20002,
        video_size = 0x20003,
        video_framerate = 0x20004,
        video_max_framerate = 0x20005,
        video_views = 0x20006,
        video_interlace_mode = 0x20007,
        video_pixel_aspect_ratio = 0x20008,
        video_multiview_mode = 0x20009,
        video_multiview_flags = 0x2000a,
        video_chroma_site = 0x2000b,
        video_color_range = 0x2000c,
        video_color_matrix = 0x2000d,
        video_transfer_function = 0x2000e,
        video_color_primaries = 0x2000f,
        video_profile = 0x20010,
        video_level = 0x20011,
        video_h264_stream_format = 0x20012,
        video_h264_alignment = 0x20013,
    };

    /// A negotiated (fixated) format: mostly plain values.
    struct format_catalog {
        static constexpr std::string_view name = "Format";
        static constexpr type object_type = type::object_format;
        using key = format_key;

        static constexpr std::array descriptors = {
            plain(key::media_type, "mediaType", type::id),
            plain(key::media_subtype, "mediaSubtype", type::id),

            plain(key::audio_format, "audio.format", type::id),
            plain(key::audio_flags, "audio.flags", type::int32),
            choice_of(key::audio_rate, "audio.rate", type::int32),
            plain(key::audio_channels, "audio.channels", type::int32),
            array_of(key::audio_position, "audio.position", type::id),
            choice_of(key::audio_iec958_codec, "audio.iec958Codec", type::id),
            choice_of(key::audio_bitorder, "audio.bitorder", type::id),
            plain(key::audio_interleave, "audio.interleave", type::int32),

            plain(key::video_format, "video.format", type::id),
            plain(key::video_modifier, "video.modifier", type::int64),
            plain(key::video_size, "video.size", type::rectangle),
            choice_of(key::video_framerate, "video.framerate", type::fraction),
            plain(key::video_max_framerate, "video.maxFramerate", type::fraction),
            plain(key::video_views, "video.views", type::int32),
            choice_of(key::video_interlace_mode, "video.interlaceMode", type::id),
            plain(key::video_pixel_aspect_ratio, "video.pixelAspectRatio", type::rectangle),
            choice_of(key::video_multiview_mode, "video.multiviewMode", type::id),
            choice_of(key::video_multiview_flags, "video.multiviewFlags", type::id),
            choice_of(key::video_chroma_site, "video.chromaSite", type::id),
            choice_of(key::video_color_range, "video.colorRange", type::id),
            choice_of(key::video_color_matrix, "video.colorMatrix", type::id),
            choice_of(key::video_transfer_function, "video.transferFunction", type::id),
            choice_of(key::video_color_primaries, "video.colorPrimaries", type::id),
            plain(key::video_profile, "video.profile", type::int32),
            plain(key::video_level, "video.level", type::int32),
            choice_of(key::video_h264_stream_format, "video.H264.streamFormat", type::id),
            choice_of(key::video_h264_alignment, "video.H264.alignment", type::id),
        };
    };

    /// An enumerable format: same keys, choices accepted almost everywhere.
    struct enum_format_catalog {
        static constexpr std::string_view name = "EnumFormat";
        static constexpr type object_type = type::object_format;
        using key = format_key;

        static constexpr std::array descriptors = {
            plain(key::media_type, "mediaType", type::id),
            plain(key::media_subtype, "mediaSubtype", type::id),

            choice_of(key::audio_format, "audio.format", type::id),
            choice_of(key::audio_flags, "audio.flags", type::int32),
            choice_of(key::audio_rate, "audio.rate", type::int32),
            choice_of(key::audio_channels, "audio.channels", type::int32),
            array_of(key::audio_position, "audio.position", type::id),
            choice_of(key::audio_iec958_codec, "audio.iec958Codec", type::id),
            choice_of(key::audio_bitorder, "audio.bitorder", type::id),
            choice_of(key::audio_interleave, "audio.interleave", type::int32),

            choice_of(key::video_format, "video.format", type::id),
            plain(key::video_modifier, "video.modifier", type::int64),
            choice_of(key::video_size, "video.size", type::rectangle),
            choice_of(key::video_framerate, "video.framerate", type::fraction),
            choice_of(key::video_max_framerate, "video.maxFramerate", type::fraction),
            plain(key::video_views, "video.views", type::int32),
            choice_of(key::video_interlace_mode, "video.interlaceMode", type::id),
            choice_of(key::video_pixel_aspect_ratio, "video.pixelAspectRatio", type::rectangle),
            choice_of(key::video_multiview_mode, "video.multiviewMode", type::id),
            choice_of(key::video_multiview_flags, "video.multiviewFlags", type::id),
            choice_of(key::video_chroma_site, "video.chromaSite", type::id),
            choice_of(key::video_color_range, "video.colorRange", type::id),
            choice_of(key::video_color_matrix, "video.colorMatrix", type::id),
            choice_of(key::video_transfer_function, "video.transferFunction", type::id),
            choice_of(key::video_color_primaries, "video.colorPrimaries", type::id),
            choice_of(key::video_profile, "video.profile", type::int32),
            choice_of(key::video_level, "video.level", type::int32),
            choice_of(key::video_h264_stream_format, "video.H264.streamFormat", type::id),
            choice_of(key::video_h264_alignment, "video.H264.alignment", type::id),
        };
    };

    struct buffers_catalog {
        static constexpr std::string_view name = "ParamBuffers";
        static constexpr type object_type = type::object_param_buffers;

        enum class key : std::uint32_t {
            buffers = 1,
            blocks = 2,
            size = 3,
            stride = 4,
            align = 5,
            data_type = 6,
        };

        static constexpr std::array descriptors = {
            choice_of(key::buffers, "buffers", type::int32),
            choice_of(key::blocks, "blocks", type::int32),
            choice_of(key::size, "size", type::int32),
            choice_of(key::stride, "stride", type::int32),
            choice_of(key::align, "align", type::int32),
            choice_of(key::data_type, "dataType", type::int32),
        };
    };

    struct meta_catalog {
        static constexpr std::string_view name = "ParamMeta";
        static constexpr type object_type = type::object_param_meta;

        enum class key : std::uint32_t {
            type = 1,
            size = 2,
        };

        static constexpr std::array descriptors = {
            plain(key::type, "type", type::id),
            choice_of(key::size, "size", type::int32),
        };
    };

    struct io_catalog {
        static constexpr std::string_view name = "ParamIO";
        static constexpr type object_type = type::object_param_io;

        enum class key : std::uint32_t {
            id = 1,
            size = 2,
        };

        static constexpr std::array descriptors = {
            plain(key::id, "id", type::id),
            plain(key::size, "size", type::int32),
        };
    };

    struct profile_catalog {
        static constexpr std::string_view name = "ParamProfile";
        static constexpr type object_type = type::object_param_profile;

        enum class key : std::uint32_t {
            index = 1,
            name = 2,
            description = 3,
            priority = 4,
            available = 5,
            info = 6,
            classes = 7,
            save = 8,
        };

        static constexpr std::array descriptors = {
            plain(key::index, "index", type::int32),
            plain(key::name, "name", type::string),
            plain(key::description, "description", type::string),
            plain(key::priority, "priority", type::int32),
            plain(key::available, "available", type::id),
            plain(key::info, "info", type::structure),
            plain(key::classes, "classes", type::structure),
            plain(key::save, "save", type::boolean),
        };
    };

    struct port_config_catalog {
        static constexpr std::string_view name = "ParamPortConfig";
        static constexpr type object_type = type::object_param_port_config;

        enum class key : std::uint32_t {
            direction = 1,
            mode = 2,
            monitor = 3,
            control = 4,
            format = 5,
        };

        static constexpr std::array descriptors = {
            plain(key::direction, "direction", type::id),
            plain(key::mode, "mode", type::id),
            plain(key::monitor, "monitor", type::boolean),
            plain(key::control, "control", type::boolean),
            plain(key::format, "format", type::object),
        };
    };

    struct route_catalog {
        static constexpr std::string_view name = "ParamRoute";
        static constexpr type object_type = type::object_param_route;

        enum class key : std::uint32_t {
            index = 1,
            direction = 2,
            device = 3,
            name = 4,
            description = 5,
            priority = 6,
            available = 7,
            info = 8,
            profiles = 9,
            props = 10,
            devices = 11,
            profile = 12,
            save = 13,
        };

        static constexpr std::array descriptors = {
            plain(key::index, "index", type::int32),
            plain(key::direction, "direction", type::id),
            plain(key::device, "device", type::int32),
            plain(key::name, "name", type::string),
            plain(key::description, "description", type::string),
            plain(key::priority, "priority", type::int32),
            plain(key::available, "available", type::id),
            plain(key::info, "info", type::structure),
            array_of(key::profiles, "profiles", type::int32),
            plain(key::props, "props", type::object),
            array_of(key::devices, "devices", type::int32),
            plain(key::profile, "profile", type::int32),
            plain(key::save, "save", type::boolean),
        };
    };

    struct profiler_catalog {
        static constexpr std::string_view name = "Profiler";
        static constexpr type object_type = type::object_profiler;

        enum class key : std::uint32_t {
            info = 0x10001,
            clock = 0x10002,
            driver_block = 0x10003,
            follower_block = 0x20001,
        };

        static constexpr std::array descriptors = {
            plain(key::info, "info", type::structure),
            plain(key::clock, "clock", type::structure),
            plain(key::driver_block, "driverBlock", type::structure),
            plain(key::follower_block, "followerBlock", type::structure),
        };
    };

    struct latency_catalog {
        static constexpr std::string_view name = "ParamLatency";
        static constexpr type object_type = type::object_param_latency;

        enum class key : std::uint32_t {
            direction = 1,
            min_quantum = 2,
            max_quantum = 3,
            min_rate = 4,
            max_rate = 5,
            min_ns = 6,
            max_ns = 7,
        };

        static constexpr std::array descriptors = {
            plain(key::direction, "direction", type::id),
            plain(key::min_quantum, "minQuantum", type::float32),
            plain(key::max_quantum, "maxQuantum", type::float32),
            plain(key::min_rate, "minRate", type::int32),
            plain(key::max_rate, "maxRate", type::int32),
            plain(key::min_ns, "minNs", type::int64),
            plain(key::max_ns, "maxNs", type::int64),
        };
    };

    struct process_latency_catalog {
        static constexpr std::string_view name = "ParamProcessLatency";
        static constexpr type object_type = type::object_param_process_latency;

        enum class key : std::uint32_t {
            quantum = 1,
            rate = 2,
            ns = 3,
        };

        static constexpr std::array descriptors = {
            plain(key::quantum, "quantum", type::float32),
            plain(key::rate, "rate", type::int32),
            plain(key::ns, "ns", type::int64),
        };
    };

} // namespace podcodec::param
