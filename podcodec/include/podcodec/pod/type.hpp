/*
 * File: type.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-17
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <format>
#include <type_traits>

namespace podcodec::pod {

    enum class type : std::uint32_t {
        start = 0x00000,
        none = 1,
        boolean = 2,
        id = 3,
        int32 = 4,
        int64 = 5,
        float32 = 6,
        float64 = 7,
        string = 8,
        bytes = 9,
        rectangle = 10,
        fraction = 11,
        bitmap = 12,
        array = 13,
        structure = 14,
        object = 15,
        sequence = 16,
        pointer = 17,
        fd = 18,
        choice = 19,
        pod = 20,

        pointer_start = 0x10000,
        pointer_buffer = 0x10001,
        pointer_meta = 0x10002,
        pointer_dict = 0x10003,

        event_start = 0x20000,
        event_device = 0x20001,
        event_node = 0x20002,

        command_start = 0x30000,
        command_device = 0x30001,
        command_node = 0x30002,

        object_start = 0x40000,
        object_prop_info = 0x40001,
        object_props = 0x40002,
        object_format = 0x40003,
        object_param_buffers = 0x40004,
        object_param_meta = 0x40005,
        object_param_io = 0x40006,
        object_param_profile = 0x40007,
        object_param_port_config = 0x40008,
        object_param_route = 0x40009,
        object_profiler = 0x4000a,
        object_param_latency = 0x4000b,
        object_param_process_latency = 0x4000c,
    };

    constexpr inline std::uint32_t to_tag(type t) noexcept {
        return static_cast<std::uint32_t>(t);
    }

    // Tags that may appear as the type of a POD header.
    constexpr inline bool is_basic_type(std::uint32_t tag) noexcept {
        return tag >= to_tag(type::none) && tag <= to_tag(type::pod);
    }

    constexpr inline bool is_object_type(std::uint32_t tag) noexcept {
        return tag > to_tag(type::object_start) && tag <= to_tag(type::object_param_process_latency);
    }

    constexpr inline std::string_view type_name(std::uint32_t tag) noexcept {
        switch (static_cast<type>(tag)) {
        case type::none: return "None";
        case type::boolean: return "Bool";
        case type::id: return "Id";
        case type::int32: return "Int";
        case type::int64: return "Long";
        case type::float32: return "Float";
        case type::float64: return "Double";
        case type::string: return "String";
        case type::bytes: return "Bytes";
        case type::rectangle: return "Rectangle";
        case type::fraction: return "Fraction";
        case type::bitmap: return "Bitmap";
        case type::array: return "Array";
        case type::structure: return "Struct";
        case type::object: return "Object";
        case type::sequence: return "Sequence";
        case type::pointer: return "Pointer";
        case type::fd: return "Fd";
        case type::choice: return "Choice";
        case type::pod: return "Pod";
        case type::pointer_buffer: return "Pointer:Buffer";
        case type::pointer_meta: return "Pointer:Meta";
        case type::pointer_dict: return "Pointer:Dict";
        case type::event_device: return "Event:Device";
        case type::event_node: return "Event:Node";
        case type::command_device: return "Command:Device";
        case type::command_node: return "Command:Node";
        case type::object_prop_info: return "PropInfo";
        case type::object_props: return "Props";
        case type::object_format: return "Format";
        case type::object_param_buffers: return "ParamBuffers";
        case type::object_param_meta: return "ParamMeta";
        case type::object_param_io: return "ParamIO";
        case type::object_param_profile: return "ParamProfile";
        case type::object_param_port_config: return "ParamPortConfig";
        case type::object_param_route: return "ParamRoute";
        case type::object_profiler: return "Profiler";
        case type::object_param_latency: return "ParamLatency";
        case type::object_param_process_latency: return "ParamProcessLatency";
        default: break;
        }
        return {};
    }

    constexpr inline std::string_view type_name(type t) noexcept {
        return type_name(to_tag(t));
    }

    inline std::string type_to_string(std::uint32_t tag) {
        const auto name = type_name(tag);
        if (name.empty()) {
            return std::format("UNKNOWN({})", tag);
        }
        return std::string(name);
    }

    enum class choice_type : std::uint32_t {
        none = 0,
        range = 1,
        step = 2,
        enumeration = 3,
        flags = 4,
    };

    constexpr inline std::string_view choice_type_name(std::uint32_t tag) noexcept {
        switch (static_cast<choice_type>(tag)) {
        case choice_type::none: return "None";
        case choice_type::range: return "Range";
        case choice_type::step: return "Step";
        case choice_type::enumeration: return "Enum";
        case choice_type::flags: return "Flags";
        }
        return {};
    }

    enum class control_type : std::uint32_t {
        invalid = 0,
        properties = 1,
        midi = 2,
        osc = 3,
    };

    enum class prop_flags : std::uint32_t {
        none = 0,
        readonly = 1u << 0,
        hardware = 1u << 1,
        hint_dict = 1u << 2,
        mandatory = 1u << 3,
        dont_fixate = 1u << 4,
    };

    constexpr inline prop_flags operator | (prop_flags lhs, prop_flags rhs) noexcept {
        return static_cast<prop_flags>(static_cast<std::uint32_t>(lhs) | static_cast<std::uint32_t>(rhs));
    }

    constexpr inline prop_flags operator & (prop_flags lhs, prop_flags rhs) noexcept {
        return static_cast<prop_flags>(static_cast<std::uint32_t>(lhs) & static_cast<std::uint32_t>(rhs));
    }

    constexpr inline bool has_flag(prop_flags value, prop_flags flag) noexcept {
        return (value & flag) == flag && flag != prop_flags::none;
    }

} // namespace podcodec::pod
