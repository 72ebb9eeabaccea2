/*
 * File: param_type.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-24
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <string_view>

namespace podcodec::param {

    enum class param_type : std::uint32_t {
        invalid = 0,
        prop_info = 1,
        props = 2,
        enum_format = 3,
        format = 4,
        buffers = 5,
        meta = 6,
        io = 7,
        enum_profile = 8,
        profile = 9,
        enum_port_config = 10,
        port_config = 11,
        enum_route = 12,
        route = 13,
        control = 14,
        latency = 15,
        process_latency = 16,
    };

    constexpr inline std::string_view param_type_name(param_type kind) noexcept {
        switch (kind) {
        case param_type::invalid: return "Invalid";
        case param_type::prop_info: return "PropInfo";
        case param_type::props: return "Props";
        case param_type::enum_format: return "EnumFormat";
        case param_type::format: return "Format";
        case param_type::buffers: return "Buffers";
        case param_type::meta: return "Meta";
        case param_type::io: return "IO";
        case param_type::enum_profile: return "EnumProfile";
        case param_type::profile: return "Profile";
        case param_type::enum_port_config: return "EnumPortConfig";
        case param_type::port_config: return "PortConfig";
        case param_type::enum_route: return "EnumRoute";
        case param_type::route: return "Route";
        case param_type::control: return "Control";
        case param_type::latency: return "Latency";
        case param_type::process_latency: return "ProcessLatency";
        }
        return {};
    }

} // namespace podcodec::param
