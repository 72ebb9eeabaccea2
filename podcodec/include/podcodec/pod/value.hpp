/*
 * File: value.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-29
 * License: MIT
 */

#pragma once

#include <string_view>
#include <variant>

#include "podcodec/pod/view.hpp"
#include "podcodec/pod/array.hpp"
#include "podcodec/pod/struct.hpp"
#include "podcodec/pod/choice.hpp"
#include "podcodec/pod/object.hpp"
#include "podcodec/pod/sequence.hpp"

namespace podcodec::pod {

    struct none_value {
        friend bool operator == (const none_value&, const none_value&) = default;
    };

    struct bytes_value {
        byte_view data;
    };

    /// One alternative per type tag. pod_view is the wildcard arm.
    using pod_value = std::variant<
        none_value,
        bool,
        id,
        std::int32_t,
        std::int64_t,
        float,
        double,
        std::string_view,
        bytes_value,
        rectangle,
        fraction,
        bitmap_view,
        array_view<>,
        struct_view,
        object_view,
        sequence_view,
        pointer,
        fd,
        choice_view,
        pod_view
    >;

    inline pod_value downcast(const pod_view& pod) {
        switch (pod.type()) {
        case type::none: return none_value{};
        case type::boolean: return pod.get<bool>();
        case type::id: return pod.get<id>();
        case type::int32: return pod.get<std::int32_t>();
        case type::int64: return pod.get<std::int64_t>();
        case type::float32: return pod.get<float>();
        case type::float64: return pod.get<double>();
        case type::string: return pod.get_string();
        case type::bytes: return bytes_value{ pod.get_bytes() };
        case type::rectangle: return pod.get<rectangle>();
        case type::fraction: return pod.get<fraction>();
        case type::bitmap: return pod.get_bitmap();
        case type::array: return array_view<>::parse(pod);
        case type::structure: return struct_view::parse(pod);
        case type::object: return object_view::parse(pod);
        case type::sequence: return sequence_view::parse(pod);
        case type::pointer: return pod.get<pointer>();
        case type::fd: return pod.get<fd>();
        case type::choice: return choice_view::parse(pod);
        case type::pod: return pod;
        default: break;
        }
        throw pod_error::unknown_pod_type_to_downcast(pod.type_tag());
    }

    inline pod_value downcast(byte_view bytes) {
        return downcast(pod_view::parse(bytes));
    }

    template <typename T>
    inline bool holds(const pod_value& value) noexcept {
        return std::holds_alternative<T>(value);
    }

} // namespace podcodec::pod
