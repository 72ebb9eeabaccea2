/*
 * File: sequence.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-27
 * License: MIT
 */

#pragma once

#include <variant>
#include <vector>

#include "podcodec/pod/cursor.hpp"
#include "podcodec/pod/view.hpp"
#include "podcodec/pod/object.hpp"

namespace podcodec::pod {

    struct midi_event {
        byte_view data;
    };

    struct osc_event {
        byte_view data;
    };

    using props_cursor = property_cursor<param::props_catalog>;

    /// monostate for control_type::invalid
    using control_value = std::variant<std::monostate, props_cursor, midi_event, osc_event>;

    struct control_view {
        static constexpr std::size_t prefix_size = sizeof(control_header);

        std::uint32_t offset = 0;
        std::uint32_t type = 0;
        pod_view value;

        static control_view parse_entry(byte_view entry) {
            const auto hdr = load<control_header>(entry);
            return { hdr.offset.get(), hdr.type.get(), pod_view::parse(entry.subspan(prefix_size)) };
        }

        control_type kind() const noexcept {
            return static_cast<control_type>(type);
        }

        control_value decode() const {
            switch (kind()) {
            case control_type::invalid:
                return std::monostate{};
            case control_type::properties: {
                const auto object = object_view::parse(value);
                if (object.body_type() != pod::type::object_props) {
                    throw pod_error::unexpected_object_type(object.body_type_tag());
                }
                return props_cursor(object.properties_bytes());
            }
            case control_type::midi:
                return midi_event{ value.get_bytes() };
            case control_type::osc:
                return osc_event{ value.get_bytes() };
            }
            throw pod_error::unexpected_control_type(type);
        }
    };

    class sequence_view {
    public:
        using cursor_type = pod_cursor<control_view>;

        sequence_view() = default;

        static sequence_view parse(const pod_view& pod) {
            pod.expect(type::sequence);
            const auto payload = pod.payload();
            const auto body = load<sequence_body>(payload);
            return sequence_view(payload.subspan(sizeof(sequence_body)), body.unit.get());
        }

        std::uint32_t unit() const noexcept {
            return unit_;
        }

        cursor_type controls() const {
            return cursor_type(region_);
        }

        cursor_type::iterator begin() const {
            return controls().begin();
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

        std::vector<control_view> to_vector() const {
            return collect(controls());
        }

    private:

        sequence_view(byte_view region, std::uint32_t unit)
            : region_(region)
            , unit_(unit)
        {}

        byte_view region_ = {};
        std::uint32_t unit_ = 0;
    };

} // namespace podcodec::pod
