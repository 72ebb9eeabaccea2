/*
 * File: catalog.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-25
 * License: MIT
 */

#pragma once

#include <array>
#include <concepts>
#include <cstdint>
#include <string_view>

#include "podcodec/pod/type.hpp"
#include "podcodec/pod/view.hpp"
#include "podcodec/pod/choice.hpp"

namespace podcodec::param {

    using pod::type;

    enum class value_shape : std::uint8_t {
        plain,   // exactly value_type
        choice,  // Choice over value_type, or a bare value_type
        any,     // any pod
    };

    struct property_descriptor {
        std::uint32_t key = 0;
        std::string_view name;
        type value_type = type::none;
        value_shape shape = value_shape::plain;
        type element_type = type::start; // arrays only, start = not checked
    };

    template <typename KeyT>
    constexpr inline property_descriptor plain(KeyT key, std::string_view name, type value_type) {
        return { static_cast<std::uint32_t>(key), name, value_type, value_shape::plain, type::start };
    }

    template <typename KeyT>
    constexpr inline property_descriptor choice_of(KeyT key, std::string_view name, type value_type) {
        return { static_cast<std::uint32_t>(key), name, value_type, value_shape::choice, type::start };
    }

    template <typename KeyT>
    constexpr inline property_descriptor array_of(KeyT key, std::string_view name, type element_type) {
        return { static_cast<std::uint32_t>(key), name, type::array, value_shape::plain, element_type };
    }

    template <typename KeyT>
    constexpr inline property_descriptor any_pod(KeyT key, std::string_view name) {
        return { static_cast<std::uint32_t>(key), name, type::pod, value_shape::any, type::start };
    }

    /// A closed key set for one object subtype.
    template <typename C>
    concept Catalog = requires {
        typename C::key;
        { C::name } -> std::convertible_to<std::string_view>;
        { C::object_type } -> std::convertible_to<type>;
        C::descriptors.size();
    } && std::is_enum_v<typename C::key>;

    template <Catalog C>
    constexpr inline const property_descriptor* find_descriptor(std::uint32_t key) noexcept {
        for (const auto& desc : C::descriptors) {
            if (desc.key == key) {
                return &desc;
            }
        }
        return nullptr;
    }

    /// Throws wrong_pod_type_to_cast when `value` does not fit `desc`.
    inline void check_value(const property_descriptor& desc, const pod::pod_view& value) {
        switch (desc.shape) {
        case value_shape::any:
            return;
        case value_shape::plain:
            value.expect(desc.value_type);
            if (desc.element_type != type::start) {
                const auto child = pod::load<pod::array_body>(value.payload());
                if (child.child.type.get() != pod::to_tag(desc.element_type)) {
                    throw pod::pod_error::wrong_pod_type_to_cast(desc.element_type, child.child.type.get());
                }
            }
            return;
        case value_shape::choice:
            if (value.is(type::choice)) {
                const auto choice = pod::choice_view::parse(value);
                if (choice.child_type() != desc.value_type) {
                    throw pod::pod_error::wrong_pod_type_to_cast(desc.value_type, choice.child_type_tag());
                }
                return;
            }
            if (!value.is(desc.value_type)) {
                throw pod::pod_error::wrong_pod_type_to_cast(type::choice, value.type_tag());
            }
            return;
        }
    }

} // namespace podcodec::param
