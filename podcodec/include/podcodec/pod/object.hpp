/*
 * File: object.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-26
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

#include "podcodec/pod/cursor.hpp"
#include "podcodec/pod/view.hpp"
#include "podcodec/pod/choice.hpp"
#include "podcodec/pod/array.hpp"
#include "podcodec/param/param_type.hpp"
#include "podcodec/param/catalogs.hpp"

namespace podcodec::pod {

    /// One `{key, flags, pod}` entry of an object, not checked against any catalog.
    struct property_view {
        static constexpr std::size_t prefix_size = sizeof(prop_header);

        std::uint32_t key = 0;
        prop_flags flags = prop_flags::none;
        pod_view value;

        static property_view parse_entry(byte_view entry) {
            const auto hdr = load<prop_header>(entry);
            return { hdr.key.get(), static_cast<prop_flags>(hdr.flags.get()), pod_view::parse(entry.subspan(prefix_size)) };
        }
    };

    /// Property checked against catalog C.
    template <param::Catalog C>
    struct property {
        using key_type = typename C::key;

        key_type key{};
        prop_flags flags = prop_flags::none;
        pod_view value;
        const param::property_descriptor* descriptor = nullptr;

        static property from_view(const property_view& raw) {
            const auto* desc = param::find_descriptor<C>(raw.key);
            if (desc == nullptr) {
                throw pod_error::unknown_pod_type_to_downcast(raw.key);
            }
            param::check_value(*desc, raw.value);
            return { static_cast<key_type>(raw.key), raw.flags, raw.value, desc };
        }

        std::string_view name() const noexcept {
            return descriptor ? descriptor->name : std::string_view{};
        }

        bool has(prop_flags flag) const noexcept {
            return has_flag(flags, flag);
        }

        template <Primitive T>
        T get() const {
            return value.template get<T>();
        }

        template <Element T>
        choice_value<T> choice() const {
            return parse_choice<T>(value);
        }

        template <Element T>
        array_view<T> array() const {
            return array_view<T>::parse(value);
        }
    };

    /// Lazy, validating walk over the properties of an object under catalog C.
    template <param::Catalog C>
    class property_cursor {
    public:
        using catalog = C;
        using value_type = property<C>;
        using iterator = cursor_iterator<property_cursor>;

        property_cursor() = default;
        explicit property_cursor(byte_view region)
            : raw_(region)
        {}

        std::optional<value_type> next() {
            if (auto raw = raw_.next()) {
                return value_type::from_view(*raw);
            }
            return std::nullopt;
        }

        iterator begin() const {
            return iterator(*this);
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

        std::vector<value_type> to_vector() const {
            return collect(*this);
        }

    private:
        pod_cursor<property_view> raw_;
    };

    using object_value = std::variant<
        property_cursor<param::prop_info_catalog>,
        property_cursor<param::props_catalog>,
        property_cursor<param::format_catalog>,
        property_cursor<param::enum_format_catalog>,
        property_cursor<param::buffers_catalog>,
        property_cursor<param::meta_catalog>,
        property_cursor<param::io_catalog>,
        property_cursor<param::profile_catalog>,
        property_cursor<param::port_config_catalog>,
        property_cursor<param::route_catalog>,
        property_cursor<param::profiler_catalog>,
        property_cursor<param::latency_catalog>,
        property_cursor<param::process_latency_catalog>
    >;

    class object_view {
    public:
        using cursor_type = pod_cursor<property_view>;

        object_view() = default;

        static object_view parse(const pod_view& pod) {
            pod.expect(type::object);
            const auto payload = pod.payload();
            const auto body = load<object_body>(payload);
            return object_view(payload.subspan(sizeof(object_body)), body.type.get(), body.id.get());
        }

        pod::type body_type() const noexcept { return static_cast<pod::type>(body_type_); }
        std::uint32_t body_type_tag() const noexcept { return body_type_; }
        std::uint32_t body_id() const noexcept { return body_id_; }

        cursor_type properties() const {
            return cursor_type(region_);
        }

        cursor_type::iterator begin() const {
            return properties().begin();
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

        std::optional<property_view> find(std::uint32_t key) const {
            auto cur = properties();
            while (auto prop = cur.next()) {
                if (prop->key == key) {
                    return prop;
                }
            }
            return std::nullopt;
        }

        template <typename KeyT> requires std::is_enum_v<KeyT>
        std::optional<property_view> find(KeyT key) const {
            return find(static_cast<std::uint32_t>(key));
        }

        /// Catalog inferred from the body type. Format objects are read with
        /// the fixed catalog only when the body id says Format, otherwise with
        /// the enumerable one, which accepts both shapes.
        object_value value() const {
            switch (body_type()) {
            case type::object_prop_info: return make<param::prop_info_catalog>();
            case type::object_props: return make<param::props_catalog>();
            case type::object_format:
                if (body_id_ == static_cast<std::uint32_t>(param::param_type::format)) {
                    return make<param::format_catalog>();
                }
                return make<param::enum_format_catalog>();
            case type::object_param_buffers: return make<param::buffers_catalog>();
            case type::object_param_meta: return make<param::meta_catalog>();
            case type::object_param_io: return make<param::io_catalog>();
            case type::object_param_profile: return make<param::profile_catalog>();
            case type::object_param_port_config: return make<param::port_config_catalog>();
            case type::object_param_route: return make<param::route_catalog>();
            case type::object_profiler: return make<param::profiler_catalog>();
            case type::object_param_latency: return make<param::latency_catalog>();
            case type::object_param_process_latency: return make<param::process_latency_catalog>();
            default: break;
            }
            throw pod_error::unexpected_object_type(body_type_);
        }

        /// Same bytes read under an explicit parameter kind. The kind must agree
        /// with the body type; kinds without a catalog fall back to value().
        object_value param_value(param::param_type kind) const {
            using param::param_type;
            switch (kind) {
            case param_type::prop_info: return make_checked<param::prop_info_catalog>();
            case param_type::props: return make_checked<param::props_catalog>();
            case param_type::format: return make_checked<param::format_catalog>();
            case param_type::enum_format: return make_checked<param::enum_format_catalog>();
            case param_type::buffers: return make_checked<param::buffers_catalog>();
            case param_type::meta: return make_checked<param::meta_catalog>();
            case param_type::io: return make_checked<param::io_catalog>();
            case param_type::enum_profile:
            case param_type::profile: return make_checked<param::profile_catalog>();
            case param_type::enum_port_config:
            case param_type::port_config: return make_checked<param::port_config_catalog>();
            case param_type::enum_route:
            case param_type::route: return make_checked<param::route_catalog>();
            case param_type::latency: return make_checked<param::latency_catalog>();
            case param_type::process_latency: return make_checked<param::process_latency_catalog>();
            case param_type::invalid:
            case param_type::control:
                break;
            }
            return value();
        }

        byte_view properties_bytes() const noexcept {
            return region_;
        }

    private:

        object_view(byte_view region, std::uint32_t body_type, std::uint32_t body_id)
            : region_(region)
            , body_type_(body_type)
            , body_id_(body_id)
        {}

        template <param::Catalog C>
        object_value make() const {
            return property_cursor<C>(region_);
        }

        template <param::Catalog C>
        object_value make_checked() const {
            if (body_type_ != to_tag(C::object_type)) {
                throw pod_error::unexpected_object_type(body_type_);
            }
            return make<C>();
        }

        byte_view region_ = {};
        std::uint32_t body_type_ = 0;
        std::uint32_t body_id_ = 0;
    };

    /// Rewrites the body id of the object at the start of `bytes`.
    inline void set_body_id(byte_span bytes, std::uint32_t id) {
        const auto pod = pod_view::parse(bytes);
        pod.expect(type::object);
        constexpr auto offset = sizeof(pod_header) + offsetof(object_body, id);
        if (pod.pod_size() < offset + sizeof(std::uint32_t)) {
            throw pod_error::data_too_short(offset + sizeof(std::uint32_t), pod.pod_size());
        }
        core::byteorder::native_to_le<std::uint32_t>(id, bytes.data() + offset);
    }

    /// Rewrites the flags of every property with `key` in the object at the
    /// start of `bytes`. Returns false when no such property exists.
    inline bool set_property_flags(byte_span bytes, std::uint32_t key, prop_flags flags) {
        const auto object = object_view::parse(pod_view::parse(bytes));
        const auto region = object.properties_bytes();
        const auto base = static_cast<std::size_t>(region.data() - bytes.data());
        bool found = false;
        std::size_t offset = 0;
        auto cur = object.properties();
        while (auto prop = cur.next()) {
            if (prop->key == key) {
                core::byteorder::native_to_le<std::uint32_t>(static_cast<std::uint32_t>(flags),
                    bytes.data() + base + offset + offsetof(prop_header, flags));
                found = true;
            }
            offset += core::align_up(property_view::prefix_size + prop->value.pod_size(), pod_align);
        }
        return found;
    }

    template <typename KeyT> requires std::is_enum_v<KeyT>
    inline bool set_property_flags(byte_span bytes, KeyT key, prop_flags flags) {
        return set_property_flags(bytes, static_cast<std::uint32_t>(key), flags);
    }

} // namespace podcodec::pod
