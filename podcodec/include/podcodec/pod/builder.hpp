/*
 * File: builder.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-28
 * License: MIT
 */

#pragma once

#include <initializer_list>
#include <span>
#include <string_view>
#include <type_traits>
#include <vector>

#include "podcodec/pod/buffer.hpp"
#include "podcodec/pod/primitive.hpp"
#include "podcodec/pod/string.hpp"
#include "podcodec/pod/array.hpp"
#include "podcodec/pod/choice.hpp"
#include "podcodec/pod/view.hpp"

namespace podcodec::pod {

    class object_builder;
    class sequence_builder;

    template <typename KeyT>
    constexpr inline std::uint32_t to_key(KeyT key) noexcept {
        return static_cast<std::uint32_t>(key);
    }

    /// Appends PODs to an owned pod_buffer. Containers take a callback that
    /// writes their members, the size in the container header is patched in
    /// once the members are written.
    class pod_builder {
    public:

        pod_builder() = default;

        explicit pod_builder(const settings& sett)
            : buffer_(sett)
        {}

        template <Primitive T>
        pod_builder& add(const T& value) {
            write_primitive(buffer_, value);
            return *this;
        }

        pod_builder& add(std::string_view text) {
            write_string(buffer_, text);
            return *this;
        }

        pod_builder& add(const char* text) {
            return add(std::string_view(text));
        }

        pod_builder& add_none() {
            write_none(buffer_);
            return *this;
        }

        pod_builder& add_bytes(byte_view bytes) {
            write_bytes(buffer_, bytes);
            return *this;
        }

        pod_builder& add_bitmap(byte_view bits) {
            write_bitmap(buffer_, bits);
            return *this;
        }

        template <Primitive T>
        pod_builder& add_array(std::span<const T> values) {
            write_array<T>(buffer_, values);
            return *this;
        }

        template <Primitive T>
        pod_builder& add_array(const std::vector<T>& values) {
            return add_array<T>(std::span<const T>(values.data(), values.size()));
        }

        template <Primitive T>
        pod_builder& add_array(std::initializer_list<T> values) {
            return add_array<T>(std::span<const T>(values.begin(), values.size()));
        }

        pod_builder& add_array(const std::vector<bool>& values) {
            std::vector<std::int32_t> words(values.begin(), values.end());
            buffer_.count_written([&] {
                const auto content = words.size() * sizeof(std::int32_t);
                buffer_.write_header(static_cast<std::uint32_t>(sizeof(array_body) + content), type::array);
                array_body body;
                body.child.size = static_cast<std::uint32_t>(sizeof(std::int32_t));
                body.child.type = to_tag(type::boolean);
                buffer_.put_struct(body);
                for (const auto w : words) {
                    buffer_.put<std::int32_t>(w);
                }
                buffer_.pad();
            });
            return *this;
        }

        template <Primitive T>
        pod_builder& add_choice(const choice_value<T>& choice, std::uint32_t flags = 0) {
            write_choice(buffer_, choice, flags);
            return *this;
        }

        pod_builder& add_choice(const any_choice& choice, std::uint32_t flags = 0) {
            write_any_choice(buffer_, choice, flags);
            return *this;
        }

        template <typename Fn>
        pod_builder& add_struct(Fn&& members) {
            buffer_.check_align();
            buffer_.write_end_then_start(sizeof(pod_header),
                [&] { members(*this); },
                [&](std::size_t body_size) {
                    buffer_.write_header(static_cast<std::uint32_t>(body_size), type::structure);
                });
            buffer_.pad();
            return *this;
        }

        template <typename Fn>
        pod_builder& add_object(pod::type object_type, std::uint32_t id, Fn&& properties);

        template <typename Fn>
        pod_builder& add_sequence(std::uint32_t unit, Fn&& controls);

        /// Copies an already encoded POD.
        pod_builder& add_pod(const pod_view& pod) {
            buffer_.check_align();
            buffer_.write(pod.bytes());
            buffer_.pad();
            return *this;
        }

        pod_buffer& buffer() noexcept {
            return buffer_;
        }

        byte_view view() const noexcept {
            return buffer_.view();
        }

        /// The first POD written.
        pod_view root() const {
            return pod_view::parse(buffer_.view());
        }

        byte_buffer release() {
            return buffer_.release();
        }

    private:
        pod_buffer buffer_;
    };

    class object_builder {
    public:

        explicit object_builder(pod_builder& builder)
            : builder_(builder)
        {}

        /// Writes the property prefix, then lets `fn` write the value POD.
        template <typename KeyT, typename Fn>
        object_builder& property(KeyT key, prop_flags flags, Fn&& fn) {
            auto& buf = builder_.buffer();
            buf.check_align();
            prop_header hdr;
            hdr.key = to_key(key);
            hdr.flags = static_cast<std::uint32_t>(flags);
            buf.put_struct(hdr);
            fn(builder_);
            return *this;
        }

        template <typename KeyT, Primitive T>
        object_builder& add(KeyT key, const T& value, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add(value); });
        }

        template <typename KeyT>
        object_builder& add(KeyT key, std::string_view text, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add(text); });
        }

        template <typename KeyT>
        object_builder& add_bytes(KeyT key, byte_view bytes, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_bytes(bytes); });
        }

        template <typename KeyT, Primitive T>
        object_builder& add_choice(KeyT key, const choice_value<T>& choice, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_choice(choice); });
        }

        template <typename KeyT, Primitive T>
        object_builder& add_array(KeyT key, std::initializer_list<T> values, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_array(values); });
        }

        template <typename KeyT, Primitive T>
        object_builder& add_array(KeyT key, const std::vector<T>& values, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_array(values); });
        }

        template <typename KeyT, typename Fn>
        object_builder& add_struct(KeyT key, Fn&& members, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_struct(members); });
        }

        template <typename KeyT, typename Fn>
        object_builder& add_object(KeyT key, pod::type object_type, std::uint32_t id, Fn&& properties,
            prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_object(object_type, id, properties); });
        }

        template <typename KeyT>
        object_builder& add_pod(KeyT key, const pod_view& pod, prop_flags flags = prop_flags::none) {
            return property(key, flags, [&](pod_builder& b) { b.add_pod(pod); });
        }

    private:
        pod_builder& builder_;
    };

    class sequence_builder {
    public:

        explicit sequence_builder(pod_builder& builder)
            : builder_(builder)
        {}

        template <typename Fn>
        sequence_builder& control(std::uint32_t offset, control_type kind, Fn&& fn) {
            auto& buf = builder_.buffer();
            buf.check_align();
            control_header hdr;
            hdr.offset = offset;
            hdr.type = static_cast<std::uint32_t>(kind);
            buf.put_struct(hdr);
            fn(builder_);
            return *this;
        }

        template <typename Fn>
        sequence_builder& add_properties(std::uint32_t offset, Fn&& properties) {
            return control(offset, control_type::properties, [&](pod_builder& b) {
                b.add_object(type::object_props, 0, properties);
            });
        }

        sequence_builder& add_midi(std::uint32_t offset, byte_view data) {
            return control(offset, control_type::midi, [&](pod_builder& b) { b.add_bytes(data); });
        }

        sequence_builder& add_osc(std::uint32_t offset, byte_view data) {
            return control(offset, control_type::osc, [&](pod_builder& b) { b.add_bytes(data); });
        }

    private:
        pod_builder& builder_;
    };

    template <typename Fn>
    pod_builder& pod_builder::add_object(pod::type object_type, std::uint32_t id, Fn&& properties) {
        buffer_.check_align();
        buffer_.write_end_then_start(sizeof(pod_header) + sizeof(object_body),
            [&] {
                object_builder props(*this);
                properties(props);
            },
            [&](std::size_t body_size) {
                buffer_.write_header(static_cast<std::uint32_t>(sizeof(object_body) + body_size), type::object);
                object_body body;
                body.type = to_tag(object_type);
                body.id = id;
                buffer_.put_struct(body);
            });
        buffer_.pad();
        return *this;
    }

    template <typename Fn>
    pod_builder& pod_builder::add_sequence(std::uint32_t unit, Fn&& controls) {
        buffer_.check_align();
        buffer_.write_end_then_start(sizeof(pod_header) + sizeof(sequence_body),
            [&] {
                sequence_builder seq(*this);
                controls(seq);
            },
            [&](std::size_t body_size) {
                buffer_.write_header(static_cast<std::uint32_t>(sizeof(sequence_body) + body_size), type::sequence);
                sequence_body body;
                body.unit = unit;
                buffer_.put_struct(body);
            });
        buffer_.pad();
        return *this;
    }

    template <Primitive T>
    inline byte_buffer encode(const T& value) {
        pod_builder builder;
        builder.add(value);
        return builder.release();
    }

    template <Primitive T>
    inline T decode(byte_view bytes) {
        return pod_view::parse(bytes).get<T>();
    }

} // namespace podcodec::pod
