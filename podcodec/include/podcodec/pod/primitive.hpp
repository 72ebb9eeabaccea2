/*
 * File: primitive.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <concepts>
#include <cstdint>
#include <ostream>

#include "podcodec/core/byteorder.hpp"
#include "podcodec/pod/header.hpp"
#include "podcodec/pod/buffer.hpp"

namespace podcodec::pod {

    struct id {
        std::uint32_t value = 0;
        friend bool operator == (const id&, const id&) = default;
    };

    struct rectangle {
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        friend bool operator == (const rectangle&, const rectangle&) = default;
    };

    struct fraction {
        std::uint32_t num = 0;
        std::uint32_t denom = 0;
        friend bool operator == (const fraction&, const fraction&) = default;
    };

    struct fd {
        std::int64_t value = -1;
        friend bool operator == (const fd&, const fd&) = default;
    };

    struct pointer {
        std::uint32_t pointer_type = 0;
        std::uint64_t address = 0;
        friend bool operator == (const pointer&, const pointer&) = default;
    };

    /// Undecoded element payload, used where any child type is accepted.
    struct raw_value {
        byte_view bytes;
        friend bool operator == (const raw_value& lhs, const raw_value& rhs) {
            return std::ranges::equal(lhs.bytes, rhs.bytes);
        }
    };

    inline std::ostream& operator << (std::ostream& os, const id& v) {
        return os << "Id(" << v.value << ")";
    }

    inline std::ostream& operator << (std::ostream& os, const rectangle& v) {
        return os << v.width << "x" << v.height;
    }

    inline std::ostream& operator << (std::ostream& os, const fraction& v) {
        return os << v.num << "/" << v.denom;
    }

    inline std::ostream& operator << (std::ostream& os, const fd& v) {
        return os << "Fd(" << v.value << ")";
    }

    inline void check_wire_size(std::size_t wire_size, std::size_t declared, byte_view bytes) {
        if (declared < wire_size) {
            throw pod_error::data_too_short(wire_size, declared);
        }
        if (bytes.size() < wire_size) {
            throw pod_error::data_too_short(wire_size, bytes.size());
        }
    }

    // specialized per value type, the primary has no codec
    template <typename T>
    struct primitive_codec {};

    template <byteorder::Word W, type Tag, typename ValueT = W>
    struct integer_codec {
        using value_type = ValueT;
        static constexpr pod::type tag = Tag;
        static constexpr std::size_t wire_size = sizeof(W);

        static value_type parse(std::size_t size, byte_view bytes) {
            check_wire_size(wire_size, size, bytes);
            return value_type{ byteorder::le_to_native<W>(bytes.data()) };
        }

        static void store(pod_buffer& buf, const value_type& value) {
            if constexpr (std::same_as<value_type, W>) {
                buf.put<W>(value);
            }
            else {
                buf.put<W>(value.value);
            }
        }
    };

    template <byteorder::Float F, type Tag>
    struct float_codec {
        using value_type = F;
        static constexpr pod::type tag = Tag;
        static constexpr std::size_t wire_size = sizeof(F);

        static value_type parse(std::size_t size, byte_view bytes) {
            check_wire_size(wire_size, size, bytes);
            return byteorder::le_to_native_float<F>(bytes.data());
        }

        static void store(pod_buffer& buf, value_type value) {
            buf.put<F>(value);
        }
    };

    template <>
    struct primitive_codec<bool> {
        using value_type = bool;
        static constexpr pod::type tag = type::boolean;
        static constexpr std::size_t wire_size = sizeof(std::int32_t);

        static value_type parse(std::size_t size, byte_view bytes) {
            check_wire_size(wire_size, size, bytes);
            return byteorder::le_to_native<std::int32_t>(bytes.data()) != 0;
        }

        static void store(pod_buffer& buf, value_type value) {
            buf.put<std::int32_t>(value ? 1 : 0);
        }
    };

    template <> struct primitive_codec<id> : integer_codec<std::uint32_t, type::id, id> {};
    template <> struct primitive_codec<std::int32_t> : integer_codec<std::int32_t, type::int32> {};
    template <> struct primitive_codec<std::int64_t> : integer_codec<std::int64_t, type::int64> {};
    template <> struct primitive_codec<fd> : integer_codec<std::int64_t, type::fd, fd> {};
    template <> struct primitive_codec<float> : float_codec<float, type::float32> {};
    template <> struct primitive_codec<double> : float_codec<double, type::float64> {};

    template <>
    struct primitive_codec<rectangle> {
        using value_type = rectangle;
        static constexpr pod::type tag = type::rectangle;
        static constexpr std::size_t wire_size = 8;

        static value_type parse(std::size_t size, byte_view bytes) {
            check_wire_size(wire_size, size, bytes);
            return { byteorder::le_to_native<std::uint32_t>(bytes.data()),
                     byteorder::le_to_native<std::uint32_t>(bytes.data() + 4) };
        }

        static void store(pod_buffer& buf, const value_type& value) {
            buf.put<std::uint32_t>(value.width).put<std::uint32_t>(value.height);
        }
    };

    template <>
    struct primitive_codec<fraction> {
        using value_type = fraction;
        static constexpr pod::type tag = type::fraction;
        static constexpr std::size_t wire_size = 8;

        static value_type parse(std::size_t size, byte_view bytes) {
            check_wire_size(wire_size, size, bytes);
            return { byteorder::le_to_native<std::uint32_t>(bytes.data()),
                     byteorder::le_to_native<std::uint32_t>(bytes.data() + 4) };
        }

        static void store(pod_buffer& buf, const value_type& value) {
            buf.put<std::uint32_t>(value.num).put<std::uint32_t>(value.denom);
        }
    };

    template <>
    struct primitive_codec<pointer> {
        using value_type = pointer;
        static constexpr pod::type tag = type::pointer;
        static constexpr std::size_t wire_size = sizeof(pointer_body);

        static value_type parse(std::size_t size, byte_view bytes) {
            check_wire_size(wire_size, size, bytes);
            const auto body = load<pointer_body>(bytes);
            return { body.type.get(), body.value.get() };
        }

        static void store(pod_buffer& buf, const value_type& value) {
            pointer_body body;
            body.type = value.pointer_type;
            body.value = value.address;
            buf.put_struct(body);
        }
    };

    template <>
    struct primitive_codec<raw_value> {
        using value_type = raw_value;
        static constexpr pod::type tag = type::pod;
        static constexpr std::size_t wire_size = 0;

        static value_type parse(std::size_t size, byte_view bytes) {
            return { bytes.first(std::min(size, bytes.size())) };
        }

        static void store(pod_buffer& buf, const value_type& value) {
            buf.write(value.bytes);
        }
    };

    /// Anything with a fixed-stride element codec, the wildcard included.
    template <typename T>
    concept Element = requires(std::size_t size, byte_view bytes, pod_buffer& buf, const T& value) {
        { primitive_codec<T>::tag } -> std::convertible_to<type>;
        { primitive_codec<T>::wire_size } -> std::convertible_to<std::size_t>;
        { primitive_codec<T>::parse(size, bytes) } -> std::same_as<T>;
        primitive_codec<T>::store(buf, value);
    };

    template <typename T>
    concept Primitive = Element<T> && (primitive_codec<T>::tag != type::pod);

    template <Primitive T>
    inline std::size_t write_primitive(pod_buffer& buf, const T& value) {
        using codec = primitive_codec<T>;
        return buf.count_written([&] {
            buf.write_header(static_cast<std::uint32_t>(codec::wire_size), codec::tag);
            codec::store(buf, value);
            buf.pad();
        });
    }

    inline std::size_t write_none(pod_buffer& buf) {
        return buf.count_written([&] {
            buf.write_header(0, type::none);
        });
    }

} // namespace podcodec::pod
