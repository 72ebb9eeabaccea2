/*
 * File: header.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-17
 * License: MIT
 */

#pragma once

#include <cstring>
#include <type_traits>

#include "podcodec/core/bytes.hpp"
#include "podcodec/core/byteorder.hpp"
#include "podcodec/pod/type.hpp"
#include "podcodec/pod/error.hpp"

// Wire bodies below are byte-packed so that sizeof() is the wire size.
#if defined(_MSC_VER)
#   define PODCODEC_PACKED_STRUCT_BEGIN __pragma(pack(push, 1))
#   define PODCODEC_PACKED_STRUCT_END   __pragma(pack(pop))
#   define PODCODEC_PACKED
#else
#   define PODCODEC_PACKED_STRUCT_BEGIN
#   define PODCODEC_PACKED_STRUCT_END
#   define PODCODEC_PACKED __attribute__((packed))
#endif

namespace podcodec::pod {

    using core::byte;
    using core::byte_view;
    using core::byte_span;
    using core::byte_buffer;
    using word_u32 = core::byteorder::word_le<std::uint32_t>;
    using word_u64 = core::byteorder::word_le<std::uint64_t>;

    constexpr std::size_t pod_align = 8;

    PODCODEC_PACKED_STRUCT_BEGIN
    struct pod_header {
        word_u32 size = { 0 };
        word_u32 type = { 0 };
        pod::type kind() const { return static_cast<pod::type>(type.get()); }
        std::size_t pod_size() const { return header_size() + size.get(); }
        static constexpr std::size_t header_size() noexcept { return sizeof(pod_header); }
    } PODCODEC_PACKED;

    struct choice_body {
        word_u32 type = { 0 };  // choice_type
        word_u32 flags = { 0 };
        pod_header child;
    } PODCODEC_PACKED;

    struct array_body {
        pod_header child;
    } PODCODEC_PACKED;

    struct object_body {
        word_u32 type = { 0 };
        word_u32 id = { 0 };
    } PODCODEC_PACKED;

    struct prop_header {
        word_u32 key = { 0 };
        word_u32 flags = { 0 };
    } PODCODEC_PACKED;

    struct sequence_body {
        word_u32 unit = { 0 };
        word_u32 pad = { 0 };
    } PODCODEC_PACKED;

    struct control_header {
        word_u32 offset = { 0 };
        word_u32 type = { 0 };
    } PODCODEC_PACKED;

    struct pointer_body {
        word_u32 type = { 0 };
        word_u32 pad = { 0 };
        word_u64 value = { 0 };
    } PODCODEC_PACKED;
    PODCODEC_PACKED_STRUCT_END

    static_assert(sizeof(pod_header) == 8, "pod_header must be 8 bytes");
    static_assert(sizeof(choice_body) == 16, "choice_body must be 16 bytes");
    static_assert(sizeof(array_body) == 8, "array_body must be 8 bytes");
    static_assert(sizeof(object_body) == 8, "object_body must be 8 bytes");
    static_assert(sizeof(prop_header) == 8, "prop_header must be 8 bytes");
    static_assert(sizeof(sequence_body) == 8, "sequence_body must be 8 bytes");
    static_assert(sizeof(control_header) == 8, "control_header must be 8 bytes");
    static_assert(sizeof(pointer_body) == 16, "pointer_body must be 16 bytes");

    template <typename T>
    concept WireStruct = std::is_trivially_copyable_v<T>;

    /// Copies a wire struct out of `bytes` at `offset`.
    /// Throws data_too_short when the region does not hold the whole struct.
    template <WireStruct T>
    inline T load(byte_view bytes, std::size_t offset = 0) {
        if (offset > bytes.size() || bytes.size() - offset < sizeof(T)) {
            throw pod_error::data_too_short(offset + sizeof(T), bytes.size());
        }
        T result;
        std::memcpy(&result, bytes.data() + offset, sizeof(T));
        return result;
    }

    inline pod_header read_header(byte_view bytes) {
        return load<pod_header>(bytes);
    }

} // namespace podcodec::pod
