/*
 * File: view.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-20
 * License: MIT
 */

#pragma once

#include <string_view>

#include "podcodec/pod/header.hpp"
#include "podcodec/pod/primitive.hpp"
#include "podcodec/pod/string.hpp"

namespace podcodec::pod {

    /// Zero-copy view of one encoded POD: header plus `size` payload bytes.
    /// Trailing padding is not part of the view.
    class pod_view {
    public:

        static constexpr std::size_t prefix_size = 0;

        pod_view() = default;

        /// Parses the POD at the start of `bytes`; anything after it is ignored.
        static pod_view parse(byte_view bytes) {
            const auto hdr = read_header(bytes);
            if (bytes.size() < hdr.pod_size()) {
                throw pod_error::data_too_short(hdr.pod_size(), bytes.size());
            }
            return pod_view(bytes.first(hdr.pod_size()), hdr);
        }

        static pod_view parse_entry(byte_view entry) {
            return parse(entry);
        }

        std::uint32_t size() const noexcept { return size_; }
        std::uint32_t type_tag() const noexcept { return type_; }
        pod::type type() const noexcept { return static_cast<pod::type>(type_); }
        bool is(pod::type t) const noexcept { return type_ == to_tag(t); }

        std::size_t pod_size() const noexcept { return bytes_.size(); }
        std::size_t padded_size() const noexcept { return core::align_up(bytes_.size(), pod_align); }

        byte_view bytes() const noexcept { return bytes_; }
        byte_view payload() const noexcept { return bytes_.subspan(pod_header::header_size()); }

        void expect(pod::type t) const {
            if (!is(t)) {
                throw pod_error::wrong_pod_type_to_cast(t, type_);
            }
        }

        template <Primitive T>
        T get() const {
            using codec = primitive_codec<T>;
            expect(codec::tag);
            return codec::parse(size_, payload());
        }

        std::string_view get_string() const {
            expect(pod::type::string);
            return parse_string(size_, payload());
        }

        byte_view get_bytes() const {
            expect(pod::type::bytes);
            return parse_bytes(size_, payload());
        }

        bitmap_view get_bitmap() const {
            expect(pod::type::bitmap);
            return parse_bitmap(size_, payload());
        }

    private:

        pod_view(byte_view bytes, const pod_header& hdr)
            : bytes_(bytes)
            , size_(hdr.size.get())
            , type_(hdr.type.get())
        {}

        byte_view bytes_ = {};
        std::uint32_t size_ = 0;
        std::uint32_t type_ = 0;
    };

    inline pod::type type_of(const pod_view& pod) noexcept {
        return pod.type();
    }

} // namespace podcodec::pod
