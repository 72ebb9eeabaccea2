/*
 * File: array.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-22
 * License: MIT
 */

#pragma once

#include <span>
#include <vector>

#include "podcodec/pod/cursor.hpp"
#include "podcodec/pod/view.hpp"

namespace podcodec::pod {

    /// Homogeneous array: one shared child header, then packed payloads of
    /// `child_size` bytes each. `T = raw_value` accepts any child type.
    template <Element T = raw_value>
    class array_view {
    public:
        using codec = primitive_codec<T>;
        using value_type = T;
        using cursor_type = value_cursor<codec>;

        array_view() = default;

        static array_view parse(const pod_view& pod) {
            pod.expect(type::array);
            const auto payload = pod.payload();
            const auto body = load<array_body>(payload);
            const auto child_type = body.child.type.get();
            const auto child_size = body.child.size.get();

            if constexpr (codec::tag != type::pod) {
                if (child_type != to_tag(codec::tag)) {
                    throw pod_error::wrong_pod_type_to_cast(codec::tag, child_type);
                }
            }

            const auto region = payload.subspan(sizeof(array_body));
            if (child_size == 0) {
                if (!region.empty()) {
                    throw pod_error::data_too_short(region.size(), 0);
                }
            }
            else {
                if (child_size < codec::wire_size) {
                    throw pod_error::data_too_short(codec::wire_size, child_size);
                }
                if (region.size() % child_size != 0) {
                    const auto whole = region.size() / child_size;
                    throw pod_error::data_too_short((whole + 1) * child_size, region.size());
                }
            }
            return array_view(region, child_type, child_size);
        }

        pod::type child_type() const noexcept { return static_cast<pod::type>(child_type_); }
        std::uint32_t child_size() const noexcept { return child_size_; }

        std::size_t size() const noexcept {
            return child_size_ == 0 ? 0 : region_.size() / child_size_;
        }

        bool empty() const noexcept {
            return size() == 0;
        }

        value_type at(std::size_t index) const {
            if (index >= size()) {
                throw pod_error::index_is_out_of_range(size(), index);
            }
            return codec::parse(child_size_, region_.subspan(index * child_size_, child_size_));
        }

        value_type operator [](std::size_t index) const {
            return at(index);
        }

        cursor_type cursor() const {
            return cursor_type(region_, child_size_);
        }

        typename cursor_type::iterator begin() const {
            return cursor().begin();
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

        std::vector<value_type> to_vector() const {
            return collect(cursor());
        }

        byte_view elements() const noexcept {
            return region_;
        }

    private:

        array_view(byte_view region, std::uint32_t child_type, std::uint32_t child_size)
            : region_(region)
            , child_type_(child_type)
            , child_size_(child_size)
        {}

        byte_view region_ = {};
        std::uint32_t child_type_ = 0;
        std::uint32_t child_size_ = 0;
    };

    template <Primitive T>
    inline std::size_t write_array(pod_buffer& buf, std::span<const T> values) {
        using codec = primitive_codec<T>;
        const auto content = values.size() * codec::wire_size;
        return buf.count_written([&] {
            buf.write_header(static_cast<std::uint32_t>(sizeof(array_body) + content), type::array);
            array_body body;
            body.child.size = static_cast<std::uint32_t>(codec::wire_size);
            body.child.type = to_tag(codec::tag);
            buf.put_struct(body);
            for (const auto& value : values) {
                codec::store(buf, value);
            }
            buf.pad();
        });
    }

} // namespace podcodec::pod
