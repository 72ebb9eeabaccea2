/*
 * File: struct.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-22
 * License: MIT
 */

#pragma once

#include <vector>

#include "podcodec/pod/cursor.hpp"
#include "podcodec/pod/view.hpp"

namespace podcodec::pod {

    class struct_view {
    public:
        using cursor_type = pod_cursor<pod_view>;

        struct_view() = default;

        static struct_view parse(const pod_view& pod) {
            pod.expect(type::structure);
            return struct_view(pod.payload());
        }

        cursor_type cursor() const {
            return cursor_type(region_);
        }

        cursor_type::iterator begin() const {
            return cursor().begin();
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

        // walks the members, O(n)
        std::size_t size() const {
            std::size_t count = 0;
            auto cur = cursor();
            while (cur.next()) {
                ++count;
            }
            return count;
        }

        pod_view at(std::size_t index) const {
            std::size_t count = 0;
            auto cur = cursor();
            while (auto member = cur.next()) {
                if (count++ == index) {
                    return *member;
                }
            }
            throw pod_error::index_is_out_of_range(count, index);
        }

        std::vector<pod_view> to_vector() const {
            return collect(cursor());
        }

        byte_view members() const noexcept {
            return region_;
        }

    private:

        explicit struct_view(byte_view region)
            : region_(region)
        {}

        byte_view region_ = {};
    };

} // namespace podcodec::pod
