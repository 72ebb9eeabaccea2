/*
 * File: cursor.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-18
 * License: MIT
 */

#pragma once

#include <cstddef>
#include <algorithm>
#include <iterator>
#include <optional>
#include <vector>

#include "podcodec/core/bytes.hpp"
#include "podcodec/pod/header.hpp"

namespace podcodec::pod {

    template <typename Cursor>
    class cursor_iterator {
    public:
        using value_type = typename Cursor::value_type;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        cursor_iterator() = default;

        explicit cursor_iterator(Cursor cursor)
            : cursor_(std::move(cursor))
        {
            advance();
        }

        const value_type& operator*() const {
            return *current_;
        }

        const value_type* operator->() const {
            return &*current_;
        }

        cursor_iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) {
            advance();
        }

        friend bool operator == (const cursor_iterator& it, std::default_sentinel_t) {
            return !it.current_.has_value();
        }

    private:

        void advance() {
            current_ = cursor_.next();
        }

        Cursor cursor_ = {};
        std::optional<value_type> current_;
    };

    /// Walks a region of fixed-stride payloads without headers (array and
    /// choice elements). Codec supplies `parse(size, bytes)`.
    template <typename Codec>
    class value_cursor {
    public:
        using value_type = typename Codec::value_type;
        using iterator = cursor_iterator<value_cursor>;

        value_cursor() = default;
        value_cursor(byte_view region, std::size_t stride)
            : region_(region)
            , stride_(stride)
        {}

        std::optional<value_type> next() {
            if (stride_ == 0 || offset_ >= region_.size() || region_.size() - offset_ < stride_) {
                offset_ = region_.size();
                return std::nullopt;
            }
            auto element = region_.subspan(offset_, stride_);
            offset_ += stride_;
            return Codec::parse(stride_, element);
        }

        std::size_t remaining() const noexcept {
            return stride_ == 0 ? 0 : (region_.size() - offset_) / stride_;
        }

        std::size_t stride() const noexcept {
            return stride_;
        }

        iterator begin() const {
            return iterator(*this);
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

    private:
        byte_view region_ = {};
        std::size_t stride_ = 0;
        std::size_t offset_ = 0;
    };

    /// Walks self-headered entries (struct members, object properties, sequence
    /// controls). Each entry is `Entry::prefix_size` bytes of fixed prefix,
    /// followed by a POD, and the next entry starts on the following
    /// pod_align boundary. Entries that claim more bytes than remain are errors.
    template <typename Entry>
    class pod_cursor {
    public:
        using value_type = Entry;
        using iterator = cursor_iterator<pod_cursor>;

        pod_cursor() = default;
        explicit pod_cursor(byte_view region)
            : region_(region)
        {}

        std::optional<value_type> next() {
            if (offset_ >= region_.size()) {
                return std::nullopt;
            }
            constexpr auto fixed = Entry::prefix_size + pod_header::header_size();
            const auto remaining = region_.size() - offset_;
            if (remaining < fixed) {
                offset_ = region_.size();
                throw pod_error::data_too_short(fixed, remaining);
            }
            const auto hdr = load<pod_header>(region_, offset_ + Entry::prefix_size);
            const auto entry_size = Entry::prefix_size + hdr.pod_size();
            if (entry_size > remaining) {
                offset_ = region_.size();
                throw pod_error::data_too_short(entry_size, remaining);
            }
            auto entry = region_.subspan(offset_, entry_size);
            offset_ = std::min(region_.size(), offset_ + core::align_up(entry_size, pod_align));
            return Entry::parse_entry(entry);
        }

        bool done() const noexcept {
            return offset_ >= region_.size();
        }

        iterator begin() const {
            return iterator(*this);
        }

        std::default_sentinel_t end() const noexcept {
            return {};
        }

    private:
        byte_view region_ = {};
        std::size_t offset_ = 0;
    };

    template <typename Cursor>
    inline std::vector<typename Cursor::value_type> collect(Cursor cursor) {
        std::vector<typename Cursor::value_type> result;
        while (auto item = cursor.next()) {
            result.push_back(std::move(*item));
        }
        return result;
    }

} // namespace podcodec::pod
