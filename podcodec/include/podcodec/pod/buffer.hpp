/*
 * File: buffer.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-18
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstring>
#include <utility>

#include "podcodec/core/bytes.hpp"
#include "podcodec/core/byteorder.hpp"
#include "podcodec/core/debug.hpp"
#include "podcodec/pod/header.hpp"
#include "podcodec/pod/settings.hpp"

namespace podcodec::pod {

    namespace byteorder = core::byteorder;

    /// Growable, seekable byte sink. Writes land at `position()` and overwrite
    /// existing bytes, seeking past the end zero-fills the gap.
    class pod_buffer {
    public:

        pod_buffer() 
            : pod_buffer(settings{})
        {}

        explicit pod_buffer(const settings& sett) {
            buffer_.reserve(sett.initial_buffer_capacity);
        }

        std::size_t position() const noexcept {
            return pos_;
        }

        std::size_t size() const noexcept {
            return buffer_.size();
        }

        void seek(std::size_t pos) {
            if (pos > buffer_.size()) {
                buffer_.resize(pos, byte{ 0 });
            }
            pos_ = pos;
        }

        void seek_end() {
            pos_ = buffer_.size();
        }

        /// `bytes` may point into this buffer, e.g. a view of an already written POD.
        pod_buffer& write(byte_view bytes) {
            if (bytes.empty()) {
                return *this;
            }
            if (owns(bytes)) {
                const auto offset = static_cast<std::size_t>(bytes.data() - buffer_.data());
                const auto count = bytes.size();
                reserve_at_pos(count);
                std::memmove(buffer_.data() + pos_, buffer_.data() + offset, count);
                pos_ += count;
                return *this;
            }
            reserve_at_pos(bytes.size());
            std::memcpy(buffer_.data() + pos_, bytes.data(), bytes.size());
            pos_ += bytes.size();
            return *this;
        }

        template <byteorder::Word W>
        pod_buffer& put(W value) {
            reserve_at_pos(sizeof(W));
            byteorder::native_to_le<W>(value, buffer_.data() + pos_);
            pos_ += sizeof(W);
            return *this;
        }

        template <byteorder::Float F>
        pod_buffer& put(F value) {
            reserve_at_pos(sizeof(F));
            byteorder::native_to_le_float<F>(value, buffer_.data() + pos_);
            pos_ += sizeof(F);
            return *this;
        }

        template <WireStruct T>
        pod_buffer& put_struct(const T& value) {
            reserve_at_pos(sizeof(T));
            std::memcpy(buffer_.data() + pos_, &value, sizeof(T));
            pos_ += sizeof(T);
            return *this;
        }

        pod_buffer& zeros(std::size_t count) {
            reserve_at_pos(count);
            std::memset(buffer_.data() + pos_, 0, count);
            pos_ += count;
            return *this;
        }

        /// Zero bytes up to the next pod_align boundary.
        pod_buffer& pad() {
            return zeros(core::padding_for(pos_, pod_align));
        }

        bool aligned() const noexcept {
            return core::is_aligned(pos_, pod_align);
        }

        void check_align() const {
            if (!aligned()) {
                throw pod_error::pod_is_not_aligned(pos_);
            }
        }

        pod_buffer& write_header(std::uint32_t size, std::uint32_t type_tag) {
            check_align();
            pod_header hdr;
            hdr.size = size;
            hdr.type = type_tag;
            return put_struct(hdr);
        }

        pod_buffer& write_header(std::uint32_t size, type t) {
            return write_header(size, to_tag(t));
        }

        /// Runs `fn` and reports how many bytes it moved the write position.
        template <typename Fn>
        std::size_t count_written(Fn&& fn) {
            const auto start = pos_;
            std::forward<Fn>(fn)();
            PODCODEC_ASSERT(pos_ >= start, "writer moved backwards");
            return pos_ - start;
        }

        /// Reserves `reserved` bytes, writes the body after them, then fills the
        /// reserved region by calling `header_fn(body_size)`. Leaves the position
        /// at the end of the body and returns the body size.
        /// If either callback throws, the buffer is cut back to its previous size
        /// and the position returns to where the container started.
        template <typename BodyFn, typename HeaderFn>
        std::size_t write_end_then_start(std::size_t reserved, BodyFn&& body_fn, HeaderFn&& header_fn) {
            const auto start = pos_;
            const auto old_size = buffer_.size();
            std::size_t body_size = 0;
            std::size_t end = 0;
            std::size_t header_size = 0;
            try {
                seek(start + reserved);
                body_size = count_written(std::forward<BodyFn>(body_fn));
                end = pos_;
                seek(start);
                header_size = count_written([&] { std::forward<HeaderFn>(header_fn)(body_size); });
            }
            catch (...) {
                rollback(start, old_size);
                throw;
            }
            PODCODEC_ASSERT(header_size == reserved, "header does not fill the reserved region");
            seek(end);
            return body_size;
        }

        /// Overwrites a word at an absolute offset without moving the position.
        template <byteorder::Word W>
        void patch(std::size_t offset, W value) {
            PODCODEC_ASSERT(offset + sizeof(W) <= buffer_.size(), "patch outside of the buffer");
            byteorder::native_to_le<W>(value, buffer_.data() + offset);
        }

        byte_view view() const noexcept {
            return byte_view(buffer_.data(), buffer_.size());
        }

        byte_span span() noexcept {
            return byte_span(buffer_.data(), buffer_.size());
        }

        byte_buffer release() {
            pos_ = 0;
            return std::exchange(buffer_, byte_buffer{});
        }

        void clear() noexcept {
            buffer_.clear();
            pos_ = 0;
        }

    private:

        void rollback(std::size_t start, std::size_t old_size) noexcept {
            if (buffer_.size() > old_size) {
                buffer_.resize(old_size);
            }
            pos_ = start;
        }

        bool owns(byte_view bytes) const noexcept {
            const auto begin = reinterpret_cast<std::uintptr_t>(buffer_.data());
            const auto end = begin + buffer_.size();
            const auto first = reinterpret_cast<std::uintptr_t>(bytes.data());
            return !buffer_.empty() && first >= begin && first < end;
        }

        void reserve_at_pos(std::size_t count) {
            if (pos_ + count > buffer_.size()) {
                buffer_.resize(pos_ + count);
            }
        }

        byte_buffer buffer_;
        std::size_t pos_ = 0;
    };

} // namespace podcodec::pod
