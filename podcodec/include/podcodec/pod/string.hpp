/*
 * File: string.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-19
 * License: MIT
 */

#pragma once

#include <algorithm>
#include <string_view>

#include "podcodec/core/bitset.hpp"
#include "podcodec/pod/header.hpp"
#include "podcodec/pod/buffer.hpp"

namespace podcodec::pod {

    using bitmap_view = core::bitset<byte_view>;

    inline byte_view declared_payload(std::size_t size, byte_view bytes) {
        if (bytes.size() < size) {
            throw pod_error::data_too_short(size, bytes.size());
        }
        return bytes.first(size);
    }

    /// Payload carries the text and its terminating NUL. The returned view ends
    /// at the first NUL and borrows from `bytes`.
    inline std::string_view parse_string(std::size_t size, byte_view bytes) {
        const auto payload = declared_payload(size, bytes);
        if (payload.empty() || payload.back() != byte{ 0 }) {
            throw pod_error::string_is_not_null_terminated();
        }
        const auto* text = reinterpret_cast<const char*>(payload.data());
        const auto nul = std::find(payload.begin(), payload.end(), byte{ 0 });
        return std::string_view(text, static_cast<std::size_t>(nul - payload.begin()));
    }

    inline byte_view parse_bytes(std::size_t size, byte_view bytes) {
        return declared_payload(size, bytes);
    }

    inline bitmap_view parse_bitmap(std::size_t size, byte_view bytes) {
        return bitmap_view(declared_payload(size, bytes));
    }

    /// Writes `text` as is. Readers stop at the first NUL, so text after an
    /// embedded NUL is kept on the wire but reads back truncated.
    inline std::size_t write_string(pod_buffer& buf, std::string_view text) {
        return buf.count_written([&] {
            buf.write_header(static_cast<std::uint32_t>(text.size() + 1), type::string);
            buf.write(core::as_bytes(text));
            buf.zeros(1);
            buf.pad();
        });
    }

    inline std::size_t write_bytes(pod_buffer& buf, byte_view bytes) {
        return buf.count_written([&] {
            buf.write_header(static_cast<std::uint32_t>(bytes.size()), type::bytes);
            buf.write(bytes);
            buf.pad();
        });
    }

    inline std::size_t write_bitmap(pod_buffer& buf, byte_view bits) {
        return buf.count_written([&] {
            buf.write_header(static_cast<std::uint32_t>(bits.size()), type::bitmap);
            buf.write(bits);
            buf.pad();
        });
    }

} // namespace podcodec::pod
