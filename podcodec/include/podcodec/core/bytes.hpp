/*
 * File: bytes.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-14
 * License: MIT
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>
#include <span>
#include <string_view>
#include <concepts>

namespace podcodec::core {

	using byte = std::byte;
	using byte_buffer = std::vector<byte>;
	using byte_view = std::span<const byte>;
	using byte_span = std::span<byte>;

	template <typename T>
	constexpr inline T align_up(T value, std::size_t align)
		requires std::unsigned_integral<T>
	{
		return (value + static_cast<T>(align - 1)) & ~static_cast<T>(align - 1);
	}

	template <typename T>
	constexpr inline T padding_for(T value, std::size_t align)
		requires std::unsigned_integral<T>
	{
		return align_up(value, align) - value;
	}

	template <typename T>
	constexpr inline bool is_aligned(T value, std::size_t align)
		requires std::unsigned_integral<T>
	{
		return (value & static_cast<T>(align - 1)) == 0;
	}

	inline byte_view as_bytes(std::string_view text) noexcept {
		return std::as_bytes(std::span<const char>(text.data(), text.size()));
	}

} // namespace podcodec::core
