/*
 * File: core/bitset.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-16
 * License: MIT
 */

#pragma once

#include <bit>
#include <climits>
#include <concepts>
#include <optional>
#include <type_traits>

#include "podcodec/core/bytes.hpp"

namespace podcodec::core {

	// Bit addressing over a byte region, bit 0 is the lowest bit of the first byte.
	template <typename SpanT = core::byte_view>
		requires (std::same_as<SpanT, core::byte_view> || std::same_as<SpanT, core::byte_span>)
	class bitset {
	public:
		using span_type = SpanT;
		constexpr static std::size_t data_bits = CHAR_BIT;
		constexpr static bool is_mutable = std::same_as<SpanT, core::byte_span>;

		bitset() = default;
		bitset(bitset&&) = default;
		bitset& operator = (bitset&&) = default;
		bitset(const bitset&) = default;
		bitset& operator = (const bitset&) = default;

		explicit bitset(span_type container)
			: buckets_(container)
		{}

		inline std::size_t bits_count() const noexcept {
			return buckets_.size() * data_bits;
		}

		inline std::size_t bytes_count() const noexcept {
			return buckets_.size();
		}

		inline span_type data() const noexcept {
			return buckets_;
		}

		inline void set(std::size_t bit_pos) requires is_mutable {
			if (bits_count() <= bit_pos) {
				return;
			}
			buckets_[bit_pos / data_bits] |= mask(bit_pos);
		}

		inline void clear(std::size_t bit_pos) requires is_mutable {
			if (bits_count() <= bit_pos) {
				return;
			}
			buckets_[bit_pos / data_bits] &= ~mask(bit_pos);
		}

		inline void reset() requires is_mutable {
			for (auto& b : buckets_) {
				b = core::byte{ 0 };
			}
		}

		[[nodiscard]]
		inline bool test(std::size_t bit_pos) const {
			if (bits_count() <= bit_pos) {
				return false;
			}
			return (buckets_[bit_pos / data_bits] & mask(bit_pos)) != core::byte{ 0 };
		}

		std::optional<std::size_t> find_set_bit(std::size_t from = 0) const {
			for (std::size_t pos = from; pos < bits_count(); ++pos) {
				if ((pos % data_bits) == 0 && buckets_[pos / data_bits] == core::byte{ 0 }) {
					pos += data_bits - 1;
					continue;
				}
				if (test(pos)) {
					return { pos };
				}
			}
			return std::nullopt;
		}

		std::optional<std::size_t> find_zero_bit(std::size_t from = 0) const {
			for (std::size_t pos = from; pos < bits_count(); ++pos) {
				if ((pos % data_bits) == 0 && buckets_[pos / data_bits] == core::byte{ 0xFF }) {
					pos += data_bits - 1;
					continue;
				}
				if (!test(pos)) {
					return { pos };
				}
			}
			return std::nullopt;
		}

		std::size_t popcount() const {
			std::size_t total = 0;
			for (const auto b : buckets_) {
				total += static_cast<std::size_t>(std::popcount(std::to_integer<unsigned char>(b)));
			}
			return total;
		}

	private:

		static constexpr core::byte mask(std::size_t bit_pos) noexcept {
			return core::byte{ static_cast<unsigned char>(1u << (bit_pos % data_bits)) };
		}

		span_type buckets_ = {};
	};

} // namespace podcodec::core
