// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/SpanCast.hxx"

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility> // for std::exchange()

namespace SSH {

/**
 * Thrown by #Deserializer if the packet is truncated or has excess
 * data.
 */
struct MalformedPacket {};

/**
 * Parse SSH-encoded data (RFC 4251 section 5).  All methods throw
 * #MalformedPacket if the input is too short.
 */
class Deserializer {
	std::span<const std::byte> src;

public:
	explicit constexpr Deserializer(std::span<const std::byte> _src) noexcept
		:src(_src) {}

	std::span<const std::byte> ReadN(std::size_t size) {
		if (src.size() < size)
			throw MalformedPacket{};
		auto result = src.first(size);
		src = src.subspan(size);
		return result;
	}

	bool ReadBool() {
		return ReadU8() != 0;
	}

	uint_least8_t ReadU8() {
		return static_cast<uint_least8_t>(ReadN(1).front());
	}

	uint_least32_t ReadU32() {
		uint_least32_t value = 0;
		for (const std::byte b : ReadN(4))
			value = (value << 8) | static_cast<uint_least32_t>(b);
		return value;
	}

	std::span<const std::byte> ReadLengthEncoded() {
		return ReadN(ReadU32());
	}

	std::string_view ReadString() {
		return ToStringView(ReadLengthEncoded());
	}

	/**
	 * Consume all remaining data.
	 */
	std::span<const std::byte> ReadRest() noexcept {
		return std::exchange(src, {});
	}

	bool empty() const noexcept {
		return src.empty();
	}

	void ExpectEnd() const {
		if (!src.empty())
			throw MalformedPacket{};
	}

	using Marker = std::span<const std::byte>::iterator;

	/**
	 * Generate an opaque marker for the current position.
	 */
	constexpr Marker Mark() const noexcept {
		return src.begin();
	}

	/**
	 * Returns a view on the data consumed since Mark() was
	 * called.
	 */
	constexpr std::span<const std::byte> Since(Marker old_position) const noexcept {
		assert(Mark() >= old_position);

		return {old_position, Mark()};
	}
};

} // namespace SSH
