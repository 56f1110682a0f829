// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Sizes.hxx"
#include "util/PackedBigEndian.hxx"
#include "util/SpanCast.hxx"

#include <algorithm> // for std::copy()
#include <cassert>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <utility> // for std::exchange()

struct SliceArea;

namespace SSH {

/**
 * Thrown by #Serializer when the packet does not fit into the
 * buffer.
 */
struct SerializerOverflow {};

/**
 * Builds a SSH packet (or some other SSH-encoded structure) in a
 * buffer of #MAX_PACKET_SIZE bytes allocated from the global
 * #fb_pool.
 */
class Serializer {
	SliceArea *area = nullptr;

protected:
	std::span<std::byte, MAX_PACKET_SIZE> buffer;

	std::size_t position = 0;

public:
	Serializer() noexcept;
	~Serializer() noexcept;

	Serializer(Serializer &&src) noexcept
		:area(std::exchange(src.area, nullptr)),
		 buffer(src.buffer), position(src.position) {}

	Serializer &operator=(Serializer &&) = delete;

	std::size_t size() const noexcept {
		return position;
	}

	/**
	 * Obtain a writable span of #size bytes without committing
	 * it.  Call CommitWriteN() afterwards.
	 *
	 * Throws #SerializerOverflow if there is not enough room.
	 */
	std::span<std::byte> BeginWriteN(std::size_t size) {
		if (buffer.size() - position < size)
			throw SerializerOverflow{};

		return buffer.subspan(position, size);
	}

	void CommitWriteN(std::size_t size) noexcept {
		assert(position + size <= buffer.size());

		position += size;
	}

	std::span<std::byte> WriteN(std::size_t size) {
		auto result = BeginWriteN(size);
		CommitWriteN(size);
		return result;
	}

	template<std::size_t size>
	std::span<std::byte, size> WriteN() {
		return WriteN(size).first<size>();
	}

	void WriteN(std::span<const std::byte> src) {
		auto dest = WriteN(src.size());
		std::copy(src.begin(), src.end(), dest.begin());
	}

	template<typename T>
	void WriteT(const T &src) {
		WriteN(ReferenceAsBytes(src));
	}

	void WriteU8(uint_least8_t value) {
		WriteN(1).front() = static_cast<std::byte>(value);
	}

	void WriteBool(bool value) {
		WriteU8(value);
	}

	void WriteU32(uint_least32_t value) {
		WriteT(PackedBE32{value});
	}

	void WriteU64(uint_least64_t value) {
		WriteT(PackedBE64{value});
	}

	void WriteLengthEncoded(std::span<const std::byte> src) {
		WriteU32(src.size());
		WriteN(src);
	}

	void WriteString(std::string_view src) {
		WriteLengthEncoded(AsBytes(src));
	}

	/**
	 * Write #size random bytes (e.g. packet padding).
	 */
	void WriteRandom(std::size_t size);

	/**
	 * Convert #size bytes previously obtained with BeginWriteN()
	 * to the SSH "mpint" representation (without the length
	 * prefix) and commit them: leading zero bytes are stripped
	 * and a zero byte is inserted if the most significant bit is
	 * set.
	 */
	void CommitBignum2(std::size_t size) noexcept;

	/**
	 * Write the given unsigned big-endian number in the SSH
	 * "mpint" representation (without the length prefix).
	 */
	void WriteBignum2(std::span<const std::byte> src) {
		/* reserve one extra byte for a leading zero */
		auto dest = BeginWriteN(src.size() + 1);
		std::copy(src.begin(), src.end(), dest.begin());
		CommitBignum2(src.size());
	}

	/**
	 * Reserve space for a 32 bit length field.  Pass the return
	 * value to CommitLength() after writing the data.
	 */
	std::size_t PrepareLength() {
		const std::size_t result = position;
		WriteN(sizeof(PackedBE32));
		return result;
	}

	/**
	 * Fill the length field reserved by PrepareLength() with the
	 * number of bytes written since.
	 */
	void CommitLength(std::size_t at) noexcept {
		assert(at + sizeof(PackedBE32) <= position);

		const std::size_t length = position - at - sizeof(PackedBE32);
		*reinterpret_cast<PackedBE32 *>(buffer.data() + at) = length;
	}

	using Marker = std::size_t;

	/**
	 * Generate an opaque marker for the current position.
	 */
	Marker Mark() const noexcept {
		return position;
	}

	/**
	 * Returns a view on the data added since Mark() was called.
	 */
	std::span<const std::byte> Since(Marker old_position) const noexcept {
		assert(old_position <= position);

		return std::span{buffer}.subspan(old_position, position - old_position);
	}

	/**
	 * Discard all data written since Mark() was called.  Spans
	 * returned by Since() remain readable until the space gets
	 * overwritten.
	 */
	void Rewind(Marker old_position) noexcept {
		assert(old_position <= position);

		position = old_position;
	}

	std::span<const std::byte> Finish() const noexcept {
		return std::span{buffer}.first(position);
	}
};

} // namespace SSH
