// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Serializer.hxx"
#include "system/Urandom.hxx"
#include "memory/fb_pool.hxx"
#include "memory/SlicePool.hxx"

#include <cstring> // for std::memmove()

namespace SSH {

Serializer::Serializer() noexcept
	:buffer(static_cast<std::byte *>(nullptr), MAX_PACKET_SIZE)
{
	auto alloc = fb_pool_get().Alloc();
	area = alloc.area;
	buffer = std::span<std::byte, MAX_PACKET_SIZE>{static_cast<std::byte *>(alloc.Steal()), MAX_PACKET_SIZE};
}

Serializer::~Serializer() noexcept
{
	if (area != nullptr)
		fb_pool_get().Free(*area, buffer.data());
}

void
Serializer::WriteRandom(std::size_t size)
{
	UrandomFill(WriteN(size));
}

void
Serializer::CommitBignum2(std::size_t size) noexcept
{
	std::byte *const begin = buffer.data() + position;
	std::byte *p = begin, *const end = begin + size;

	while (p != end && *p == std::byte{})
		++p;

	const std::size_t length = std::distance(p, end);
	if (length == 0)
		/* zero is represented by an empty string */
		return;

	const bool negative = (*p & std::byte{0x80}) != std::byte{};
	std::byte *dest = begin;
	if (negative)
		*dest++ = std::byte{};

	/* the source may be shifted to the right by one byte at
	   most, which is why WriteBignum2() reserves one extra byte
	   and BeginWriteN() callers must do the same */
	std::memmove(dest, p, length);

	position += length + negative;
}

} // namespace SSH
