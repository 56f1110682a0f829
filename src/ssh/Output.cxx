// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Output.hxx"
#include "cipher/Cipher.hxx"
#include "event/net/BufferedSocket.hxx"
#include "net/SocketError.hxx"

#include <array>
#include <cassert>

namespace SSH {

Output::Output(BufferedSocket &_socket) noexcept
	:socket(_socket) {}

Output::~Output() noexcept = default;

void
Output::SetCipher(std::unique_ptr<Cipher> _cipher) noexcept
{
	assert(_cipher);

	cipher = std::move(_cipher);

	if (auto_reset_seq)
		seq = 0;
}

/**
 * Encrypt one packet into a newly allocated buffer.
 */
static AllocatedArray<std::byte>
EncryptPacket(Cipher &cipher, uint_least32_t seq,
	      std::span<const std::byte> src)
{
	AllocatedArray<std::byte> dest{cipher.GetEncryptedSize(src.size())};

	const std::size_t size = cipher.Encrypt(seq, src, {dest.data(), dest.size()});
	assert(size <= dest.size());
	dest.SetSize(size);
	return dest;
}

void
Output::Push(std::span<const std::byte> src)
{
	if (cipher)
		pending_queue.Push(EncryptPacket(*cipher, seq, src));
	else
		pending_queue.Push(src);

	/* wraps around after 2^32 packets (RFC 4253 section 6.4) */
	++seq;
}

Output::FlushResult
Output::Flush()
{
	std::array<struct iovec, 32> iov;
	const std::size_t n = pending_queue.Prepare(iov);
	if (n == 0)
		return FlushResult::DONE;

	const ssize_t nbytes = socket.WriteV(std::span{iov}.first(n));
	if (nbytes >= 0) [[likely]] {
		pending_queue.Consume(static_cast<std::size_t>(nbytes));
		return pending_queue.empty()
			? FlushResult::DONE
			: FlushResult::MORE;
	}

	const auto result = static_cast<write_result>(nbytes);
	if (result == WRITE_BLOCKING)
		return FlushResult::MORE;

	if (result == WRITE_DESTROYED)
		return FlushResult::DESTROYED;

	/* WRITE_ERRNO or WRITE_BROKEN */
	throw MakeSocketError("send failed");
}

} // namespace SSH
