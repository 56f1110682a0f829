// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Input.hxx"
#include "IHandler.hxx"
#include "Protocol.hxx"
#include "Sizes.hxx"
#include "cipher/Cipher.hxx"
#include "net/SocketProtocolError.hxx"
#include "util/SpanCast.hxx"

#include <cassert>

namespace SSH {

Input::Input(InputHandler &_handler) noexcept
	:handler(_handler) {}

Input::~Input() noexcept
{
	raw_buffer.FreeIfDefined();
}

void
Input::SetCipher(std::unique_ptr<Cipher> _cipher) noexcept
{
	assert(packet_length == 0);
	assert(waiting_for_new_cipher);
	assert(_cipher);

	waiting_for_new_cipher = false;
	cipher = std::move(_cipher);

	if (auto_reset_seq)
		reset_seq_pending = true;
}

bool
Input::Feed(DefaultFifoBuffer &src) noexcept
{
	raw_buffer.MoveFromAllowBothNull(src);

	return handler.OnInputReady();
}

inline void
Input::ParseHeader(const PacketHeader &header)
{
	packet_length = header.length;

	if (packet_length == 0)
		/* packets cannot be empty, there must be at least
		   the "padding_length" byte (plus mandatory
		   padding) */
		throw SocketProtocolError{"Empty packet"};

	if (packet_length > MAX_PACKET_SIZE)
		throw SocketProtocolError{"Packet too large"};
}

/**
 * Strip the padding_length byte and the random padding from a
 * packet (RFC 4253 section 6).
 *
 * Throws on error.
 */
static std::span<const std::byte>
StripPadding(std::span<const std::byte> packet)
{
	assert(!packet.empty());

	const std::size_t padding_length = static_cast<uint8_t>(packet.front());

	/* the payload must not be empty; at least the message
	   number is needed */
	if (padding_length + 1 >= packet.size())
		throw SocketProtocolError{"Bad padding length"};

	return packet.subspan(1, packet.size() - padding_length - 1);
}

inline std::span<const std::byte>
Input::ReadUnencryptedPacket()
{
	auto r = raw_buffer.Read();

	if (packet_length == 0) {
		if (r.size() < sizeof(PacketHeader))
			return {};

		ParseHeader(*reinterpret_cast<const PacketHeader *>(r.data()));
		raw_buffer.Consume(sizeof(PacketHeader));
		r = r.subspan(sizeof(PacketHeader));
	}

	if (r.size() < packet_length)
		return {};

	const auto packet = r.first(packet_length);

	/* Consume() does not invalidate the data; it remains
	   readable until the next Feed() call */
	raw_buffer.Consume(packet_length);
	packet_length = 0;

	return StripPadding(packet);
}

inline std::span<const std::byte>
Input::ReadDecryptedPacket()
{
	const auto r = raw_buffer.Read();

	if (packet_length == 0) {
		if (r.size() < sizeof(PacketHeader))
			return {};

		/* only decrypt the header for now; it stays in the
		   buffer because some ciphers authenticate it
		   together with the payload */
		PacketHeader header;
		cipher->DecryptHeader(seq, r.first<sizeof(header)>(),
				      ReferenceAsWritableBytes(header));
		ParseHeader(header);
	}

	const std::size_t encrypted_size =
		cipher->GetEncryptedSize(sizeof(PacketHeader) + packet_length);
	if (r.size() < encrypted_size)
		return {};

	decrypted = AllocatedArray<std::byte>{packet_length};
	if (cipher->DecryptPayload(seq, r.first(encrypted_size), decrypted) != packet_length)
		throw SocketProtocolError{"Decryption failed"};

	raw_buffer.Consume(encrypted_size);
	packet_length = 0;

	return StripPadding(decrypted);
}

std::span<const std::byte>
Input::ReadPacket()
{
	if (waiting_for_new_cipher)
		return {};

	const auto payload = IsEncrypted()
		? ReadDecryptedPacket()
		: ReadUnencryptedPacket();

	if (payload.data() == nullptr)
		raw_buffer.FreeIfEmpty();
	else if (static_cast<MessageNumber>(payload.front()) == MessageNumber::NEWKEYS)
		waiting_for_new_cipher = true;

	return payload;
}

void
Input::ConsumePacket() noexcept
{
	if (reset_seq_pending) {
		reset_seq_pending = false;
		seq = 0;
	} else
		++seq;
}

} // namespace SSH
