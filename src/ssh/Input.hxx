// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "DefaultFifoBuffer.hxx"
#include "util/AllocatedArray.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace SSH {

struct PacketHeader;
class Cipher;
class InputHandler;

/**
 * Manage input received on a SSH socket and provides access to
 * individual (decrypted) packets.
 */
class Input final {
	InputHandler &handler;

	/**
	 * The sequence number of the packet returned by
	 * ReadPacket().
	 */
	uint_least32_t seq = 0;

	/**
	 * If non-zero, then we're currently waiting for the payload
	 * of a packet to be received; the header has already been
	 * consumed (and decrypted).
	 */
	std::size_t packet_length = 0;

	std::unique_ptr<Cipher> cipher;

	/**
	 * Raw input from the socket.  It may need to be decrypted.
	 */
	DefaultFifoBuffer raw_buffer;

	/**
	 * The decrypted packet returned by ReadPacket() (only used
	 * if there is a cipher).
	 */
	AllocatedArray<std::byte> decrypted;

	/**
	 * Reset the sequence number to zero after the next
	 * ConsumePacket() (for strict key exchange).
	 */
	bool reset_seq_pending = false;

	bool auto_reset_seq = false;

	/**
	 * True after seeing a #NEWKEYS packet.  It means no more
	 * packets can be read until SetCipher() gets called.
	 */
	bool waiting_for_new_cipher = false;

public:
	explicit Input(InputHandler &_handler) noexcept;
	~Input() noexcept;

	Input(const Input &) = delete;
	Input &operator=(const Input &) = delete;

	bool IsEncrypted() const noexcept {
		return cipher != nullptr;
	}

	/**
	 * Install a new cipher.  Must be called while handling the
	 * #NEWKEYS packet.
	 */
	void SetCipher(std::unique_ptr<Cipher> _cipher) noexcept;

	/**
	 * Reset the sequence number after each #NEWKEYS (strict key
	 * exchange).
	 */
	void AutoResetSeq() noexcept {
		auto_reset_seq = true;
	}

	/**
	 * Returns the sequence number of the packet most recently
	 * returned by ReadPacket().
	 */
	uint_least32_t GetSeq() const noexcept {
		return seq;
	}

	/**
	 * Feed data received on the socket into the packetizer and
	 * invoke InputHandler::OnInputReady().
	 *
	 * @return false if the #Input was destroyed
	 */
	bool Feed(DefaultFifoBuffer &src) noexcept;

	/**
	 * Read (and decrypt) the next packet from the buffer.
	 * Returns nullptr if there is not enough data.  The returned
	 * span contains the payload (starting with the message
	 * number).
	 *
	 * Call ConsumePacket() after processing is finished.
	 *
	 * Throws on error.
	 */
	[[nodiscard]]
	std::span<const std::byte> ReadPacket();

	/**
	 * Mark the packet returned by ReadPacket() as "consumed".
	 */
	void ConsumePacket() noexcept;

private:
	/**
	 * Throws on error.
	 */
	void ParseHeader(const PacketHeader &header);

	[[nodiscard]]
	std::span<const std::byte> ReadUnencryptedPacket();

	[[nodiscard]]
	std::span<const std::byte> ReadDecryptedPacket();
};

} // namespace SSH
