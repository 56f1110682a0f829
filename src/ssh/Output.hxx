// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Queue.hxx"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

class BufferedSocket;

namespace SSH {

class Cipher;

/**
 * Manage output to be sent on a SSH socket: encrypt packets and
 * queue them until the socket is writable.
 */
class Output final {
	BufferedSocket &socket;

	/**
	 * The sequence number of the next packet.
	 */
	uint_least32_t seq = 0;

	std::unique_ptr<Cipher> cipher;

	/**
	 * Data to be sent as-is on the socket.
	 */
	SendQueue pending_queue;

	bool auto_reset_seq = false;

public:
	explicit Output(BufferedSocket &_socket) noexcept;
	~Output() noexcept;

	Output(const Output &) = delete;
	Output &operator=(const Output &) = delete;

	bool IsEncrypted() const noexcept {
		return cipher != nullptr;
	}

	const Cipher *GetCipher() const noexcept {
		return cipher.get();
	}

	/**
	 * Install a new cipher.  Must be called right after pushing
	 * the #NEWKEYS packet; all subsequent packets will be
	 * encrypted with it.
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
	 * Is there data waiting to be sent?
	 */
	bool HasPending() const noexcept {
		return !pending_queue.empty();
	}

	/**
	 * Encrypt a packet (header, padding_length, payload, padding)
	 * and queue it for sending.
	 *
	 * Throws on error.
	 */
	void Push(std::span<const std::byte> src);

	enum class FlushResult {
		DONE,
		MORE,
		DESTROYED,
	};

	/**
	 * Throws on error.
	 */
	FlushResult Flush();
};

} // namespace SSH
