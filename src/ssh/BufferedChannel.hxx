// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Channel.hxx"
#include "memory/BufferQueue.hxx"

namespace SSH {

/**
 * A subclass of #Channel which buffers unconsumed #CHANNEL_DATA
 * payloads and refills the peer's send window as data gets
 * consumed.
 */
class BufferedChannel : public Channel {
	BufferQueue queue;

	/**
	 * The number of bytes in #queue.
	 */
	std::size_t buffered = 0;

	/**
	 * CHANNEL_EOF was received, but there is still data in
	 * #queue.
	 */
	bool eof_pending = false;

	/**
	 * CHANNEL_EOF was received.
	 */
	bool eof_received = false;

public:
	BufferedChannel(CConnection &_connection, ChannelInit init) noexcept;

	/* virtual methods from class Channel */
	void OnData(std::span<const std::byte> payload) final;
	void OnEof() final;

protected:
	bool IsInputBufferEmpty() const noexcept {
		return queue.empty();
	}

	/**
	 * Resume submitting buffered data to OnBufferedData() after
	 * it had returned less than the given payload size.
	 *
	 * Throws on error.
	 */
	void ReadBuffer();

	/**
	 * @return the number of bytes consumed; if this is less than
	 * the given payload size, then the transmission is paused and
	 * method is expected to call ReadBuffer() eventually to
	 * resume the transmission
	 */
	[[nodiscard]]
	virtual std::size_t OnBufferedData(std::span<const std::byte> payload) = 0;

	/**
	 * All data has been consumed and the peer has sent
	 * CHANNEL_EOF.
	 */
	virtual void OnBufferedEof() = 0;

private:
	void MaybeSendWindowAdjust();
};

} // namespace SSH
