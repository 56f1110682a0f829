// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "io/Iovec.hxx"
#include "util/AllocatedArray.hxx"

#include <algorithm> // for std::min()
#include <cassert>
#include <deque>
#include <span>

/**
 * Encoded SSH packets waiting for the socket to become writable.
 * The packets are sent with one sendmsg() call each time; a packet
 * may be sent partially.
 */
class SendQueue {
	std::deque<AllocatedArray<std::byte>> packets;

	/**
	 * The number of bytes of the first packet which have already
	 * been sent.
	 */
	std::size_t head_offset = 0;

	/**
	 * The number of bytes not yet sent, across all packets.
	 */
	std::size_t total = 0;

public:
	bool empty() const noexcept {
		return packets.empty();
	}

	std::size_t GetSize() const noexcept {
		return total;
	}

	void Push(AllocatedArray<std::byte> &&src) noexcept {
		assert(!src.empty());

		total += src.size();
		packets.emplace_back(std::move(src));
	}

	void Push(std::span<const std::byte> src) {
		Push(AllocatedArray<std::byte>{src});
	}

	/**
	 * Fill #v with pointers to the pending data.
	 *
	 * @return the number of #iovec elements used
	 */
	std::size_t Prepare(std::span<struct iovec> v) noexcept {
		assert(!v.empty());

		const std::size_t n = std::min(v.size(), packets.size());
		for (std::size_t i = 0; i < n; ++i) {
			std::span<const std::byte> packet = packets[i];
			if (i == 0)
				packet = packet.subspan(head_offset);

			v[i] = MakeIovec(packet);
		}

		return n;
	}

	/**
	 * Mark #nbytes as sent, releasing all packets which are
	 * complete.
	 */
	void Consume(std::size_t nbytes) noexcept {
		assert(nbytes <= total);
		total -= nbytes;

		nbytes += head_offset;
		head_offset = 0;

		while (nbytes > 0) {
			assert(!packets.empty());

			const std::size_t size = packets.front().size();
			if (nbytes < size) {
				head_offset = nbytes;
				break;
			}

			nbytes -= size;
			packets.pop_front();
		}
	}
};
