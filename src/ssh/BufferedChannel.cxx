// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "BufferedChannel.hxx"
#include "Connection.hxx"
#include "Sizes.hxx"

#include <cassert>

using std::string_view_literals::operator""sv;

namespace SSH {

BufferedChannel::BufferedChannel(CConnection &_connection,
				 ChannelInit init) noexcept
	:Channel(_connection, init, CHANNEL_WINDOW_SIZE) {}

inline void
BufferedChannel::MaybeSendWindowAdjust()
{
	const std::size_t outstanding = GetReceiveWindow() + buffered;
	assert(outstanding <= CHANNEL_WINDOW_SIZE);

	/* refill only after half of the window was consumed to
	   avoid flooding the peer with tiny adjustments */
	const std::size_t consumed = CHANNEL_WINDOW_SIZE - outstanding;
	if (consumed >= CHANNEL_WINDOW_SIZE / 2)
		SendWindowAdjust(consumed);
}

void
BufferedChannel::OnData(std::span<const std::byte> payload)
{
	if (eof_received)
		throw Connection::Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Data after EOF"sv,
		};

	ConsumeReceiveWindow(payload.size());

	if (!queue.empty()) {
		queue.Push(payload);
		buffered += payload.size();
		return;
	}

	const auto nbytes = OnBufferedData(payload);
	if (nbytes < payload.size()) {
		queue.Push(payload.subspan(nbytes));
		buffered += payload.size() - nbytes;
	}

	MaybeSendWindowAdjust();
}

void
BufferedChannel::OnEof()
{
	if (eof_received)
		return;

	eof_received = true;

	if (queue.empty())
		OnBufferedEof();
	else
		eof_pending = true;
}

void
BufferedChannel::ReadBuffer()
{
	while (!queue.empty()) {
		const auto payload = queue.Read();
		const auto nbytes = OnBufferedData(payload);
		queue.Consume(nbytes);
		buffered -= nbytes;

		if (nbytes < payload.size()) {
			MaybeSendWindowAdjust();
			return;
		}
	}

	MaybeSendWindowAdjust();

	if (eof_pending) {
		eof_pending = false;
		OnBufferedEof();
	}
}

} // namespace SSH
