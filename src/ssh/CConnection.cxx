// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "CConnection.hxx"
#include "Channel.hxx"
#include "Sizes.hxx"
#include "MakePacket.hxx"
#include "ParsePacket.hxx"
#include "net/UniqueSocketDescriptor.hxx"

#include <algorithm>
#include <cassert>

using std::string_view_literals::operator""sv;

namespace SSH {

CConnection::CConnection(EventLoop &event_loop, UniqueSocketDescriptor fd,
			 std::size_t _max_channels)
	:Connection(event_loop, std::move(fd)),
	 max_channels(std::clamp<std::size_t>(_max_channels, 1, MAX_CHANNELS)) {}

CConnection::~CConnection() noexcept
{
	DestroyChannels();
}

void
CConnection::DestroyChannels() noexcept
{
	for (auto &i : channels) {
		i.channel.reset();
		i.closing = false;
	}
}

void
CConnection::CloseChannel(Channel &channel) noexcept
{
	const uint_least32_t local_channel = channel.GetLocalChannel();
	assert(local_channel < channels.size());

	auto &slot = channels[local_channel];
	assert(slot.channel.get() == &channel);
	assert(!slot.closing);

	slot.closing = true;
	slot.channel.reset();

	try {
		SendPacket(MakeChannelClose(slot.peer_channel));
	} catch (...) {
		CloseError(std::current_exception());
	}
}

inline uint_least32_t
CConnection::AllocateChannelIndex()
{
	for (uint_least32_t i = 0; i < max_channels; ++i)
		if (channels[i].IsFree())
			return i;

	throw ChannelOpenFailure{
		ChannelOpenFailureReasonCode::RESOURCE_SHORTAGE,
		"Too many channels"sv,
	};
}

CConnection::ChannelSlot &
CConnection::GetSlot(uint_least32_t local_channel)
{
	if (local_channel >= channels.size() ||
	    channels[local_channel].IsFree())
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Bad channel"sv,
		};

	return channels[local_channel];
}

inline Channel *
CConnection::GetChannel(uint_least32_t local_channel)
{
	return GetSlot(local_channel).channel.get();
}

/**
 * Throws #Disconnect if the peer sends more than the channel
 * window allows.
 */
static void
CheckReceiveWindow(const Channel &channel, std::span<const std::byte> data)
{
	if (data.size() > channel.GetReceiveWindow())
		throw Connection::Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Receive window exceeded"sv,
		};
}

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wsuggest-attribute=noreturn"
#endif

std::unique_ptr<Channel>
CConnection::CreateChannel([[maybe_unused]] std::string_view channel_type,
			   [[maybe_unused]] ChannelInit init,
			   [[maybe_unused]] std::span<const std::byte> payload)
{
	throw ChannelOpenFailure{
		ChannelOpenFailureReasonCode::UNKNOWN_CHANNEL_TYPE,
		"Unknown channel type"sv,
	};
}

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

inline void
CConnection::HandleGlobalRequest(std::span<const std::byte> payload)
{
	const auto p = ParseGlobalRequest(payload);
	OnGlobalRequest(p.request_name);

	if (p.want_reply)
		SendPacket(MakeRequestFailure());
}

inline void
CConnection::HandleChannelOpen(std::span<const std::byte> payload)
{
	const auto p = ParseChannelOpen(payload);

	std::unique_ptr<Channel> channel;
	uint_least32_t local_channel = 0;

	try {
		local_channel = AllocateChannelIndex();

		channel = CreateChannel(p.channel_type, ChannelInit{
				.local_channel = local_channel,
				.peer_channel = p.peer_channel,
				.send_window = p.initial_window_size,
				.max_packet_size = std::min<std::size_t>(p.maximum_packet_size,
									 CHANNEL_MAX_PACKET_SIZE),
			}, p.channel_type_specific_data);
	} catch (const ChannelOpenFailure &failure) {
		SendPacket(MakeChannelOpenFailure(p.peer_channel,
						  failure.reason_code,
						  failure.description));
		return;
	}

	assert(channel);
	assert(channel->GetLocalChannel() == local_channel);

	SendPacket(MakeChannelOpenConfirmation(p.peer_channel,
					       local_channel,
					       channel->GetReceiveWindow(),
					       CHANNEL_MAX_PACKET_SIZE));

	auto &slot = channels[local_channel];
	slot.channel = std::move(channel);
	slot.peer_channel = p.peer_channel;
}

inline void
CConnection::HandleChannelWindowAdjust(std::span<const std::byte> payload)
{
	const auto p = ParseChannelWindowAdjust(payload);

	auto *channel = GetChannel(p.local_channel);
	if (channel == nullptr)
		return;

	/* RFC 4254 section 5.2: the window must not exceed
	   2^32-1 bytes */
	if (p.nbytes == 0 ||
	    p.nbytes > UINT32_MAX - channel->GetSendWindow())
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Bad window adjustment"sv,
		};

	channel->OnWindowAdjust(p.nbytes);
}

inline void
CConnection::HandleChannelData(std::span<const std::byte> payload)
{
	const auto p = ParseChannelData(payload);

	if (auto *channel = GetChannel(p.local_channel)) {
		CheckReceiveWindow(*channel, p.data);
		channel->OnData(p.data);
	}
}

inline void
CConnection::HandleChannelExtendedData(std::span<const std::byte> payload)
{
	const auto p = ParseChannelExtendedData(payload);

	if (auto *channel = GetChannel(p.local_channel)) {
		CheckReceiveWindow(*channel, p.data);
		channel->OnExtendedData(p.data_type, p.data);
	}
}

inline void
CConnection::HandleChannelEof(std::span<const std::byte> payload)
{
	const auto p = ParseChannelEof(payload);

	if (auto *channel = GetChannel(p.local_channel))
		channel->OnEof();
}

inline void
CConnection::HandleChannelClose(std::span<const std::byte> payload)
{
	const auto p = ParseChannelClose(payload);

	auto &slot = GetSlot(p.local_channel);
	const bool reply = !slot.closing;

	/* move it out of the table before destroying it, so the
	   slot is consistent while the destructor runs */
	auto channel = std::move(slot.channel);
	slot.closing = false;
	channel.reset();

	if (reply)
		SendPacket(MakeChannelClose(slot.peer_channel));
}

inline void
CConnection::HandleChannelRequest(std::span<const std::byte> payload)
{
	const auto p = ParseChannelRequest(payload);

	/* late requests for a channel we are closing are
	   discarded */
	if (auto *channel = GetChannel(p.local_channel))
		channel->HandleRequest(p.request_type, p.type_specific_data,
				       p.want_reply);
}

void
CConnection::HandlePacket(MessageNumber msg,
			  std::span<const std::byte> payload)
{
	if (!IsEncrypted() || !IsAuthenticated())
		return Connection::HandlePacket(msg, payload);

	switch (msg) {
	case MessageNumber::GLOBAL_REQUEST:
		HandleGlobalRequest(payload);
		break;

	case MessageNumber::CHANNEL_OPEN:
		HandleChannelOpen(payload);
		break;

	case MessageNumber::CHANNEL_WINDOW_ADJUST:
		HandleChannelWindowAdjust(payload);
		break;

	case MessageNumber::CHANNEL_DATA:
		HandleChannelData(payload);
		break;

	case MessageNumber::CHANNEL_EXTENDED_DATA:
		HandleChannelExtendedData(payload);
		break;

	case MessageNumber::CHANNEL_EOF:
		HandleChannelEof(payload);
		break;

	case MessageNumber::CHANNEL_CLOSE:
		HandleChannelClose(payload);
		break;

	case MessageNumber::CHANNEL_REQUEST:
		HandleChannelRequest(payload);
		break;

	default:
		Connection::HandlePacket(msg, payload);
	}
}

void
CConnection::OnWriteBlocked() noexcept
{
	Connection::OnWriteBlocked();
	ForEachChannel([](Channel &c){ c.OnWriteBlocked(); });
}

void
CConnection::OnWriteUnblocked() noexcept
{
	Connection::OnWriteUnblocked();
	ForEachChannel([](Channel &c){ c.OnWriteUnblocked(); });
}

} // namespace SSH
