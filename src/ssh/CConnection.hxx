// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Connection.hxx"

#include <array>
#include <cstdint>
#include <memory>

namespace SSH {

enum class ChannelOpenFailureReasonCode : uint32_t;
struct ChannelInit;
class Channel;

/**
 * The connection protocol (RFC 4254) on top of #Connection: a
 * table of channels, channel open/close and the dispatching of
 * channel packets.  Subclasses override CreateChannel().
 *
 * Global requests are not supported; they are answered with
 * REQUEST_FAILURE if the peer wants a reply.
 */
class CConnection : public Connection
{
public:
	static constexpr std::size_t MAX_CHANNELS = 64;

private:
	struct ChannelSlot {
		std::unique_ptr<Channel> channel;

		/**
		 * After we sent CHANNEL_CLOSE, the slot remains
		 * reserved until the peer's CHANNEL_CLOSE arrives.
		 * Packets for this channel are discarded meanwhile.
		 */
		bool closing = false;

		uint_least32_t peer_channel = 0;

		bool IsFree() const noexcept {
			return !channel && !closing;
		}
	};

	std::array<ChannelSlot, MAX_CHANNELS> channels{};

	const std::size_t max_channels;

public:
	CConnection(EventLoop &event_loop, UniqueSocketDescriptor fd,
		    std::size_t _max_channels);

	~CConnection() noexcept;

	/**
	 * Destroy the channel and send CHANNEL_CLOSE.  The caller
	 * must not touch the #Channel after this returns.
	 */
	void CloseChannel(Channel &channel) noexcept;

	struct ChannelOpenFailure {
		ChannelOpenFailureReasonCode reason_code;
		std::string_view description;
	};

protected:
	/**
	 * Delete all channels now.  Subclasses call this in their
	 * destructor if channels refer to them.
	 */
	void DestroyChannels() noexcept;

private:
	uint_least32_t AllocateChannelIndex();

	ChannelSlot &GetSlot(uint_least32_t local_channel);

	/**
	 * @return the channel or nullptr if it is being closed
	 */
	Channel *GetChannel(uint_least32_t local_channel);

	template<typename F>
	void ForEachChannel(F &&f) const {
		for (const auto &i : channels)
			if (i.channel)
				f(*i.channel);
	}

	void HandleGlobalRequest(std::span<const std::byte> payload);
	void HandleChannelOpen(std::span<const std::byte> payload);
	void HandleChannelWindowAdjust(std::span<const std::byte> payload);
	void HandleChannelData(std::span<const std::byte> payload);
	void HandleChannelExtendedData(std::span<const std::byte> payload);
	void HandleChannelEof(std::span<const std::byte> payload);
	void HandleChannelClose(std::span<const std::byte> payload);
	void HandleChannelRequest(std::span<const std::byte> payload);

protected:
	/**
	 * Create a channel for a CHANNEL_OPEN request.
	 *
	 * Throws #ChannelOpenFailure to refuse the request.
	 */
	virtual std::unique_ptr<Channel> CreateChannel(std::string_view channel_type,
						       ChannelInit init,
						       std::span<const std::byte> payload);

	/**
	 * A GLOBAL_REQUEST was received.  It is always refused; this
	 * method is only for logging.
	 */
	virtual void OnGlobalRequest([[maybe_unused]] std::string_view request_name) noexcept {}

	/* virtual methods from class SSH::Connection */
	void HandlePacket(MessageNumber msg,
			  std::span<const std::byte> payload) override;
	void OnWriteBlocked() noexcept override;
	void OnWriteUnblocked() noexcept override;
};

} // namespace SSH
