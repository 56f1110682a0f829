// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "PacketSerializer.hxx"

#include <span>
#include <string_view>

namespace SSH {

using std::string_view_literals::operator""sv;

inline void
WriteField(Serializer &s, uint_least32_t value)
{
	s.WriteU32(value);
}

inline void
WriteField(Serializer &s, bool value)
{
	s.WriteBool(value);
}

inline void
WriteField(Serializer &s, std::string_view value)
{
	s.WriteString(value);
}

inline void
WriteField(Serializer &s, std::span<const std::byte> value)
{
	s.WriteLengthEncoded(value);
}

/**
 * Create a packet and write the given fields, each encoded
 * according to its C++ type: uint32, boolean, string or a string
 * of bytes.
 */
template<typename... Fields>
inline PacketSerializer
MakePacket(MessageNumber msg, Fields... fields)
{
	PacketSerializer s{msg};
	(WriteField(s, fields), ...);
	return s;
}

/* the language tags in DISCONNECT and CHANNEL_OPEN_FAILURE are
   left empty (RFC 4253 section 11.1) */

inline PacketSerializer
MakeDisconnect(DisconnectReasonCode reason_code, std::string_view msg)
{
	return MakePacket(MessageNumber::DISCONNECT,
			  static_cast<uint_least32_t>(reason_code),
			  msg, ""sv);
}

inline PacketSerializer
MakeUnimplemented(uint_least32_t seq)
{
	return MakePacket(MessageNumber::UNIMPLEMENTED, seq);
}

inline PacketSerializer
MakeServiceAccept(std::string_view service_name)
{
	return MakePacket(MessageNumber::SERVICE_ACCEPT, service_name);
}

inline PacketSerializer
MakeUserauthFailure(std::string_view methods, bool partial_success)
{
	return MakePacket(MessageNumber::USERAUTH_FAILURE,
			  methods, partial_success);
}

inline PacketSerializer
MakeUserauthPkOk(std::string_view public_key_algorithm,
		 std::span<const std::byte> public_key_blob)
{
	return MakePacket(MessageNumber::USERAUTH_PK_OK,
			  public_key_algorithm, public_key_blob);
}

inline PacketSerializer
MakeRequestFailure()
{
	return MakePacket(MessageNumber::REQUEST_FAILURE);
}

inline PacketSerializer
MakeChannelOpenConfirmation(uint_least32_t recipient_channel,
			    uint_least32_t sender_channel,
			    uint_least32_t initial_window_size,
			    uint_least32_t max_packet_size)
{
	return MakePacket(MessageNumber::CHANNEL_OPEN_CONFIRMATION,
			  recipient_channel, sender_channel,
			  initial_window_size, max_packet_size);
}

inline PacketSerializer
MakeChannelOpenFailure(uint_least32_t recipient_channel,
		       ChannelOpenFailureReasonCode reason_code,
		       std::string_view description)
{
	return MakePacket(MessageNumber::CHANNEL_OPEN_FAILURE,
			  recipient_channel,
			  static_cast<uint_least32_t>(reason_code),
			  description, ""sv);
}

inline PacketSerializer
MakeChannelWindowAdjust(uint_least32_t recipient_channel,
			uint_least32_t nbytes)
{
	return MakePacket(MessageNumber::CHANNEL_WINDOW_ADJUST,
			  recipient_channel, nbytes);
}

/**
 * Create a CHANNEL_SUCCESS or CHANNEL_FAILURE packet.
 */
inline PacketSerializer
MakeChannelRequestReply(uint_least32_t recipient_channel, bool success)
{
	return MakePacket(success
			  ? MessageNumber::CHANNEL_SUCCESS
			  : MessageNumber::CHANNEL_FAILURE,
			  recipient_channel);
}

inline PacketSerializer
MakeChannelEof(uint_least32_t recipient_channel)
{
	return MakePacket(MessageNumber::CHANNEL_EOF, recipient_channel);
}

inline PacketSerializer
MakeChannelClose(uint_least32_t recipient_channel)
{
	return MakePacket(MessageNumber::CHANNEL_CLOSE, recipient_channel);
}

/**
 * Create a CHANNEL_REQUEST packet.  The caller appends the
 * type-specific data.
 */
inline PacketSerializer
MakeChannelRequest(uint_least32_t recipient_channel,
		   std::string_view request_type, bool want_reply)
{
	return MakePacket(MessageNumber::CHANNEL_REQUEST,
			  recipient_channel, request_type, want_reply);
}

} // namespace SSH
