// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Deserializer.hxx"
#include "Sizes.hxx"

#include <cstdint>

/*
 * Parsers for the payload of SSH packets (excluding the message
 * number).  Each struct has a Read() method which consumes all of
 * its fields from a #Deserializer; the results are views on the
 * payload buffer.  All parsers throw #MalformedPacket on error.
 */

namespace SSH {

enum class DisconnectReasonCode : uint32_t;
enum class ChannelExtendedDataType : uint32_t;

/**
 * Parse a payload into #T and verify that nothing is left over.
 */
template<typename T>
inline T
ParsePayload(std::span<const std::byte> raw)
{
	T p;
	Deserializer d{raw};
	p.Read(d);
	d.ExpectEnd();
	return p;
}

struct Disconnect {
	std::string_view description;
	DisconnectReasonCode reason_code;

	void Read(Deserializer &d) {
		reason_code = static_cast<DisconnectReasonCode>(d.ReadU32());
		description = d.ReadString();
		d.ReadString(); // language tag
	}
};

struct ServiceRequest {
	std::string_view service_name;

	void Read(Deserializer &d) {
		service_name = d.ReadString();
	}
};

/**
 * RFC 4253 section 7.1.  The language lists are not interesting.
 */
struct KexInit {
	std::string_view kex_algorithms;
	std::string_view server_host_key_algorithms;
	std::string_view encryption_algorithms_client_to_server;
	std::string_view encryption_algorithms_server_to_client;
	std::string_view mac_algorithms_client_to_server;
	std::string_view mac_algorithms_server_to_client;
	std::string_view compression_algorithms_client_to_server;
	std::string_view compression_algorithms_server_to_client;
	bool first_kex_packet_follows;

	void Read(Deserializer &d) {
		d.ReadN(KEX_COOKIE_SIZE);

		for (std::string_view *i : {
				&kex_algorithms,
				&server_host_key_algorithms,
				&encryption_algorithms_client_to_server,
				&encryption_algorithms_server_to_client,
				&mac_algorithms_client_to_server,
				&mac_algorithms_server_to_client,
				&compression_algorithms_client_to_server,
				&compression_algorithms_server_to_client,
			})
			*i = d.ReadString();

		d.ReadString(); // languages_client_to_server
		d.ReadString(); // languages_server_to_client
		first_kex_packet_follows = d.ReadBool();
		d.ReadU32(); // reserved
	}
};

struct ECDHKexInit {
	std::span<const std::byte> client_ephemeral_public_key;

	void Read(Deserializer &d) {
		client_ephemeral_public_key = d.ReadLengthEncoded();
	}
};

struct ChannelOpen {
	std::string_view channel_type;
	uint_least32_t peer_channel;
	uint_least32_t initial_window_size;
	uint_least32_t maximum_packet_size;
	std::span<const std::byte> channel_type_specific_data;

	void Read(Deserializer &d) {
		channel_type = d.ReadString();
		peer_channel = d.ReadU32();
		initial_window_size = d.ReadU32();
		maximum_packet_size = d.ReadU32();
		channel_type_specific_data = d.ReadRest();
	}
};

/**
 * Base for all channel packets: they begin with the recipient
 * channel number, which is our local channel number.
 */
struct ChannelPacket {
	uint_least32_t local_channel;

	void Read(Deserializer &d) {
		local_channel = d.ReadU32();
	}
};

struct ChannelWindowAdjust : ChannelPacket {
	uint_least32_t nbytes;

	void Read(Deserializer &d) {
		ChannelPacket::Read(d);
		nbytes = d.ReadU32();
	}
};

struct ChannelData : ChannelPacket {
	std::span<const std::byte> data;

	void Read(Deserializer &d) {
		ChannelPacket::Read(d);
		data = d.ReadLengthEncoded();
	}
};

struct ChannelExtendedData : ChannelPacket {
	ChannelExtendedDataType data_type;
	std::span<const std::byte> data;

	void Read(Deserializer &d) {
		ChannelPacket::Read(d);
		data_type = static_cast<ChannelExtendedDataType>(d.ReadU32());
		data = d.ReadLengthEncoded();
	}
};

struct ChannelRequest : ChannelPacket {
	std::string_view request_type;
	std::span<const std::byte> type_specific_data;
	bool want_reply;

	void Read(Deserializer &d) {
		ChannelPacket::Read(d);
		request_type = d.ReadString();
		want_reply = d.ReadBool();
		type_specific_data = d.ReadRest();
	}
};

struct GlobalRequest {
	std::string_view request_name;
	std::span<const std::byte> request_specific_data;
	bool want_reply;

	void Read(Deserializer &d) {
		request_name = d.ReadString();
		want_reply = d.ReadBool();
		request_specific_data = d.ReadRest();
	}
};

/**
 * The type-specific data of an "env" channel request (RFC 4254
 * section 6.4).
 */
struct EnvRequest {
	std::string_view name;
	std::string_view value;

	void Read(Deserializer &d) {
		name = d.ReadString();
		value = d.ReadString();
	}
};

/**
 * The type-specific data of an "exec" channel request (RFC 4254
 * section 6.5).
 */
struct ExecRequest {
	std::string_view command;

	void Read(Deserializer &d) {
		command = d.ReadString();
	}
};

inline auto
ParseDisconnect(std::span<const std::byte> raw)
{
	return ParsePayload<Disconnect>(raw);
}

inline auto
ParseServiceRequest(std::span<const std::byte> raw)
{
	return ParsePayload<ServiceRequest>(raw);
}

inline auto
ParseKexInit(std::span<const std::byte> raw)
{
	return ParsePayload<KexInit>(raw);
}

inline auto
ParseECDHKexInit(std::span<const std::byte> raw)
{
	return ParsePayload<ECDHKexInit>(raw);
}

inline auto
ParseChannelOpen(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelOpen>(raw);
}

inline auto
ParseChannelWindowAdjust(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelWindowAdjust>(raw);
}

inline auto
ParseChannelData(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelData>(raw);
}

inline auto
ParseChannelExtendedData(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelExtendedData>(raw);
}

/* CHANNEL_EOF and CHANNEL_CLOSE carry nothing but the channel
   number */

inline auto
ParseChannelEof(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelPacket>(raw);
}

inline auto
ParseChannelClose(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelPacket>(raw);
}

inline auto
ParseChannelRequest(std::span<const std::byte> raw)
{
	return ParsePayload<ChannelRequest>(raw);
}

inline auto
ParseGlobalRequest(std::span<const std::byte> raw)
{
	return ParsePayload<GlobalRequest>(raw);
}

inline auto
ParseEnvRequest(std::span<const std::byte> raw)
{
	return ParsePayload<EnvRequest>(raw);
}

inline auto
ParseExecRequest(std::span<const std::byte> raw)
{
	return ParsePayload<ExecRequest>(raw);
}

} // namespace SSH
