// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "EarlyDisconnect.hxx"
#include "IdentificationString.hxx"
#include "MakePacket.hxx"
#include "net/SocketDescriptor.hxx"
#include "net/SocketError.hxx"
#include "io/Iovec.hxx"
#include "util/SpanCast.hxx"

#include <array>

namespace SSH {

void
SendEarlyDisconnect(SocketDescriptor socket,
		    DisconnectReasonCode reason_code, std::string_view msg)
{
	/* without a key exchange, the packet is unencrypted and
	   padded to 8 bytes */
	auto packet = MakeDisconnect(reason_code, msg);
	const std::array iov{
		MakeIovec(AsBytes(IDENTIFICATION_STRING)),
		MakeIovec(packet.Finish(8, false)),
	};

	if (socket.Send(iov) < 0)
		throw MakeSocketError("Failed to send DISCONNECT");

	/* a FIN after the packet, not a RST */
	socket.Shutdown();
}

} // namespace SSH
