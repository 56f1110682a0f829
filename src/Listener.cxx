// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Listener.hxx"
#include "Instance.hxx"
#include "Config.hxx"
#include "Connection.hxx"
#include "ssh/EarlyDisconnect.hxx"
#include "ssh/Protocol.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/SocketAddressFormatter.hxx"
#include "net/SocketAddress.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "util/DeleteDisposer.hxx"

#include <fmt/core.h>

#include <sys/socket.h>

using std::string_view_literals::operator""sv;

Listener::Listener(Instance &_instance, const ListenerConfig &config)
	:ServerSocket(_instance.GetEventLoop(), config.Create(SOCK_STREAM)),
	 instance(_instance),
	 logger(instance.GetLogger()),
	 max_connections(config.max_connections)
{
}

Listener::~Listener() noexcept
{
	connections.clear_and_dispose(DeleteDisposer{});
}

inline void
Listener::Reject(SocketDescriptor fd, SocketAddress peer_address) noexcept
try {
	SendEarlyDisconnect(fd, SSH::DisconnectReasonCode::TOO_MANY_CONNECTIONS,
			    "Too many connections"sv);
} catch (...) {
	logger.Fmt(2, "Failed to reject {}: {}",
		   peer_address, std::current_exception());
}

void
Listener::OnAccept(UniqueSocketDescriptor connection_fd,
		   SocketAddress peer_address) noexcept
{
	if (IsFull()) {
		logger.Fmt(1, "Too many connections, rejecting {}", peer_address);
		/* the socket is closed when connection_fd goes out
		   of scope */
		Reject(connection_fd, peer_address);
		return;
	}

	Connection *connection;

	try {
		connection = new Connection(instance, std::move(connection_fd),
					    peer_address);
	} catch (...) {
		logger.Fmt(1, "Failed to set up connection from {}: {}",
			   peer_address, std::current_exception());
		return;
	}

	connections.push_front(*connection);
}

void
Listener::OnAcceptError(std::exception_ptr ep) noexcept
{
	logger(1, "TCP accept error: ", ep);
}
