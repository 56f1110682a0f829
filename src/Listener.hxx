// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "event/net/ServerSocket.hxx"
#include "util/IntrusiveList.hxx"

#include <cstddef>

struct ListenerConfig;
class SocketDescriptor;
class SocketAddress;
class Instance;
class Connection;
class RootLogger;

/**
 * Accepts SSH connections on one configured socket and owns them.
 */
class Listener final : ServerSocket {
	Instance &instance;

	const RootLogger &logger;

	IntrusiveList<Connection> connections;

	/**
	 * Zero means unlimited.
	 */
	const std::size_t max_connections;

public:
	/**
	 * Throws if the socket cannot be created or bound.
	 */
	Listener(Instance &_instance, const ListenerConfig &_config);
	~Listener() noexcept;

	using ServerSocket::GetSocket;

	std::size_t GetConnectionCount() const noexcept {
		return connections.size();
	}

private:
	bool IsFull() const noexcept {
		return max_connections > 0 &&
			connections.size() >= max_connections;
	}

	/**
	 * Reject a connection because the limit has been reached.
	 */
	void Reject(SocketDescriptor fd, SocketAddress peer_address) noexcept;

	/* virtual methods from class ServerSocket */
	void OnAccept(UniqueSocketDescriptor fd,
		      SocketAddress address) noexcept override;
	void OnAcceptError(std::exception_ptr ep) noexcept override;
};
