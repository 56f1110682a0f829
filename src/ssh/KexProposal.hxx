// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string_view>

namespace SSH {

class Serializer;

/**
 * The name-lists of a KEXINIT packet (RFC 4253 section 7.1).
 */
struct KexProposal {
	std::string_view kex_algorithms;
	std::string_view server_host_key_algorithms;
	std::string_view encryption_algorithms_client_to_server;
	std::string_view encryption_algorithms_server_to_client;
	std::string_view mac_algorithms_client_to_server;
	std::string_view mac_algorithms_server_to_client;
	std::string_view compression_algorithms_client_to_server;
	std::string_view compression_algorithms_server_to_client;
	std::string_view languages_client_to_server;
	std::string_view languages_server_to_client;
};

void
SerializeProposal(Serializer &s, const KexProposal &proposal);

/**
 * Does the comma-separated name-list contain the given name?
 */
[[gnu::pure]]
bool
NameListContains(std::string_view list, std::string_view name) noexcept;

/**
 * Negotiate an algorithm: return the first name in the client's list
 * which is also in the server's list, or an empty string if there is
 * none (RFC 4253 section 7.1).
 */
[[gnu::pure]]
std::string_view
NegotiateAlgorithm(std::string_view client, std::string_view server) noexcept;

} // namespace SSH
