// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "KexProposal.hxx"
#include "Serializer.hxx"
#include "util/IterableSplitString.hxx"

namespace SSH {

/**
 * The name-lists in wire order.
 */
static constexpr std::string_view KexProposal::*proposal_fields[] = {
	&KexProposal::kex_algorithms,
	&KexProposal::server_host_key_algorithms,
	&KexProposal::encryption_algorithms_client_to_server,
	&KexProposal::encryption_algorithms_server_to_client,
	&KexProposal::mac_algorithms_client_to_server,
	&KexProposal::mac_algorithms_server_to_client,
	&KexProposal::compression_algorithms_client_to_server,
	&KexProposal::compression_algorithms_server_to_client,
	&KexProposal::languages_client_to_server,
	&KexProposal::languages_server_to_client,
};

void
SerializeProposal(Serializer &s, const KexProposal &proposal)
{
	for (const auto field : proposal_fields)
		s.WriteString(proposal.*field);
}

bool
NameListContains(std::string_view list, std::string_view name) noexcept
{
	for (const std::string_view i : IterableSplitString(list, ','))
		if (i == name)
			return true;

	return false;
}

std::string_view
NegotiateAlgorithm(std::string_view client, std::string_view server) noexcept
{
	for (const std::string_view i : IterableSplitString(client, ','))
		if (!i.empty() && NameListContains(server, i))
			return i;

	return {};
}

} // namespace SSH
