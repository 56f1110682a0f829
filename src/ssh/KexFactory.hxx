// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <memory>
#include <string_view>

namespace SSH {

class Kex;

/**
 * The KEX algorithms announced in our KEXINIT, including the
 * pseudo-algorithms for extension negotiation (RFC 8308) and strict
 * key exchange.
 */
static constexpr std::string_view all_server_kex_algorithms =
	"curve25519-sha256,curve25519-sha256@libssh.org"
	",ext-info-s,kex-strict-s-v00@openssh.com";

/**
 * Choose the first algorithm in the client's list which we support.
 *
 * Returns nullptr if #algorithms contains no supported algorithm.
 *
 * Throws on error.
 */
std::unique_ptr<Kex>
MakeKex(std::string_view algorithms);

} // namespace SSH
