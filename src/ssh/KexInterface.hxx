// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <span>

namespace SSH {

class Serializer;

/**
 * An abstract key exchange method (the ephemeral part of ECDH).
 */
class Kex {
public:
	virtual ~Kex() noexcept = default;

	/**
	 * Write our ephemeral public key (without length prefix).
	 */
	virtual void SerializeEphemeralPublicKey(Serializer &s) const = 0;

	/**
	 * Calculate the shared secret from the peer's ephemeral
	 * public key and write it as "mpint" (with length prefix).
	 *
	 * Throws on error.
	 */
	virtual void GenerateSharedSecret(std::span<const std::byte> peer_ephemeral_public_key,
					  Serializer &s) = 0;
};

} // namespace SSH
