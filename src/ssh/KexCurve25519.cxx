// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "KexCurve25519.hxx"
#include "Serializer.hxx"
#include "system/Urandom.hxx"
#include "util/ScopeExit.hxx"

#include <sodium/crypto_scalarmult_curve25519.h>
#include <sodium/utils.h>

#include <stdexcept>

namespace SSH {

Curve25519Kex::Curve25519Kex()
{
	static_assert(sizeof(secret_key) == crypto_scalarmult_curve25519_SCALARBYTES);
	static_assert(sizeof(public_key) == crypto_scalarmult_curve25519_BYTES);

	UrandomFill(secret_key);

	if (crypto_scalarmult_curve25519_base(reinterpret_cast<unsigned char *>(public_key.data()),
					      reinterpret_cast<const unsigned char *>(secret_key.data())) != 0)
		throw std::runtime_error{"crypto_scalarmult_curve25519_base() failed"};
}

Curve25519Kex::~Curve25519Kex() noexcept
{
	sodium_memzero(&secret_key, sizeof(secret_key));
}

void
Curve25519Kex::SerializeEphemeralPublicKey(Serializer &s) const
{
	s.WriteN(public_key);
}

void
Curve25519Kex::GenerateSharedSecret(std::span<const std::byte> peer_ephemeral_public_key,
				    Serializer &s)
{
	if (peer_ephemeral_public_key.size() != crypto_scalarmult_curve25519_BYTES)
		throw std::invalid_argument{"Wrong ephemeral public key size"};

	std::byte shared_key[crypto_scalarmult_curve25519_BYTES]{};
	AtScopeExit(&shared_key) { sodium_memzero(shared_key, sizeof(shared_key)); };

	if (crypto_scalarmult_curve25519(reinterpret_cast<unsigned char *>(shared_key),
					 reinterpret_cast<const unsigned char *>(secret_key.data()),
					 reinterpret_cast<const unsigned char *>(peer_ephemeral_public_key.data())) != 0)
		throw std::invalid_argument{"crypto_scalarmult_curve25519() failed"};

	/* reject the all-zero shared secret (RFC 8731 section 3) */
	if (sodium_is_zero(reinterpret_cast<const unsigned char *>(shared_key),
			   sizeof(shared_key)))
		throw std::invalid_argument{"Invalid EC value"};

	const auto length = s.PrepareLength();
	s.WriteBignum2(shared_key);
	s.CommitLength(length);
}

} // namespace SSH
