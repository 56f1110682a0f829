// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "KexState.hxx"
#include "cipher/Cipher.hxx"
#include "cipher/Factory.hxx"

#include <sodium/utils.h>

#include <cassert>

namespace SSH {

static AllocatedArray<std::byte>
DeriveKey(const char id, std::size_t need,
	  std::span<const std::byte> hash,
	  std::span<const std::byte> shared_secret,
	  std::span<const std::byte> session_id,
	  DigestAlgorithm hash_alg)
{
	std::array<std::byte, DIGEST_MAX_SIZE * 2> digest_buffer;
	assert(need <= DIGEST_MAX_SIZE);

	/* K1 = HASH(K || H || X || session_id) */
	std::size_t position = Digest(hash_alg,
				      {shared_secret, hash, std::as_bytes(std::span{&id, 1}), session_id},
				      digest_buffer.data());

	/* K2 = HASH(K || H || K1), K3 = HASH(K || H || K1 || K2) ... */
	while (position < need)
		position += Digest(hash_alg,
				   {shared_secret, hash, std::span{digest_buffer}.first(position)},
				   digest_buffer.data() + position);

	AllocatedArray<std::byte> result{std::span{digest_buffer}.first(need)};
	sodium_memzero(digest_buffer.data(), digest_buffer.size());
	return result;
}

void
KexState::DeriveKeys(std::span<const std::byte> hash,
		     std::span<const std::byte> shared_secret)
{
	/* RFC 4253 section 9: "Re-exchange is processed identically
	   to the initial key exchange, except for the session
	   identifier that will remain unchanged" */
	if (session_id.empty())
		session_id = hash;

	std::array<AllocatedArray<std::byte>, 6> keys;

	char id = 'A';
	for (auto &i : keys)
		i = DeriveKey(id++, we_need, hash, shared_secret, session_id, hash_alg);

	/* A/C/E are client-to-server (our INCOMING direction),
	   B/D/F are server-to-client */
	auto &incoming = new_keys[static_cast<std::size_t>(Direction::INCOMING)];
	incoming.enc_iv = std::move(keys[0]);
	incoming.enc_key = std::move(keys[2]);
	incoming.mac_key = std::move(keys[4]);

	auto &outgoing = new_keys[static_cast<std::size_t>(Direction::OUTGOING)];
	outgoing.enc_iv = std::move(keys[1]);
	outgoing.enc_key = std::move(keys[3]);
	outgoing.mac_key = std::move(keys[5]);
}

std::unique_ptr<Cipher>
KexState::MakeCipher(std::string_view encryption_algorithm,
		     std::string_view mac_algorithm,
		     Direction direction)
{
	const auto &k = new_keys[static_cast<std::size_t>(direction)];

	return SSH::MakeCipher(encryption_algorithm, mac_algorithm,
			       k.enc_key, k.enc_iv, k.mac_key,
			       direction == Direction::OUTGOING);
}

} // namespace SSH
