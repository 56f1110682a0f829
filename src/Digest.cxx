// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Digest.hxx"
#include "lib/sodium/SHA256.hxx"
#include "lib/sodium/SHA512.hxx"

template<typename State, std::size_t size>
static void
CalcDigest(std::initializer_list<std::span<const std::byte>> src,
	   std::byte *dest) noexcept
{
	static_assert(size <= DIGEST_MAX_SIZE);

	State state;
	for (const auto i : src)
		state.Update(i);
	state.Final(std::span<std::byte, size>{dest, size});
}

std::size_t
DigestSize(DigestAlgorithm a) noexcept
{
	switch (a) {
	case DigestAlgorithm::SHA256:
		return crypto_hash_sha256_BYTES;

	case DigestAlgorithm::SHA512:
		return crypto_hash_sha512_BYTES;
	}

	return 0;
}

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest) noexcept
{
	return Digest(a, {src}, dest);
}

std::size_t
Digest(DigestAlgorithm a,
       std::initializer_list<std::span<const std::byte>> src,
       std::byte *dest) noexcept
{
	switch (a) {
	case DigestAlgorithm::SHA256:
		CalcDigest<SHA256State, crypto_hash_sha256_BYTES>(src, dest);
		break;

	case DigestAlgorithm::SHA512:
		CalcDigest<SHA512State, crypto_hash_sha512_BYTES>(src, dest);
		break;
	}

	return DigestSize(a);
}
