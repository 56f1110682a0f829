// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "HmacSHA256Cipher.hxx"
#include "util/PackedBigEndian.hxx"
#include "util/ScopeExit.hxx"
#include "util/SpanCast.hxx"

#include <sodium/utils.h>

#include <algorithm> // for std::copy()
#include <array>
#include <cassert>
#include <stdexcept>

namespace SSH {

HmacSHA256Cipher::HmacSHA256Cipher(std::unique_ptr<Cipher> _next,
				   std::span<const std::byte> _key)
	:Cipher(_next->GetBlockSize(),
		_next->GetAuthSize() + crypto_auth_hmacsha256_BYTES,
		_next->IsHeaderExcludedFromPadding()),
	 next(std::move(_next))
{
	/* the MAC key may be longer (the key exchange derives as
	   much as the largest hash needs); use only the beginning */
	if (_key.size() < key.size())
		throw std::invalid_argument{"MAC key too short"};

	const auto k = _key.first<crypto_auth_hmacsha256_KEYBYTES>();
	std::copy(k.begin(), k.end(), key.begin());
}

HmacSHA256Cipher::~HmacSHA256Cipher() noexcept
{
	sodium_memzero(key.data(), key.size());
	sodium_memzero(plain_header.data(), plain_header.size());
}

HmacSHA256Cipher::Mac
HmacSHA256Cipher::CalculateMac(uint_least64_t seqnr,
			       std::span<const std::byte> header,
			       std::span<const std::byte> payload) const noexcept
{
	crypto_auth_hmacsha256_state state;
	AtScopeExit(&state) { sodium_memzero(&state, sizeof(state)); };

	crypto_auth_hmacsha256_init(&state,
				    reinterpret_cast<const unsigned char *>(key.data()),
				    key.size());

	/* the MAC covers the 32 bit sequence number */
	const PackedBE32 seqbuf{static_cast<uint32_t>(seqnr)};

	const std::array<std::span<const std::byte>, 3> parts{
		ReferenceAsBytes(seqbuf), header, payload,
	};

	for (const auto &i : parts)
		crypto_auth_hmacsha256_update(&state,
					      reinterpret_cast<const unsigned char *>(i.data()),
					      i.size());

	Mac mac;
	crypto_auth_hmacsha256_final(&state,
				     reinterpret_cast<unsigned char *>(mac.data()));
	return mac;
}

void
HmacSHA256Cipher::DecryptHeader(uint_least64_t seqnr,
				std::span<const std::byte, HEADER_SIZE> src,
				std::span<std::byte, HEADER_SIZE> dest)
{
	next->DecryptHeader(seqnr, src, dest);
	std::copy(dest.begin(), dest.end(), plain_header.begin());
}

std::size_t
HmacSHA256Cipher::DecryptPayload(uint_least64_t seqnr,
				 std::span<const std::byte> src,
				 std::span<std::byte> dest)
{
	assert(src.size() >= HEADER_SIZE + GetAuthSize());

	const auto received = src.last<crypto_auth_hmacsha256_BYTES>();
	src = src.first(src.size() - received.size());

	const std::size_t length = next->DecryptPayload(seqnr, src, dest);

	const auto expected = CalculateMac(seqnr, plain_header,
					   dest.first(length));
	if (sodium_memcmp(received.data(), expected.data(),
			  expected.size()) != 0)
		throw std::invalid_argument{"Invalid HMAC"};

	return length;
}

std::size_t
HmacSHA256Cipher::Encrypt(uint_least64_t seqnr,
			  std::span<const std::byte> src,
			  std::span<std::byte> dest)
{
	assert(src.size() >= HEADER_SIZE);
	assert(dest.size() >= GetEncryptedSize(src.size()));

	/* calculate the MAC over the plain packet before
	   encrypting it */
	const auto mac = CalculateMac(seqnr, src.first<HEADER_SIZE>(),
				      src.subspan(HEADER_SIZE));

	const std::size_t length = next->Encrypt(seqnr, src, dest);
	std::copy(mac.begin(), mac.end(), dest.begin() + length);
	return length + mac.size();
}

} // namespace SSH
