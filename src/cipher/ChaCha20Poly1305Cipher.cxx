// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ChaCha20Poly1305Cipher.hxx"
#include "lib/sodium/OnetimeauthPoly1305.hxx"
#include "lib/sodium/StreamChaCha20.hxx"
#include "util/PackedBigEndian.hxx"
#include "util/SpanCast.hxx"

#include <sodium/utils.h>

#include <algorithm> // for std::copy()
#include <cassert>
#include <stdexcept>

namespace SSH {

namespace {

/**
 * The ChaCha20 nonce is the packet sequence number in big-endian
 * byte order.
 */
class PacketNonce {
	PackedBE64 value;

public:
	explicit PacketNonce(uint_least64_t seqnr) noexcept
		:value(seqnr) {}

	operator std::span<const std::byte, crypto_stream_chacha20_NONCEBYTES>() const noexcept {
		return ReferenceAsBytes(value);
	}
};

/**
 * The one-time Poly1305 key: block 0 of the payload key stream.
 * Zeroed on destruction.
 */
class PolyKey {
	std::array<std::byte, crypto_onetimeauth_poly1305_KEYBYTES> key{};

public:
	PolyKey(const PacketNonce &nonce,
		std::span<const std::byte, crypto_stream_chacha20_KEYBYTES> payload_key) noexcept {
		crypto_stream_chacha20_xor(key.data(), key, nonce, payload_key);
	}

	~PolyKey() noexcept {
		sodium_memzero(key.data(), key.size());
	}

	PolyKey(const PolyKey &) = delete;
	PolyKey &operator=(const PolyKey &) = delete;

	operator std::span<const std::byte, crypto_onetimeauth_poly1305_KEYBYTES>() const noexcept {
		return key;
	}
};

} // anonymous namespace

ChaCha20Poly1305Cipher::ChaCha20Poly1305Cipher(std::span<const std::byte> key)
	:Cipher(8, crypto_onetimeauth_poly1305_BYTES, true)
{
	static_assert(sizeof(payload_key) == crypto_stream_chacha20_KEYBYTES);
	static_assert(sizeof(header_key) == crypto_stream_chacha20_KEYBYTES);

	/* OpenSSH's key layout: K_2 (payload) first, then K_1
	   (packet length) */
	if (key.size() != sizeof(payload_key) + sizeof(header_key))
		throw std::invalid_argument{"Wrong key size"};

	std::copy_n(key.begin(), payload_key.size(), payload_key.begin());
	std::copy(key.begin() + payload_key.size(), key.end(), header_key.begin());
}

ChaCha20Poly1305Cipher::~ChaCha20Poly1305Cipher() noexcept
{
	sodium_memzero(payload_key.data(), payload_key.size());
	sodium_memzero(header_key.data(), header_key.size());
}

void
ChaCha20Poly1305Cipher::DecryptHeader(uint_least64_t seqnr,
				      std::span<const std::byte, HEADER_SIZE> src,
				      std::span<std::byte, HEADER_SIZE> dest)
{
	crypto_stream_chacha20_xor(dest.data(), src, PacketNonce{seqnr},
				   header_key);
}

std::size_t
ChaCha20Poly1305Cipher::DecryptPayload(uint_least64_t seqnr,
				       std::span<const std::byte> src,
				       std::span<std::byte> dest)
{
	assert(src.size() > HEADER_SIZE + GetAuthSize());

	const PacketNonce nonce{seqnr};

	/* the tag covers the encrypted length and the encrypted
	   payload */
	const auto tag = src.last<crypto_onetimeauth_poly1305_BYTES>();
	const auto authenticated = src.first(src.size() - tag.size());

	if (!crypto_onetimeauth_poly1305_verify(tag, authenticated,
						PolyKey{nonce, payload_key}))
		throw std::invalid_argument{"Invalid Poly1305 MAC"};

	const auto payload = authenticated.subspan(HEADER_SIZE);
	if (dest.size() < payload.size())
		throw std::invalid_argument{"Buffer too small"};

	/* block 0 was used for the Poly1305 key, the payload
	   starts at block 1 */
	crypto_stream_chacha20_xor_ic(dest.data(), payload, nonce, 1,
				      payload_key);
	return payload.size();
}

std::size_t
ChaCha20Poly1305Cipher::Encrypt(uint_least64_t seqnr,
				std::span<const std::byte> src,
				std::span<std::byte> dest)
{
	assert(src.size() > HEADER_SIZE);
	assert(dest.size() >= GetEncryptedSize(src.size()));

	const PacketNonce nonce{seqnr};
	const std::size_t length = src.size();

	crypto_stream_chacha20_xor(dest.data(), src.first<HEADER_SIZE>(),
				   nonce, header_key);
	crypto_stream_chacha20_xor_ic(dest.data() + HEADER_SIZE,
				      src.subspan(HEADER_SIZE),
				      nonce, 1, payload_key);

	const auto tag = dest.subspan(length)
		.first<crypto_onetimeauth_poly1305_BYTES>();
	crypto_onetimeauth_poly1305(tag, dest.first(length),
				    PolyKey{nonce, payload_key});

	return length + tag.size();
}

} // namespace SSH
