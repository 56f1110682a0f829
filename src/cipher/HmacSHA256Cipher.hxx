// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Cipher.hxx"

#include <sodium/crypto_auth_hmacsha256.h>

#include <array>
#include <memory>

namespace SSH {

/**
 * Adds "hmac-sha2-256" (RFC 6668) to a #Cipher without built-in
 * authentication.  The MAC is calculated over the sequence number
 * and the plain packet (encrypt-and-MAC, RFC 4253 section 6.4).
 */
class HmacSHA256Cipher final : public Cipher {
	const std::unique_ptr<Cipher> next;

	std::array<std::byte, crypto_auth_hmacsha256_KEYBYTES> key;

	/**
	 * The header decrypted by DecryptHeader(), needed by
	 * DecryptPayload() to verify the MAC.
	 */
	std::array<std::byte, HEADER_SIZE> plain_header;

	using Mac = std::array<std::byte, crypto_auth_hmacsha256_BYTES>;

public:
	HmacSHA256Cipher(std::unique_ptr<Cipher> _next,
			 std::span<const std::byte> _key);
	~HmacSHA256Cipher() noexcept override;

	/* virtual methods from class Cipher */
	void DecryptHeader(uint_least64_t seqnr,
			   std::span<const std::byte, HEADER_SIZE> src,
			   std::span<std::byte, HEADER_SIZE> dest) override;

	std::size_t DecryptPayload(uint_least64_t seqnr,
				   std::span<const std::byte> src,
				   std::span<std::byte> dest) override;

	std::size_t Encrypt(uint_least64_t seqnr,
			    std::span<const std::byte> src,
			    std::span<std::byte> dest) override;

private:
	Mac CalculateMac(uint_least64_t seqnr,
			 std::span<const std::byte> header,
			 std::span<const std::byte> payload) const noexcept;
};

} // namespace SSH
