// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Digest.hxx"

#include <cstddef>
#include <span>
#include <string_view>

namespace SSH {

/**
 * The inputs of the exchange hash "H" (RFC 4253 section 8, RFC 5656
 * section 4).
 */
struct KexHashInput {
	/**
	 * The identification strings without CR LF.
	 */
	std::string_view client_version, server_version;

	/**
	 * The KEXINIT payloads without the message number.
	 */
	std::span<const std::byte> client_kexinit, server_kexinit;

	std::span<const std::byte> server_host_key_blob;

	std::span<const std::byte> client_ephemeral_public_key;
	std::span<const std::byte> server_ephemeral_public_key;

	/**
	 * The shared secret "K" as "mpint" including the length
	 * prefix.
	 */
	std::span<const std::byte> shared_secret;
};

/**
 * Calculate the exchange hash.
 *
 * @param hash a buffer of at least #DIGEST_MAX_SIZE bytes
 * @return the size of the hash
 */
std::size_t
CalcKexHash(DigestAlgorithm hash_alg, const KexHashInput &input,
	    std::byte *hash) noexcept;

} // namespace SSH
