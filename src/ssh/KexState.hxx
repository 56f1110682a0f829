// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Digest.hxx"
#include "util/AllocatedArray.hxx"

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>

namespace SSH {

class Cipher;

enum class Direction : uint_least8_t {
	INCOMING,
	OUTGOING,
};

/**
 * Key material derived from a key exchange.
 */
struct KexState {
	struct NewKey {
		AllocatedArray<std::byte> enc_iv, enc_key, mac_key;
	};

	/**
	 * Indexed by #Direction.
	 */
	std::array<NewKey, 2> new_keys;

	/**
	 * The exchange hash of the first key exchange (RFC 4253
	 * section 7.2).
	 */
	AllocatedArray<std::byte> session_id;

	/**
	 * The number of key bytes to derive; enough for all
	 * supported ciphers and MACs.
	 */
	static constexpr std::size_t we_need = 64;

	static constexpr DigestAlgorithm hash_alg = DigestAlgorithm::SHA256;

	/**
	 * Derive the keys "A" to "F" (RFC 4253 section 7.2) for the
	 * server side.  On the first call, the hash becomes the
	 * session identifier.
	 */
	void DeriveKeys(std::span<const std::byte> hash,
			std::span<const std::byte> shared_secret);

	/**
	 * Throws on error.
	 *
	 * @return the new cipher or nullptr if the algorithm is not
	 * supported
	 */
	std::unique_ptr<Cipher> MakeCipher(std::string_view encryption_algorithm,
					   std::string_view mac_algorithm,
					   Direction direction);
};

} // namespace SSH
