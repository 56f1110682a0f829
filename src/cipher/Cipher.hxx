// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "ssh/Sizes.hxx"

#include <cstddef>
#include <cstdint>
#include <span>

namespace SSH {

/**
 * The packet protection of one direction of an SSH connection
 * (RFC 4253 section 6): encryption plus (built-in or added)
 * authentication.  Instances are created by MakeCipher() after each
 * key exchange.
 *
 * Authenticated implementations append a fixed-size trailer to
 * every packet.  Some implementations (chacha20-poly1305, the GCM
 * ciphers) do not encrypt the packet length with the payload cipher
 * and thus exclude the header from the padding calculation.
 */
class Cipher {
	const std::size_t block_size;
	const std::size_t auth_size;

	const bool pad_without_header;

protected:
	Cipher(std::size_t _block_size,
	       std::size_t _auth_size, bool _pad_without_header) noexcept
		:block_size(_block_size), auth_size(_auth_size),
		 pad_without_header(_pad_without_header) {}

public:
	virtual ~Cipher() noexcept = default;

	Cipher(const Cipher &) = delete;
	Cipher &operator=(const Cipher &) = delete;

	/**
	 * The plain packet size must be a multiple of this.
	 */
	std::size_t GetBlockSize() const noexcept {
		return block_size;
	}

	bool HasAuth() const noexcept {
		return auth_size > 0;
	}

	/**
	 * The size of the MAC or tag trailer.
	 */
	std::size_t GetAuthSize() const noexcept {
		return auth_size;
	}

	std::size_t GetEncryptedSize(std::size_t plain_size) const noexcept {
		return plain_size + auth_size;
	}

	/**
	 * If true, the padding makes only padding_length, payload and
	 * padding a multiple of GetBlockSize(), not the length field.
	 */
	bool IsHeaderExcludedFromPadding() const noexcept {
		return pad_without_header;
	}

	/**
	 * Decrypt just the length field and padding_length of an
	 * incoming packet, which is needed to know how much more to
	 * receive.
	 *
	 * Throws on error.
	 *
	 * @param seqnr the packet's sequence number (the nonce of
	 * some ciphers)
	 */
	virtual void DecryptHeader(uint_least64_t seqnr,
				   std::span<const std::byte, HEADER_SIZE> src,
				   std::span<std::byte, HEADER_SIZE> dest) = 0;

	/**
	 * Authenticate the complete packet #src (whose header was
	 * passed to DecryptHeader() before) and decrypt everything
	 * after the header into #dest.
	 *
	 * Throws if authentication fails.
	 *
	 * @return the number of bytes written to #dest
	 */
	virtual std::size_t DecryptPayload(uint_least64_t seqnr,
					   std::span<const std::byte> src,
					   std::span<std::byte> dest) = 0;

	/**
	 * Encrypt a complete plain packet and append the MAC or tag.
	 * #dest must hold at least GetEncryptedSize() bytes.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes written to #dest
	 */
	virtual std::size_t Encrypt(uint_least64_t seqnr,
				    std::span<const std::byte> src,
				    std::span<std::byte> dest) = 0;
};

} // namespace SSH
