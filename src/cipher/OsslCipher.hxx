// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Cipher.hxx"
#include "lib/openssl/UniqueEVP.hxx"

namespace SSH {

/**
 * A #Cipher implementation using an OpenSSL EVP cipher: AES-CTR
 * (needs an additional MAC) or AES-GCM (RFC 5647 as implemented by
 * OpenSSH: the packet length is authenticated but not encrypted).
 */
class OsslCipher final : public Cipher {
	UniqueEVP_CIPHER_CTX ctx;

public:
	OsslCipher(const EVP_CIPHER &cipher,
		   std::size_t _block_size,
		   std::size_t _auth_size,
		   std::span<const std::byte> key,
		   std::span<const std::byte> iv,
		   bool do_encrypt);
	~OsslCipher() noexcept override;

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
	/**
	 * Advance the GCM invocation counter (RFC 5647 section 7.1).
	 */
	void IncrementIV();

	/**
	 * Start a new GCM packet: advance the IV and feed the
	 * packet length as additional authenticated data.
	 */
	void BeginGcmPacket(std::span<const std::byte, HEADER_SIZE> header);

	/**
	 * Run EVP_CipherUpdate() from #src into #dest.
	 *
	 * @return the number of bytes written
	 */
	std::size_t Update(std::byte *dest, std::span<const std::byte> src);
};

} // namespace SSH
