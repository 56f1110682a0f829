// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Factory.hxx"
#include "ChaCha20Poly1305Cipher.hxx"
#include "HmacSHA256Cipher.hxx"
#include "OsslCipher.hxx"

#include <openssl/evp.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

namespace SSH {

static constexpr std::string_view chacha20_poly1305 = "chacha20-poly1305@openssh.com"sv;

/**
 * The AES variants implemented by #OsslCipher.
 */
static constexpr struct {
	std::string_view name;
	const EVP_CIPHER *(*cipher)();
	std::size_t key_size, iv_size;

	/**
	 * The size of the GCM tag; zero for CTR (which needs a
	 * MAC).
	 */
	std::size_t auth_size;
} aes_algorithms[] = {
	{"aes128-gcm@openssh.com"sv, EVP_aes_128_gcm, 16, 12, 16},
	{"aes256-gcm@openssh.com"sv, EVP_aes_256_gcm, 32, 12, 16},
	{"aes128-ctr"sv, EVP_aes_128_ctr, 16, 16, 0},
	{"aes192-ctr"sv, EVP_aes_192_ctr, 24, 16, 0},
	{"aes256-ctr"sv, EVP_aes_256_ctr, 32, 16, 0},
};

static constexpr std::size_t AES_BLOCK_SIZE = 16;

bool
IsAuthenticatedEncryption(std::string_view a) noexcept
{
	if (a == chacha20_poly1305)
		return true;

	for (const auto &i : aes_algorithms)
		if (i.name == a)
			return i.auth_size > 0;

	return false;
}

static std::unique_ptr<Cipher>
MakeEncryptionCipher(std::string_view a,
		     std::span<const std::byte> key,
		     std::span<const std::byte> iv,
		     bool do_encrypt)
{
	if (a == chacha20_poly1305)
		return std::make_unique<ChaCha20Poly1305Cipher>(key);

	for (const auto &i : aes_algorithms) {
		if (i.name != a)
			continue;

		if (key.size() < i.key_size || iv.size() < i.iv_size)
			throw std::invalid_argument{"Not enough key material"};

		return std::make_unique<OsslCipher>(*i.cipher(),
						    AES_BLOCK_SIZE, i.auth_size,
						    key.first(i.key_size),
						    iv.first(i.iv_size),
						    do_encrypt);
	}

	return {};
}

std::unique_ptr<Cipher>
MakeCipher(std::string_view encryption_algorithm,
	   std::string_view mac_algorithm,
	   std::span<const std::byte> key,
	   std::span<const std::byte> iv,
	   std::span<const std::byte> mac_key,
	   bool do_encrypt)
{
	auto cipher = MakeEncryptionCipher(encryption_algorithm, key, iv, do_encrypt);
	if (cipher == nullptr || cipher->HasAuth())
		return cipher;

	if (mac_algorithm != "hmac-sha2-256"sv)
		return {};

	/* wrap the plain cipher */
	return std::make_unique<HmacSHA256Cipher>(std::move(cipher), mac_key);
}

} // namespace SSH
