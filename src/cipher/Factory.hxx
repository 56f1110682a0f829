// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <string_view>

namespace SSH {

/**
 * All encryption algorithms supported by MakeCipher() in our order
 * of preference.
 */
constexpr std::string_view all_encryption_algorithms{
	"chacha20-poly1305@openssh.com"
	",aes128-gcm@openssh.com,aes256-gcm@openssh.com"
	",aes128-ctr,aes192-ctr,aes256-ctr"
};

/**
 * All MAC algorithms supported by MakeCipher().
 */
constexpr std::string_view all_mac_algorithms{
	"hmac-sha2-256"
};

/**
 * Does this encryption algorithm have built-in authentication (i.e.
 * no MAC needs to be negotiated)?
 */
[[gnu::pure]]
bool
IsAuthenticatedEncryption(std::string_view encryption_algorithm) noexcept;

class Cipher;

/**
 * Construct a new stream cipher.
 *
 * Throws on error.
 *
 * @param encryption_algorithm the negotiated encryption algorithm
 * @param mac_algorithm the negotiated MAC algorithm (ignored if the
 * encryption algorithm has built-in authentication)
 * @return the new #Cipher instance or nullptr if there is no matching
 * cipher
 */
std::unique_ptr<Cipher>
MakeCipher(std::string_view encryption_algorithm,
	   std::string_view mac_algorithm,
	   std::span<const std::byte> key,
	   std::span<const std::byte> iv,
	   std::span<const std::byte> mac_key,
	   bool do_encrypt);

} // namespace SSH
