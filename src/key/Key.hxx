// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <span>
#include <string_view>

namespace SSH { class Serializer; }

/**
 * A public key presented by a client during "publickey"
 * authentication (or the public half of the host key).
 */
class PublicKey {
public:
	PublicKey() noexcept = default;
	virtual ~PublicKey() noexcept = default;

	PublicKey(const PublicKey &) = delete;
	PublicKey &operator=(const PublicKey &) = delete;

	/**
	 * The key type name as it appears in the public key blob,
	 * e.g. "ssh-rsa".
	 */
	virtual std::string_view GetType() const noexcept = 0;

	/**
	 * A comma-separated list of signature algorithms this key
	 * can verify (and sign, if this is a #SecretKey).
	 */
	virtual std::string_view GetAlgorithms() const noexcept = 0;

	/**
	 * Write the public key blob (without length prefix).
	 */
	virtual void SerializePublic(SSH::Serializer &s) const = 0;

	/**
	 * Verify a signature blob (algorithm name plus
	 * length-prefixed signature) over the given message.
	 *
	 * Throws on malformed input or unsupported algorithm.
	 */
	virtual bool Verify(std::span<const std::byte> message,
			    std::span<const std::byte> signature) const = 0;
};

class SecretKey : public PublicKey {
public:
	SecretKey() noexcept = default;
	virtual ~SecretKey() noexcept = default;

	SecretKey(const SecretKey &) = delete;
	SecretKey &operator=(const SecretKey &) = delete;

	/**
	 * Sign #src and write a signature blob to #s.
	 *
	 * @param algorithm one of the names returned by
	 * GetAlgorithms()
	 */
	virtual void Sign(SSH::Serializer &s, std::span<const std::byte> src,
			  std::string_view algorithm) const = 0;
};
