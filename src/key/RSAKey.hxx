// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Key.hxx"
#include "lib/openssl/UniqueEVP.hxx"

/**
 * An RSA key backed by OpenSSL.  It may be a public key (from a
 * client's key blob) or a key pair (the host key); only the latter
 * can Sign().
 */
class RSAKey final : public SecretKey {
	UniqueEVP_PKEY key;

public:
	struct Generate {};
	explicit RSAKey(Generate);

	explicit RSAKey(UniqueEVP_PKEY &&_key) noexcept
		:key(std::move(_key)) {}

	const EVP_PKEY &GetEvpPkey() const noexcept {
		return *key;
	}

	/* virtual methods from class PublicKey */
	std::string_view GetType() const noexcept override;
	std::string_view GetAlgorithms() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;

	/* virtual methods from class SecretKey */
	void Sign(SSH::Serializer &s, std::span<const std::byte> src,
		  std::string_view algorithm) const override;
};
