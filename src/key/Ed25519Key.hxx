// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Key.hxx"

#include <array>

/**
 * A client's Ed25519 public key.  Verification is done with
 * libsodium.
 */
class Ed25519Key final : public PublicKey {
public:
	static constexpr std::size_t PUBLIC_KEY_SIZE = 32;

private:
	std::array<std::byte, PUBLIC_KEY_SIZE> public_key;

public:
	explicit Ed25519Key(std::span<const std::byte, PUBLIC_KEY_SIZE> _public_key) noexcept;

	std::string_view GetType() const noexcept override;
	std::string_view GetAlgorithms() const noexcept override;
	void SerializePublic(SSH::Serializer &s) const override;
	bool Verify(std::span<const std::byte> message,
		    std::span<const std::byte> signature) const override;
};
