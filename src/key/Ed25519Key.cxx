// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Ed25519Key.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"

#include <sodium/crypto_sign_ed25519.h>

#include <algorithm>
#include <stdexcept>

using std::string_view_literals::operator""sv;

static_assert(Ed25519Key::PUBLIC_KEY_SIZE == crypto_sign_ed25519_PUBLICKEYBYTES);

Ed25519Key::Ed25519Key(std::span<const std::byte, PUBLIC_KEY_SIZE> _public_key) noexcept
{
	std::copy(_public_key.begin(), _public_key.end(), public_key.begin());
}

std::string_view
Ed25519Key::GetType() const noexcept
{
	return "ssh-ed25519"sv;
}

std::string_view
Ed25519Key::GetAlgorithms() const noexcept
{
	return "ssh-ed25519"sv;
}

void
Ed25519Key::SerializePublic(SSH::Serializer &s) const
{
	s.WriteString(GetType());
	s.WriteLengthEncoded(public_key);
}

static inline const unsigned char *
ToUChar(std::span<const std::byte> s) noexcept
{
	return reinterpret_cast<const unsigned char *>(s.data());
}

bool
Ed25519Key::Verify(std::span<const std::byte> message,
		   std::span<const std::byte> signature) const
{
	/* RFC 8709 section 6 */
	SSH::Deserializer d{signature};
	if (d.ReadString() != GetAlgorithms())
		throw std::invalid_argument{"Wrong algorithm"};

	const auto sig = d.ReadLengthEncoded();
	d.ExpectEnd();

	if (sig.size() != crypto_sign_ed25519_BYTES)
		throw std::invalid_argument{"Malformed Ed25519 signature"};

	return crypto_sign_ed25519_verify_detached(ToUChar(sig),
						   ToUChar(message), message.size(),
						   ToUChar(public_key)) == 0;
}
