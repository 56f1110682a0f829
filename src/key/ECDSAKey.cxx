// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ECDSAKey.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/Verify.hxx"
#include "lib/openssl/Error.hxx"

#include <openssl/core_names.h>

#include <stdexcept>

using std::string_view_literals::operator""sv;

static constexpr auto ecdsa_nistp256 = "ecdsa-sha2-nistp256"sv;

std::string_view
ECDSAKey::GetType() const noexcept
{
	return ecdsa_nistp256;
}

std::string_view
ECDSAKey::GetAlgorithms() const noexcept
{
	return ecdsa_nistp256;
}

/**
 * Write the public point "Q" in uncompressed SEC1 encoding
 * (RFC 5656 section 3.1).
 */
static void
WritePublicPoint(SSH::Serializer &s, const EVP_PKEY &key)
{
	std::size_t size;
	if (!EVP_PKEY_get_octet_string_param(&key, OSSL_PKEY_PARAM_PUB_KEY,
					     nullptr, 0, &size))
		throw SslError{"EVP_PKEY_get_octet_string_param() failed"};

	const auto length = s.PrepareLength();
	auto dest = s.BeginWriteN(size);

	if (!EVP_PKEY_get_octet_string_param(&key, OSSL_PKEY_PARAM_PUB_KEY,
					     reinterpret_cast<unsigned char *>(dest.data()),
					     dest.size(), &size))
		throw SslError{"EVP_PKEY_get_octet_string_param() failed"};

	s.CommitWriteN(size);
	s.CommitLength(length);
}

void
ECDSAKey::SerializePublic(SSH::Serializer &s) const
{
	s.WriteString(GetType());
	s.WriteString("nistp256"sv);
	WritePublicPoint(s, *key);
}

bool
ECDSAKey::Verify(std::span<const std::byte> message,
		 std::span<const std::byte> signature) const
{
	SSH::Deserializer d{signature};
	if (d.ReadString() != GetAlgorithms())
		throw std::invalid_argument{"Wrong algorithm"};

	signature = d.ReadLengthEncoded();
	d.ExpectEnd();

	return VerifyECDSASignature(*key, DigestAlgorithm::SHA256,
				    message, signature);
}
