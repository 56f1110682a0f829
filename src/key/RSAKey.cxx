// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "RSAKey.hxx"
#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/SerializeBN.hxx"
#include "openssl/Sign.hxx"
#include "openssl/Verify.hxx"
#include "lib/openssl/Key.hxx"
#include "lib/openssl/EvpParam.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_RSA_*

#include <stdexcept>

using std::string_view_literals::operator""sv;

RSAKey::RSAKey(Generate)
	:key(GenerateRsaKey())
{
}

std::string_view
RSAKey::GetType() const noexcept
{
	return "ssh-rsa"sv;
}

std::string_view
RSAKey::GetAlgorithms() const noexcept
{
	return "rsa-sha2-512,rsa-sha2-256"sv;
}

/**
 * Write an RSA parameter as mpint.
 */
static void
WriteRSAParam(SSH::Serializer &s, const EVP_PKEY &key, const char *name)
{
	const auto length = s.PrepareLength();
	Serialize(s, *GetBNParam<false>(key, name));
	s.CommitLength(length);
}

void
RSAKey::SerializePublic(SSH::Serializer &s) const
{
	/* RFC 4253 6.6: e before n */
	s.WriteString(GetType());
	WriteRSAParam(s, *key, OSSL_PKEY_PARAM_RSA_E);
	WriteRSAParam(s, *key, OSSL_PKEY_PARAM_RSA_N);
}

/**
 * Map a RFC 8332 signature algorithm name to its hash.  The SHA-1
 * based "ssh-rsa" signature is refused.
 */
static DigestAlgorithm
ParseRSAAlgorithm(std::string_view algorithm)
{
	struct Entry {
		std::string_view name;
		DigestAlgorithm digest;
	};

	static constexpr Entry table[] = {
		{"rsa-sha2-256"sv, DigestAlgorithm::SHA256},
		{"rsa-sha2-512"sv, DigestAlgorithm::SHA512},
	};

	for (const auto &i : table)
		if (i.name == algorithm)
			return i.digest;

	throw std::invalid_argument{"Unsupported algorithm"};
}

bool
RSAKey::Verify(std::span<const std::byte> message,
	       std::span<const std::byte> signature) const
{
	SSH::Deserializer d{signature};
	const auto digest = ParseRSAAlgorithm(d.ReadString());
	const auto blob = d.ReadLengthEncoded();
	d.ExpectEnd();

	return VerifySignature(*key, digest, message, blob);
}

void
RSAKey::Sign(SSH::Serializer &s, std::span<const std::byte> src,
	     std::string_view algorithm) const
{
	SignGeneric(s, *key, ParseRSAAlgorithm(algorithm), algorithm, src);
}
