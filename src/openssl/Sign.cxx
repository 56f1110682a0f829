// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Sign.hxx"
#include "Digest.hxx"
#include "ssh/Serializer.hxx"
#include "lib/openssl/Error.hxx"
#include "util/ScopeExit.hxx"

#include <stdexcept>

/**
 * Sign the message and append the raw signature to the
 * #Serializer.
 */
static void
WriteSignature(SSH::Serializer &s, EVP_PKEY &key, const EVP_MD &md,
	       std::span<const std::byte> message)
{
	EVP_MD_CTX *const ctx = EVP_MD_CTX_new();
	if (ctx == nullptr)
		throw SslError{"EVP_MD_CTX_new() failed"};

	AtScopeExit(ctx) { EVP_MD_CTX_free(ctx); };

	if (EVP_DigestSignInit(ctx, nullptr, &md, nullptr, &key) != 1)
		throw SslError{"EVP_DigestSignInit() failed"};

	const auto *const src = reinterpret_cast<const unsigned char *>(message.data());

	/* first pass: determine the maximum signature size */
	std::size_t size;
	if (EVP_DigestSign(ctx, nullptr, &size, src, message.size()) != 1)
		throw SslError{"EVP_DigestSign() failed"};

	auto dest = s.BeginWriteN(size);
	if (EVP_DigestSign(ctx, reinterpret_cast<unsigned char *>(dest.data()),
			   &size, src, message.size()) != 1)
		throw SslError{"EVP_DigestSign() failed"};

	s.CommitWriteN(size);
}

void
SignGeneric(SSH::Serializer &s,
	    EVP_PKEY &key, DigestAlgorithm hash_alg,
	    std::string_view signature_type,
	    std::span<const std::byte> src)
{
	const auto *const md = ToEvpMD(hash_alg);
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	s.WriteString(signature_type);

	const auto signature_length = s.PrepareLength();
	WriteSignature(s, key, *md, src);
	s.CommitLength(signature_length);
}
