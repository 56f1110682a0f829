// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Verify.hxx"
#include "Digest.hxx"
#include "BN.hxx"
#include "ssh/Deserializer.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/UniqueEC.hxx"
#include "util/ScopeExit.hxx"

#include <openssl/err.h>

#include <stdexcept>

bool
VerifySignature(EVP_PKEY &key, DigestAlgorithm hash_alg,
		std::span<const std::byte> message,
		std::span<const std::byte> signature)
{
	const auto *const md = ToEvpMD(hash_alg);
	if (md == nullptr)
		throw std::invalid_argument{"Digest algorithm not supported by OpenSSL"};

	EVP_MD_CTX *const ctx = EVP_MD_CTX_new();
	if (ctx == nullptr)
		throw SslError{"EVP_MD_CTX_new() failed"};

	AtScopeExit(ctx) { EVP_MD_CTX_free(ctx); };

	if (EVP_DigestVerifyInit(ctx, nullptr, md, nullptr, &key) != 1)
		throw SslError{"EVP_DigestVerifyInit() failed"};

	switch (EVP_DigestVerify(ctx,
				 reinterpret_cast<const unsigned char *>(signature.data()),
				 signature.size(),
				 reinterpret_cast<const unsigned char *>(message.data()),
				 message.size())) {
	case 1:
		return true;

	case 0:
		return false;

	default:
		/* a malformed signature is reported as an error by
		   some providers; treat it as a mismatch */
		ERR_clear_error();
		return false;
	}
}

bool
VerifyECDSASignature(EVP_PKEY &key, DigestAlgorithm hash_alg,
		     std::span<const std::byte> message,
		     std::span<const std::byte> signature)
{
	SSH::Deserializer d{signature};
	auto r = DeserializeBIGNUM(d.ReadLengthEncoded());
	auto s = DeserializeBIGNUM(d.ReadLengthEncoded());
	d.ExpectEnd();

	const UniqueECDSA_SIG sig{ECDSA_SIG_new()};
	if (!sig)
		throw SslError{"ECDSA_SIG_new() failed"};

	if (!ECDSA_SIG_set0(sig.get(), r.get(), s.get()))
		throw SslError{"ECDSA_SIG_set0() failed"};

	/* now owned by "sig" */
	r.release();
	s.release();

	unsigned char *der = nullptr;
	const int der_size = i2d_ECDSA_SIG(sig.get(), &der);
	if (der_size < 0)
		throw SslError{"i2d_ECDSA_SIG() failed"};

	AtScopeExit(der) { OPENSSL_free(der); };

	return VerifySignature(key, hash_alg, message,
			       {reinterpret_cast<const std::byte *>(der),
				static_cast<std::size_t>(der_size)});
}
