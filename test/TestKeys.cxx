// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "key/Key.hxx"
#include "key/Parser.hxx"
#include "key/RSAKey.hxx"
#include "key/AuthorizedKey.hxx"
#include "openssl/SerializeBN.hxx"
#include "ssh/Serializer.hxx"
#include "lib/openssl/UniqueEVP.hxx"
#include "lib/openssl/UniqueEC.hxx"
#include "memory/fb_pool.hxx"
#include "util/AllocatedArray.hxx"
#include "util/IterableSplitString.hxx"
#include "util/ScopeExit.hxx"
#include "util/SpanCast.hxx"

#include <sodium/crypto_sign_ed25519.h>

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <stdexcept>

using std::string_view_literals::operator""sv;

static const auto message = AsBytes("git-upload-pack 'repo.git'"sv);
static const auto other_message = AsBytes("git-receive-pack 'repo.git'"sv);

static AllocatedArray<std::byte>
SerializePublicBlob(const PublicKey &key)
{
	SSH::Serializer s;
	key.SerializePublic(s);
	return AllocatedArray{s.Finish()};
}

[[gnu::pure]]
static bool
Equals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
	return std::equal(a.begin(), a.end(), b.begin(), b.end());
}

class KeyTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(KeyTest, RSA)
{
	const RSAKey key{RSAKey::Generate{}};
	EXPECT_EQ(key.GetType(), "ssh-rsa"sv);

	const auto blob = SerializePublicBlob(key);
	const auto public_key = ParsePublicKeyBlob(blob);
	EXPECT_EQ(public_key->GetType(), "ssh-rsa"sv);
	EXPECT_EQ(public_key->GetAlgorithms(), key.GetAlgorithms());

	for (const std::string_view algorithm : IterableSplitString(key.GetAlgorithms(), ',')) {
		SSH::Serializer s;
		key.Sign(s, message, algorithm);
		const AllocatedArray signature{s.Finish()};

		EXPECT_TRUE(public_key->Verify(message, signature));
		EXPECT_FALSE(public_key->Verify(other_message, signature));
	}

	/* the parsed public key re-serializes to the same blob */
	const auto blob2 = SerializePublicBlob(*public_key);
	EXPECT_TRUE(Equals(blob, blob2));
}

TEST_F(KeyTest, RSAUnsupportedAlgorithm)
{
	const RSAKey key{RSAKey::Generate{}};

	/* SHA-1 signatures ("ssh-rsa") are refused */
	SSH::Serializer s;
	EXPECT_THROW(key.Sign(s, message, "ssh-rsa"sv), std::invalid_argument);
}

static AllocatedArray<std::byte>
MakeEd25519Signature(std::span<const std::byte> src,
		     const std::array<unsigned char, crypto_sign_ed25519_SECRETKEYBYTES> &sk)
{
	std::array<std::byte, crypto_sign_ed25519_BYTES> raw;
	crypto_sign_ed25519_detached(reinterpret_cast<unsigned char *>(raw.data()), nullptr,
				     reinterpret_cast<const unsigned char *>(src.data()), src.size(),
				     sk.data());

	SSH::Serializer s;
	s.WriteString("ssh-ed25519"sv);
	s.WriteLengthEncoded(raw);
	return AllocatedArray{s.Finish()};
}

TEST_F(KeyTest, Ed25519)
{
	std::array<unsigned char, crypto_sign_ed25519_PUBLICKEYBYTES> pk;
	std::array<unsigned char, crypto_sign_ed25519_SECRETKEYBYTES> sk;
	crypto_sign_ed25519_keypair(pk.data(), sk.data());

	SSH::Serializer s;
	s.WriteString("ssh-ed25519"sv);
	s.WriteLengthEncoded(std::as_bytes(std::span{pk}));
	const AllocatedArray blob{s.Finish()};

	const auto key = ParsePublicKeyBlob(blob);
	EXPECT_EQ(key->GetType(), "ssh-ed25519"sv);
	EXPECT_TRUE(Equals(SerializePublicBlob(*key), blob));

	const auto signature = MakeEd25519Signature(message, sk);
	EXPECT_TRUE(key->Verify(message, signature));
	EXPECT_FALSE(key->Verify(other_message, signature));

	const auto formatted = FormatAuthorizedKey(blob);
	EXPECT_TRUE(formatted.starts_with("ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAI"sv));
}

TEST_F(KeyTest, Ed25519WrongAlgorithm)
{
	std::array<unsigned char, crypto_sign_ed25519_PUBLICKEYBYTES> pk;
	std::array<unsigned char, crypto_sign_ed25519_SECRETKEYBYTES> sk;
	crypto_sign_ed25519_keypair(pk.data(), sk.data());

	SSH::Serializer s;
	s.WriteString("ssh-ed25519"sv);
	s.WriteLengthEncoded(std::as_bytes(std::span{pk}));
	const auto key = ParsePublicKeyBlob(s.Finish());

	SSH::Serializer s2;
	s2.WriteString("ssh-rsa"sv);
	s2.WriteString("garbage"sv);
	EXPECT_THROW(key->Verify(message, s2.Finish()), std::invalid_argument);
}

/**
 * Generate a NIST P-256 key pair with OpenSSL.
 */
static UniqueEVP_PKEY
GenerateP256()
{
	UniqueEVP_PKEY key{EVP_EC_gen("P-256")};
	if (!key)
		throw std::runtime_error{"EVP_EC_gen() failed"};
	return key;
}

static AllocatedArray<std::byte>
MakeECDSABlob(EVP_PKEY &key)
{
	std::array<unsigned char, 65> q;
	std::size_t q_size;
	if (!EVP_PKEY_get_octet_string_param(&key, OSSL_PKEY_PARAM_PUB_KEY,
					     q.data(), q.size(), &q_size))
		throw std::runtime_error{"EVP_PKEY_get_octet_string_param() failed"};

	SSH::Serializer s;
	s.WriteString("ecdsa-sha2-nistp256"sv);
	s.WriteString("nistp256"sv);
	s.WriteLengthEncoded(std::as_bytes(std::span{q}.first(q_size)));
	return AllocatedArray{s.Finish()};
}

/**
 * Sign with OpenSSL and convert the DER signature to the SSH
 * format.
 */
static AllocatedArray<std::byte>
MakeECDSASignature(EVP_PKEY &key, std::span<const std::byte> src)
{
	EVP_MD_CTX *ctx = EVP_MD_CTX_new();
	AtScopeExit(ctx) { EVP_MD_CTX_free(ctx); };

	if (EVP_DigestSignInit(ctx, nullptr, EVP_sha256(), nullptr, &key) != 1)
		throw std::runtime_error{"EVP_DigestSignInit() failed"};

	std::array<unsigned char, 128> der;
	std::size_t der_size = der.size();
	if (EVP_DigestSign(ctx, der.data(), &der_size,
			   reinterpret_cast<const unsigned char *>(src.data()),
			   src.size()) != 1)
		throw std::runtime_error{"EVP_DigestSign() failed"};

	const unsigned char *p = der.data();
	const UniqueECDSA_SIG sig{d2i_ECDSA_SIG(nullptr, &p, der_size)};
	if (!sig)
		throw std::runtime_error{"d2i_ECDSA_SIG() failed"};

	SSH::Serializer s;
	s.WriteString("ecdsa-sha2-nistp256"sv);

	const auto blob_length = s.PrepareLength();

	auto length = s.PrepareLength();
	Serialize(s, *ECDSA_SIG_get0_r(sig.get()));
	s.CommitLength(length);

	length = s.PrepareLength();
	Serialize(s, *ECDSA_SIG_get0_s(sig.get()));
	s.CommitLength(length);

	s.CommitLength(blob_length);
	return AllocatedArray{s.Finish()};
}

TEST_F(KeyTest, ECDSA)
{
	const auto secret = GenerateP256();

	const auto blob = MakeECDSABlob(*secret);
	const auto key = ParsePublicKeyBlob(blob);
	EXPECT_EQ(key->GetType(), "ecdsa-sha2-nistp256"sv);
	EXPECT_TRUE(Equals(SerializePublicBlob(*key), blob));

	const auto signature = MakeECDSASignature(*secret, message);
	EXPECT_TRUE(key->Verify(message, signature));
	EXPECT_FALSE(key->Verify(other_message, signature));
}

TEST_F(KeyTest, ParseMalformed)
{
	SSH::Serializer s;
	s.WriteString("ssh-dss"sv);
	EXPECT_THROW(ParsePublicKeyBlob(s.Finish()), std::invalid_argument);

	SSH::Serializer s2;
	s2.WriteString("ssh-ed25519"sv);
	s2.WriteString("too short"sv);
	EXPECT_THROW(ParsePublicKeyBlob(s2.Finish()), std::invalid_argument);

	static constexpr std::array<std::byte, 3> truncated{};
	EXPECT_THROW(ParsePublicKeyBlob(truncated), std::invalid_argument);

	SSH::Serializer s3;
	s3.WriteString("ecdsa-sha2-nistp256"sv);
	s3.WriteString("nistp384"sv);
	s3.WriteString("x"sv);
	EXPECT_THROW(ParsePublicKeyBlob(s3.Finish()), std::invalid_argument);
}
