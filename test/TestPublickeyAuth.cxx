// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PublickeyAuth.hxx"
#include "identity/KeyFile.hxx"
#include "key/AuthorizedKey.hxx"
#include "key/Key.hxx"
#include "ssh/Protocol.hxx"
#include "ssh/Deserializer.hxx"
#include "ssh/Serializer.hxx"
#include "memory/fb_pool.hxx"
#include "co/InvokeTask.hxx"
#include "co/Task.hxx"
#include "util/AllocatedArray.hxx"
#include "util/SpanCast.hxx"

#include <sodium/crypto_sign_ed25519.h>

#include <gtest/gtest.h>

#include <array>
#include <optional>
#include <stdexcept>
#include <string>

using std::string_view_literals::operator""sv;

static constexpr auto session_id_string = "0123456789abcdef0123456789abcdef"sv;

namespace {

class ThrowingIdentityLookup final : public IdentityLookup {
public:
	Co::Task<std::string> Lookup(std::string_view) override {
		throw std::runtime_error{"backend unavailable"};
	}
};

class Ed25519Client {
	std::array<unsigned char, crypto_sign_ed25519_PUBLICKEYBYTES> pk;
	std::array<unsigned char, crypto_sign_ed25519_SECRETKEYBYTES> sk;

public:
	Ed25519Client() noexcept {
		crypto_sign_ed25519_keypair(pk.data(), sk.data());
	}

	AllocatedArray<std::byte> GetBlob() const {
		SSH::Serializer s;
		s.WriteString("ssh-ed25519"sv);
		s.WriteLengthEncoded(std::as_bytes(std::span{pk}));
		return AllocatedArray{s.Finish()};
	}

	std::string GetAuthorizedKey() const {
		return FormatAuthorizedKey(GetBlob());
	}

	/**
	 * Build a complete USERAUTH_REQUEST payload (without the
	 * message number), optionally signed.
	 */
	AllocatedArray<std::byte> MakeRequest(std::span<const std::byte> session_id,
					      bool with_signature,
					      bool corrupt_signature=false) const {
		const auto blob = GetBlob();

		SSH::Serializer s;
		s.WriteString("git"sv);
		s.WriteString("ssh-connection"sv);
		s.WriteString("publickey"sv);
		s.WriteBool(with_signature);
		s.WriteString("ssh-ed25519"sv);
		s.WriteLengthEncoded(blob);

		if (!with_signature)
			return AllocatedArray{s.Finish()};

		const AllocatedArray signed_part{s.Finish()};

		SSH::Serializer m;
		m.WriteLengthEncoded(session_id);
		m.WriteU8(static_cast<uint_least8_t>(SSH::MessageNumber::USERAUTH_REQUEST));
		m.WriteN(signed_part);
		const auto message = m.Finish();

		std::array<std::byte, crypto_sign_ed25519_BYTES> raw;
		crypto_sign_ed25519_detached(reinterpret_cast<unsigned char *>(raw.data()), nullptr,
					     reinterpret_cast<const unsigned char *>(message.data()),
					     message.size(), sk.data());
		if (corrupt_signature)
			raw[7] ^= std::byte{0x10};

		SSH::Serializer sig;
		sig.WriteString("ssh-ed25519"sv);
		sig.WriteLengthEncoded(raw);

		s.WriteLengthEncoded(sig.Finish());
		return AllocatedArray{s.Finish()};
	}
};

/**
 * Runs CheckPublickey() to completion; all lookups used here finish
 * without suspending.
 */
struct CheckRunner {
	std::optional<PublickeyResult> result;
	Co::EagerInvokeTask task;

	CheckRunner(IdentityLookup &lookup, std::span<const std::byte> session_id,
		    const PublickeyRequest &request)
		:task(Run(lookup, session_id, request)) {}

private:
	Co::EagerInvokeTask Run(IdentityLookup &lookup,
				std::span<const std::byte> session_id,
				const PublickeyRequest &request) {
		result = co_await CheckPublickey(lookup, session_id, request);
	}
};

} // anonymous namespace

class PublickeyAuthTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;

protected:
	const std::span<const std::byte> session_id = AsBytes(session_id_string);

	Ed25519Client known, stranger;
	KeyFileIdentityLookup lookup;

	void SetUp() override {
		ASSERT_EQ(lookup.Load("42 " + known.GetAuthorizedKey() + " alice@laptop\n"), 0U);
	}

	PublickeyResult Check(IdentityLookup &l, std::span<const std::byte> payload) {
		const auto r = ParseUserauthRequest(payload);
		CheckRunner runner{l, session_id, r.publickey};
		EXPECT_TRUE(runner.result.has_value());
		if (!runner.result)
			return {};
		return std::move(*runner.result);
	}

	PublickeyResult Check(std::span<const std::byte> payload) {
		return Check(lookup, payload);
	}
};

TEST_F(PublickeyAuthTest, ParseNone)
{
	SSH::Serializer s;
	s.WriteString("git"sv);
	s.WriteString("ssh-connection"sv);
	s.WriteString("none"sv);

	const auto r = ParseUserauthRequest(s.Finish());
	EXPECT_EQ(r.user_name, "git"sv);
	EXPECT_EQ(r.service_name, "ssh-connection"sv);
	EXPECT_EQ(r.method_name, "none"sv);
	EXPECT_FALSE(r.publickey.with_signature);
	EXPECT_TRUE(r.publickey.blob.empty());
}

TEST_F(PublickeyAuthTest, ParseSigned)
{
	const auto payload = known.MakeRequest(session_id, true);
	const auto r = ParseUserauthRequest(payload);
	EXPECT_EQ(r.method_name, "publickey"sv);
	EXPECT_TRUE(r.publickey.with_signature);
	EXPECT_EQ(r.publickey.algorithm, "ssh-ed25519"sv);
	EXPECT_FALSE(r.publickey.signature.empty());

	/* the signed part ends right before the signature */
	EXPECT_EQ(r.publickey.signed_part.data(), payload.data());
	EXPECT_EQ(r.publickey.signed_part.size() + 4 + r.publickey.signature.size(),
		  payload.size());
}

TEST_F(PublickeyAuthTest, ParseTruncated)
{
	const auto payload = known.MakeRequest(session_id, true);
	const std::span<const std::byte> truncated{payload.data(), payload.size() - 1};
	EXPECT_THROW(ParseUserauthRequest(truncated), SSH::MalformedPacket);
}

TEST_F(PublickeyAuthTest, KnownSigned)
{
	const auto result = Check(known.MakeRequest(session_id, true));
	EXPECT_EQ(result.verdict, PublickeyVerdict::ACCEPTED);
	EXPECT_EQ(result.identity, "42"sv);
	ASSERT_TRUE(result.key);
	EXPECT_EQ(result.key->GetType(), "ssh-ed25519"sv);
}

TEST_F(PublickeyAuthTest, KnownQuery)
{
	const auto result = Check(known.MakeRequest(session_id, false));
	EXPECT_EQ(result.verdict, PublickeyVerdict::ACCEPTABLE);
	EXPECT_EQ(result.identity, "42"sv);
}

TEST_F(PublickeyAuthTest, UnknownKey)
{
	/* a perfectly valid signature from a key nobody knows */
	const auto result = Check(stranger.MakeRequest(session_id, true));
	EXPECT_EQ(result.verdict, PublickeyVerdict::REJECTED);
	EXPECT_TRUE(result.identity.empty());
	EXPECT_EQ(result.reason, "Unknown key"sv);

	const auto query = Check(stranger.MakeRequest(session_id, false));
	EXPECT_EQ(query.verdict, PublickeyVerdict::REJECTED);
}

TEST_F(PublickeyAuthTest, BadSignature)
{
	const auto result = Check(known.MakeRequest(session_id, true, true));
	EXPECT_EQ(result.verdict, PublickeyVerdict::REJECTED);
	EXPECT_TRUE(result.identity.empty());
}

TEST_F(PublickeyAuthTest, WrongSessionId)
{
	/* a signature replayed from another session */
	const auto other_session = AsBytes("fedcba9876543210fedcba9876543210"sv);
	const auto result = Check(known.MakeRequest(other_session, true));
	EXPECT_EQ(result.verdict, PublickeyVerdict::REJECTED);
}

TEST_F(PublickeyAuthTest, LookupError)
{
	ThrowingIdentityLookup throwing;
	const auto result = Check(throwing, known.MakeRequest(session_id, true));
	EXPECT_EQ(result.verdict, PublickeyVerdict::REJECTED);
	EXPECT_TRUE(result.identity.empty());
	EXPECT_TRUE(result.reason.starts_with("Identity lookup failed"sv));
}

TEST_F(PublickeyAuthTest, MalformedKey)
{
	SSH::Serializer s;
	s.WriteString("git"sv);
	s.WriteString("ssh-connection"sv);
	s.WriteString("publickey"sv);
	s.WriteBool(false);
	s.WriteString("ssh-ed25519"sv);
	s.WriteString("garbage"sv);

	const auto result = Check(s.Finish());
	EXPECT_EQ(result.verdict, PublickeyVerdict::REJECTED);
	EXPECT_FALSE(result.key);
}
