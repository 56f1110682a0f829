// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "key/AuthorizedKey.hxx"
#include "key/Ed25519Key.hxx"
#include "ssh/Serializer.hxx"
#include "memory/fb_pool.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>

using std::string_view_literals::operator""sv;

/* "ssh-ed25519" key blob with the public key 0x01..0x20 */
static constexpr auto ed25519_base64 =
	"AAAAC3NzaC1lZDI1NTE5AAAAIAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8g"sv;

static std::array<std::byte, 32>
MakeTestPublicKey() noexcept
{
	std::array<std::byte, 32> result;
	for (std::size_t i = 0; i < result.size(); ++i)
		result[i] = static_cast<std::byte>(i + 1);
	return result;
}

class AuthorizedKeyTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(AuthorizedKeyTest, Format)
{
	const Ed25519Key key{MakeTestPublicKey()};

	SSH::Serializer s;
	key.SerializePublic(s);

	const auto text = FormatAuthorizedKey(s.Finish());
	EXPECT_EQ(text, std::string{"ssh-ed25519 "} + std::string{ed25519_base64});
}

TEST_F(AuthorizedKeyTest, Canonicalize)
{
	EXPECT_EQ(CanonicalizeAuthorizedKey("ssh-ed25519"sv, ed25519_base64),
		  std::string{"ssh-ed25519 "} + std::string{ed25519_base64});
}

TEST_F(AuthorizedKeyTest, TypeMismatch)
{
	EXPECT_THROW(CanonicalizeAuthorizedKey("ssh-rsa"sv, ed25519_base64),
		     std::invalid_argument);
}

TEST_F(AuthorizedKeyTest, Malformed)
{
	EXPECT_THROW(CanonicalizeAuthorizedKey("ssh-ed25519"sv, "not base64!"sv),
		     std::invalid_argument);

	/* valid base64, but the blob is too short for a string */
	EXPECT_THROW(CanonicalizeAuthorizedKey("ssh-ed25519"sv, "AAAA"sv),
		     std::invalid_argument);

	static constexpr std::array<std::byte, 2> garbage{};
	EXPECT_THROW(FormatAuthorizedKey(garbage), std::invalid_argument);
}
