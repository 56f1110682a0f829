// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "identity/KeyFile.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include <stdio.h>
#include <stdlib.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static constexpr auto key1 =
	"ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAIAECAwQFBgcICQoLDA0ODxAREhMUFRYXGBkaGxwdHh8g"sv;
static constexpr auto key2 =
	"ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAAICEiIyQlJicoKSorLC0uLzAxMjM0NTY3ODk6Ozw9Pj9A"sv;

static std::string
MakeLine(std::string_view identity, std::string_view key,
	 std::string_view comment={})
{
	std::string result{identity};
	result.push_back(' ');
	result.append(key);
	if (!comment.empty()) {
		result.push_back(' ');
		result.append(comment);
	}
	result.push_back('\n');
	return result;
}

TEST(KeyFileIdentityLookup, Load)
{
	KeyFileIdentityLookup lookup;
	EXPECT_EQ(lookup.Load("# identities\n"
			      "\n" +
			      MakeLine("42", key1, "alice@laptop") +
			      MakeLine("bob", key2)),
		  0U);

	EXPECT_EQ(lookup.size(), 2U);
	EXPECT_EQ(lookup.Find(key1), "42"sv);
	EXPECT_EQ(lookup.Find(key2), "bob"sv);
	EXPECT_EQ(lookup.Find("ssh-ed25519 AAAA"sv), ""sv);
	EXPECT_EQ(lookup.Find(""sv), ""sv);
}

TEST(KeyFileIdentityLookup, Malformed)
{
	KeyFileIdentityLookup lookup;
	EXPECT_EQ(lookup.Load(MakeLine("42", key1) +
			      "43\n"
			      "44 ssh-ed25519\n"
			      "45 ssh-rsa " + std::string{key1.substr(12)} + "\n"
			      "4/6 " + std::string{key2} + "\n"
			      "47 ssh-ed25519 !!!!\n"),
		  5U);

	EXPECT_EQ(lookup.size(), 1U);
	EXPECT_EQ(lookup.Find(key1), "42"sv);
	EXPECT_EQ(lookup.Find(key2), ""sv);
}

TEST(KeyFileIdentityLookup, Replace)
{
	KeyFileIdentityLookup lookup;
	lookup.Load(MakeLine("42", key1));
	EXPECT_EQ(lookup.Find(key1), "42"sv);

	lookup.Load(MakeLine("43", key2));
	EXPECT_EQ(lookup.size(), 1U);
	EXPECT_EQ(lookup.Find(key1), ""sv);
	EXPECT_EQ(lookup.Find(key2), "43"sv);
}

TEST(KeyFileIdentityLookup, Reload)
{
	char path[] = "/tmp/gitgate-identities-XXXXXX";
	const int fd = mkstemp(path);
	ASSERT_GE(fd, 0);

	const auto contents = MakeLine("42", key1) + "garbage\n" +
		MakeLine("43", key2);
	ASSERT_EQ(write(fd, contents.data(), contents.size()),
		  ssize_t(contents.size()));
	close(fd);

	KeyFileIdentityLookup lookup{path};
	EXPECT_EQ(lookup.Reload(), 1U);
	EXPECT_EQ(lookup.size(), 2U);
	EXPECT_EQ(lookup.Find(key2), "43"sv);

	/* if the file disappears, the old keys are kept */
	unlink(path);
	EXPECT_ANY_THROW(lookup.Reload());
	EXPECT_EQ(lookup.size(), 2U);
	EXPECT_EQ(lookup.Find(key1), "42"sv);
}
