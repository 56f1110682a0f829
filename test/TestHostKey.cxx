// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "HostKey.hxx"
#include "key/Key.hxx"
#include "ssh/Serializer.hxx"
#include "memory/fb_pool.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>

#include <stdlib.h>
#include <sys/stat.h>

using std::string_view_literals::operator""sv;

static std::string
SerializePublicBlob(const PublicKey &key)
{
	SSH::Serializer s;
	key.SerializePublic(s);
	return std::string{ToStringView(s.Finish())};
}

class HostKeyTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;

protected:
	std::filesystem::path state_directory;

	void SetUp() override {
		char tmpl[] = "/tmp/gitgate-state-XXXXXX";
		ASSERT_NE(mkdtemp(tmpl), nullptr);
		state_directory = tmpl;
	}

	void TearDown() override {
		std::filesystem::remove_all(state_directory);
	}
};

TEST(HostKeyPath, Format)
{
	EXPECT_EQ(MakeHostKeyPath("/var/lib/gitgate", 9393).native(),
		  "/var/lib/gitgate/ssh/gitgate_9393.rsa");
	EXPECT_EQ(MakeHostKeyPath("/srv/state/", 22).native(),
		  "/srv/state/ssh/gitgate_22.rsa");
}

TEST_F(HostKeyTest, GenerateAndReload)
{
	const auto path = MakeHostKeyPath(state_directory, 2222);

	auto first = LoadOrGenerateHostKey(path);
	ASSERT_TRUE(first.key);
	EXPECT_TRUE(first.generated);
	EXPECT_EQ(first.key->GetType(), "ssh-rsa"sv);

	struct stat st;
	ASSERT_EQ(stat(path.c_str(), &st), 0);
	EXPECT_TRUE(S_ISREG(st.st_mode));
	EXPECT_EQ(st.st_mode & 0777, 0600U);

	/* no temporary file is left behind */
	std::size_t n_files = 0;
	for ([[maybe_unused]] const auto &i : std::filesystem::directory_iterator{path.parent_path()})
		++n_files;
	EXPECT_EQ(n_files, 1U);

	auto second = LoadOrGenerateHostKey(path);
	ASSERT_TRUE(second.key);
	EXPECT_FALSE(second.generated);
	EXPECT_EQ(SerializePublicBlob(*first.key),
		  SerializePublicBlob(*second.key));

	/* the reloaded key can sign */
	const auto message = AsBytes("hello"sv);
	SSH::Serializer s;
	second.key->Sign(s, message, "rsa-sha2-256"sv);
	EXPECT_TRUE(first.key->Verify(message, s.Finish()));
}

TEST_F(HostKeyTest, Corrupt)
{
	const auto path = MakeHostKeyPath(state_directory, 2222);
	std::filesystem::create_directories(path.parent_path());

	std::ofstream{path} << "this is not a key\n";

	EXPECT_ANY_THROW(LoadOrGenerateHostKey(path));
}
