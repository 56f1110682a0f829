// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ssh/ParsePacket.hxx"
#include "ssh/Serializer.hxx"
#include "memory/fb_pool.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

class ParsePacketTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(ParsePacketTest, Env)
{
	SSH::Serializer s;
	s.WriteString("GIT_PROTOCOL"sv);
	s.WriteString("version=2"sv);

	const auto p = SSH::ParseEnvRequest(s.Finish());
	EXPECT_EQ(p.name, "GIT_PROTOCOL"sv);
	EXPECT_EQ(p.value, "version=2"sv);
}

TEST_F(ParsePacketTest, EnvEmptyValue)
{
	/* syntactically valid; the channel refuses it */
	SSH::Serializer s;
	s.WriteString("LANG"sv);
	s.WriteString(""sv);

	const auto p = SSH::ParseEnvRequest(s.Finish());
	EXPECT_EQ(p.name, "LANG"sv);
	EXPECT_TRUE(p.value.empty());
}

TEST_F(ParsePacketTest, EnvMalformed)
{
	SSH::Serializer s;
	s.WriteString("LANG"sv);
	EXPECT_THROW(SSH::ParseEnvRequest(s.Finish()), SSH::MalformedPacket);

	SSH::Serializer s2;
	s2.WriteString("LANG"sv);
	s2.WriteString("C"sv);
	s2.WriteU8(0);
	EXPECT_THROW(SSH::ParseEnvRequest(s2.Finish()), SSH::MalformedPacket);
}

TEST_F(ParsePacketTest, Exec)
{
	SSH::Serializer s;
	s.WriteString("git-receive-pack 'foo.git'"sv);

	const auto p = SSH::ParseExecRequest(s.Finish());
	EXPECT_EQ(p.command, "git-receive-pack 'foo.git'"sv);
}

TEST_F(ParsePacketTest, ExecMalformed)
{
	EXPECT_THROW(SSH::ParseExecRequest({}), SSH::MalformedPacket);

	SSH::Serializer s;
	s.WriteU32(100);
	s.WriteString("short"sv);
	EXPECT_THROW(SSH::ParseExecRequest(s.Finish()), SSH::MalformedPacket);
}

TEST_F(ParsePacketTest, ChannelRequest)
{
	SSH::Serializer s;
	s.WriteU32(5);
	s.WriteString("exec"sv);
	s.WriteBool(true);
	s.WriteString("cat /tmp/x"sv);

	const auto p = SSH::ParseChannelRequest(s.Finish());
	EXPECT_EQ(p.local_channel, 5U);
	EXPECT_EQ(p.request_type, "exec"sv);
	EXPECT_TRUE(p.want_reply);
	EXPECT_EQ(SSH::ParseExecRequest(p.type_specific_data).command,
		  "cat /tmp/x"sv);
}
