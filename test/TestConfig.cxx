// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Config.hxx"
#include "cipher/Factory.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>

#include <stdlib.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

TEST(FilterAlgorithms, Basic)
{
	std::forward_list<std::string> unsupported;

	EXPECT_EQ(FilterAlgorithms("aes256-ctr,3des-cbc,chacha20-poly1305@openssh.com"sv,
				   SSH::all_encryption_algorithms, unsupported),
		  "aes256-ctr,chacha20-poly1305@openssh.com");

	ASSERT_FALSE(unsupported.empty());
	EXPECT_EQ(unsupported.front(), "3des-cbc");
	EXPECT_EQ(std::distance(unsupported.begin(), unsupported.end()), 1);
}

TEST(FilterAlgorithms, Duplicates)
{
	std::forward_list<std::string> unsupported;

	EXPECT_EQ(FilterAlgorithms("hmac-sha2-256,,hmac-sha2-256"sv,
				   SSH::all_mac_algorithms, unsupported),
		  "hmac-sha2-256");
	EXPECT_TRUE(unsupported.empty());
}

TEST(FilterAlgorithms, NothingSupported)
{
	std::forward_list<std::string> unsupported;

	EXPECT_EQ(FilterAlgorithms("hmac-md5,hmac-sha1"sv,
				   SSH::all_mac_algorithms, unsupported),
		  "");
	EXPECT_EQ(std::distance(unsupported.begin(), unsupported.end()), 2);
}

class ConfigFileTest : public testing::Test {
protected:
	std::string path;

	void TearDown() override {
		if (!path.empty())
			unlink(path.c_str());
	}

	void Load(Config &config, std::string_view contents) {
		if (!path.empty())
			unlink(path.c_str());

		char tmpl[] = "/tmp/gitgate-conf-XXXXXX";
		const int fd = mkstemp(tmpl);
		ASSERT_GE(fd, 0);
		path = tmpl;

		ASSERT_EQ(write(fd, contents.data(), contents.size()),
			  ssize_t(contents.size()));
		close(fd);

		LoadConfigFile(config, path.c_str());
	}
};

TEST_F(ConfigFileTest, Defaults)
{
	Config config;
	EXPECT_EQ(config.port, 9393U);
	EXPECT_EQ(config.state_directory.native(), "/var/lib/gitgate");
	EXPECT_EQ(config.exec_timeout, std::chrono::seconds{3600});
	EXPECT_EQ(config.max_channels, 16U);
	EXPECT_EQ(config.ciphers, SSH::all_encryption_algorithms);
	EXPECT_TRUE(config.serv_command.empty());

	config.Check();

	/* a default listener was added */
	ASSERT_FALSE(config.listeners.empty());
	EXPECT_EQ(config.listeners.front().listen, 1024U);
	EXPECT_TRUE(config.listeners.front().keepalive);
	EXPECT_EQ(config.listeners.front().max_connections, 0U);
}

TEST_F(ConfigFileTest, Full)
{
	Config config;
	config.port = 2222;

	Load(config,
	     "# gitgate test configuration\n"
	     "state_directory \"/srv/gitgate\"\n"
	     "identity_file \"/srv/gitgate/identities\"\n"
	     "ciphers \"aes256-gcm@openssh.com,blowfish-cbc\"\n"
	     "exec_timeout 0\n"
	     "max_channels 4\n"
	     "serv_command \"/usr/lib/forge/forge-shell\"\n"
	     "serv_argument \"--config=/etc/forge.ini\"\n"
	     "\n"
	     "listener {\n"
	     "  bind \"127.0.0.1\"\n"
	     "  max_connections 100\n"
	     "  keepalive no\n"
	     "}\n");

	EXPECT_EQ(config.state_directory.native(), "/srv/gitgate");
	EXPECT_EQ(config.identity_file, "/srv/gitgate/identities");
	EXPECT_EQ(config.ciphers, "aes256-gcm@openssh.com");
	ASSERT_FALSE(config.unsupported_algorithms.empty());
	EXPECT_EQ(config.unsupported_algorithms.front(), "blowfish-cbc");
	EXPECT_EQ(config.exec_timeout, std::chrono::seconds{0});
	EXPECT_EQ(config.max_channels, 4U);
	EXPECT_EQ(config.serv_command, "/usr/lib/forge/forge-shell");
	EXPECT_EQ(config.serv_argument, "--config=/etc/forge.ini");

	ASSERT_FALSE(config.listeners.empty());
	const auto &listener = config.listeners.front();
	EXPECT_EQ(listener.max_connections, 100U);
	EXPECT_FALSE(listener.keepalive);
	EXPECT_EQ(listener.bind_address.GetPort(), 2222U);

	/* no default listener is added */
	config.Check();
	EXPECT_EQ(std::distance(config.listeners.begin(), config.listeners.end()), 1);
}

TEST_F(ConfigFileTest, UnknownOption)
{
	Config config;
	EXPECT_ANY_THROW(Load(config, "foo \"bar\"\n"));
}

TEST_F(ConfigFileTest, RelativePath)
{
	Config config;
	EXPECT_ANY_THROW(Load(config, "state_directory \"var/lib\"\n"));

	Config config2;
	EXPECT_ANY_THROW(Load(config2, "serv_command \"forge-shell\"\n"));
}

TEST_F(ConfigFileTest, TooManyChannels)
{
	Config config;
	EXPECT_ANY_THROW(Load(config, "max_channels 65\n"));
}

TEST_F(ConfigFileTest, ListenerWithoutBind)
{
	Config config;
	EXPECT_ANY_THROW(Load(config, "listener {\n  max_connections 1\n}\n"));
}

TEST_F(ConfigFileTest, NoCipher)
{
	Config config;
	Load(config, "ciphers \"3des-cbc\"\n");
	EXPECT_TRUE(config.ciphers.empty());
	EXPECT_THROW(config.Check(), std::runtime_error);
}

TEST_F(ConfigFileTest, MacRequired)
{
	Config config;
	Load(config, "ciphers \"aes128-ctr\"\nmacs \"hmac-md5\"\n");
	EXPECT_THROW(config.Check(), std::runtime_error);

	/* an AEAD cipher needs no MAC */
	Config config2;
	Load(config2, "ciphers \"aes128-gcm@openssh.com\"\nmacs \"hmac-md5\"\n");
	EXPECT_NO_THROW(config2.Check());
}

TEST(LoadOptionalConfigFile, Missing)
{
	Config config;
	EXPECT_FALSE(LoadOptionalConfigFile(config, "/nonexistent/gitgate.conf"));
}
