// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Config.hxx"
#include "ssh/KexProposal.hxx"
#include "cipher/Factory.hxx"
#include "spawn/ConfigParser.hxx"
#include "lib/fmt/SystemError.hxx"
#include "net/IPv6Address.hxx"
#include "net/Parser.hxx"
#include "io/config/FileLineParser.hxx"
#include "io/config/ConfigParser.hxx"
#include "ssh/CConnection.hxx" // for MAX_CHANNELS
#include "util/IterableSplitString.hxx"
#include "util/StringAPI.hxx"
#include "config.h"

#include <stdexcept>

#include <stdlib.h> // for strtoul()
#include <sys/stat.h>

Config::Config()
	:ciphers(SSH::all_encryption_algorithms),
	 macs(SSH::all_mac_algorithms)
{
	/* child processes run with our own effective uid/gid; the
	   spawner must accept that */
	spawn.default_uid_gid.LoadEffective();
	spawn.allow_any_uid_gid = true;

#ifdef HAVE_LIBSYSTEMD
	spawn.systemd_scope = "gitgate-spawn.scope";
	spawn.systemd_scope_description = "The GitGate child process spawner";
	spawn.systemd_slice = "system-cm4all.slice";
#endif
}

void
Config::Check()
{
	if (listeners.empty()) {
		listeners.emplace_front();
		auto &l = listeners.front();
		l.bind_address = IPv6Address{static_cast<uint16_t>(port)};
		l.listen = 1024;
		l.tcp_user_timeout = 60000;
		l.keepalive = true;
	}

	if (ciphers.empty())
		throw std::runtime_error{"No supported cipher configured"};

	bool need_mac = false;
	for (const std::string_view i : IterableSplitString(ciphers, ','))
		if (!SSH::IsAuthenticatedEncryption(i))
			need_mac = true;

	if (need_mac && macs.empty())
		throw std::runtime_error{"No supported MAC configured"};
}

std::string
FilterAlgorithms(std::string_view configured, std::string_view supported,
		 std::forward_list<std::string> &unsupported)
{
	std::string result;

	for (const std::string_view name : IterableSplitString(configured, ',')) {
		if (name.empty())
			continue;

		if (!SSH::NameListContains(supported, name)) {
			unsupported.emplace_front(name);
			continue;
		}

		if (SSH::NameListContains(result, name))
			continue;

		if (!result.empty())
			result.push_back(',');
		result.append(name);
	}

	return result;
}

/**
 * Parse a non-negative decimal integer.
 */
static unsigned long
ParseUnsigned(const char *s)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || *s == '-')
		throw LineParser::Error{"Not a valid number"};

	return value;
}

class GitGateConfigParser final : public NestedConfigParser {
	Config &config;

	class Listener final : public ConfigParser {
		Config &parent;
		ListenerConfig config;

	public:
		explicit Listener(Config &_parent) noexcept:parent(_parent) {}

	protected:
		/* virtual methods from class ConfigParser */
		void ParseLine(FileLineParser &line) override;
		void Finish() override;
	};

public:
	explicit GitGateConfigParser(Config &_config) noexcept
		:config(_config) {}

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(FileLineParser &line) override;
};

/**
 * Listener options which take a boolean value.
 */
static constexpr struct {
	const char *name;
	bool ListenerConfig::*value;
} listener_flags[] = {
	{"keepalive", &ListenerConfig::keepalive},
	{"v6only", &ListenerConfig::v6only},
	{"reuse_port", &ListenerConfig::reuse_port},
};

void
GitGateConfigParser::Listener::ParseLine(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	for (const auto &i : listener_flags) {
		if (StringIsEqual(word, i.name)) {
			config.*i.value = line.NextBool();
			line.ExpectEnd();
			return;
		}
	}

	if (StringIsEqual(word, "bind")) {
		config.bind_address = ParseSocketAddress(line.ExpectValueAndEnd(),
							 parent.port, true);
	} else if (StringIsEqual(word, "interface")) {
		config.interface = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "max_connections")) {
		config.max_connections = line.NextPositiveInteger();
		line.ExpectEnd();
	} else if (StringIsEqual(word, "ack_timeout")) {
		/* seconds */
		config.tcp_user_timeout = line.NextPositiveInteger() * 1000;
		line.ExpectEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
GitGateConfigParser::Listener::Finish()
{
	if (config.bind_address.IsNull())
		throw LineParser::Error("Listener has no bind address");

	config.Fixup();

	parent.listeners.emplace_front(std::move(config));

	ConfigParser::Finish();
}

void
GitGateConfigParser::ParseLine2(FileLineParser &line)
{
	const char *word = line.ExpectWord();

	if (StringIsEqual(word, "listener")) {
		line.ExpectSymbolAndEol('{');
		SetChild(std::make_unique<Listener>(config));
	} else if (StringIsEqual(word, "spawn")) {
		line.ExpectSymbolAndEol('{');
		SetChild(std::make_unique<SpawnConfigParser>(config.spawn));
	} else if (StringIsEqual(word, "state_directory")) {
		const char *value = line.ExpectValueAndEnd();
		if (*value != '/')
			throw LineParser::Error{"Absolute path expected"};

		config.state_directory = value;
	} else if (StringIsEqual(word, "identity_file")) {
		config.identity_file = line.ExpectValueAndEnd();
	} else if (StringIsEqual(word, "ciphers")) {
		config.ciphers = FilterAlgorithms(line.ExpectValueAndEnd(),
						  SSH::all_encryption_algorithms,
						  config.unsupported_algorithms);
	} else if (StringIsEqual(word, "macs")) {
		config.macs = FilterAlgorithms(line.ExpectValueAndEnd(),
					       SSH::all_mac_algorithms,
					       config.unsupported_algorithms);
	} else if (StringIsEqual(word, "exec_timeout")) {
		config.exec_timeout = std::chrono::seconds{ParseUnsigned(line.ExpectValueAndEnd())};
	} else if (StringIsEqual(word, "max_channels")) {
		const std::size_t value = line.NextPositiveInteger();
		line.ExpectEnd();

		if (value > SSH::CConnection::MAX_CHANNELS)
			throw LineParser::Error{"max_channels is too large"};

		config.max_channels = value;
	} else if (StringIsEqual(word, "serv_command")) {
		const char *value = line.ExpectValueAndEnd();
		if (*value != '/')
			throw LineParser::Error{"Absolute path expected"};

		config.serv_command = value;
	} else if (StringIsEqual(word, "serv_argument")) {
		config.serv_argument = line.ExpectValueAndEnd();
	} else
		throw LineParser::Error("Unknown option");
}

void
LoadConfigFile(Config &config, const char *path)
{
	GitGateConfigParser parser(config);
	VariableConfigParser v_parser(parser);
	CommentConfigParser parser2(v_parser);
	IncludeConfigParser parser3(path, parser2);

	ParseConfigFile(path, parser3);
}

bool
LoadOptionalConfigFile(Config &config, const char *path)
{
	struct stat st;
	if (stat(path, &st) < 0) {
		if (const int e = errno; e == ENOENT)
			return false;
		else
			throw FmtErrno(e, "Failed to access {:?}", path);
	}

	LoadConfigFile(config, path);
	return true;
}
