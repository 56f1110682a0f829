// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "spawn/Config.hxx"
#include "net/SocketConfig.hxx"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <forward_list>
#include <string>
#include <string_view>

static constexpr unsigned GITGATE_DEFAULT_PORT = 9393;

static constexpr const char *GITGATE_DEFAULT_CONFIG_PATH =
	"/etc/cm4all/gitgate/gitgate.conf";

struct ListenerConfig : SocketConfig {
	/**
	 * Reject new connections with TOO_MANY_CONNECTIONS if this
	 * many are already established.  Zero means unlimited.
	 */
	std::size_t max_connections = 0;

	ListenerConfig() noexcept {
		listen = 256;
		tcp_no_delay = true;
	}
};

struct Config {
	/**
	 * The port passed on the command line.  It is the default
	 * port for "bind" and it is part of the host key path.
	 */
	unsigned port = GITGATE_DEFAULT_PORT;

	std::filesystem::path state_directory{"/var/lib/gitgate"};

	/**
	 * The file which maps public keys to identities.  Empty means
	 * no key is accepted.
	 */
	std::string identity_file{"/etc/cm4all/gitgate/identities"};

	/**
	 * Comma-separated lists of encryption and MAC algorithms,
	 * already filtered by FilterAlgorithms().
	 */
	std::string ciphers, macs;

	/**
	 * Configured algorithm names which are not supported; they
	 * have been removed from #ciphers and #macs and are only
	 * kept here to be logged.
	 */
	std::forward_list<std::string> unsupported_algorithms;

	/**
	 * Child processes are sent SIGTERM after this duration.  Zero
	 * disables the deadline.
	 */
	std::chrono::seconds exec_timeout{3600};

	std::size_t max_channels = 16;

	/**
	 * If not empty, then this trusted program is executed instead
	 * of the requested command.
	 */
	std::string serv_command;

	/**
	 * An optional extra argument for #serv_command.
	 */
	std::string serv_argument;

	std::forward_list<ListenerConfig> listeners;

	SpawnConfig spawn;

	Config();

	void Check();
};

/**
 * Remove all names from the comma-separated list #configured which
 * are not contained in #supported (and duplicates).  Removed names
 * are added to #unsupported.
 *
 * @return a comma-separated list (which may be empty)
 */
std::string
FilterAlgorithms(std::string_view configured, std::string_view supported,
		 std::forward_list<std::string> &unsupported);

/**
 * Load and parse the specified configuration file.  Throws an
 * exception on error.
 */
void
LoadConfigFile(Config &config, const char *path);

/**
 * Like LoadConfigFile(), but a file which does not exist is not an
 * error.
 *
 * @return false if the file does not exist
 */
bool
LoadOptionalConfigFile(Config &config, const char *path);
