// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Config.hxx"

struct CommandLine {
	/**
	 * The configuration file passed with "--config".  If none
	 * was given, this is the default path, which may be missing.
	 */
	const char *config_path = GITGATE_DEFAULT_CONFIG_PATH;

	bool explicit_config_path = false;

	unsigned port = GITGATE_DEFAULT_PORT;

	/**
	 * The log level; each "-v" increments it.
	 */
	unsigned verbose = 1;
};

/**
 * Parse the command line.  Exits the process after "--help".
 *
 * Throws on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
