// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CommandLine.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <getopt.h>
#include <stdlib.h>

static void
PrintUsage(const char *program) noexcept
{
	fmt::print("Usage: {} [OPTIONS]\n"
		   "\n"
		   "Options:\n"
		   "  --config=PATH     load this configuration file\n"
		   "                    (default: {})\n"
		   "  -p, --port=PORT   the port to listen on and the host key suffix\n"
		   "                    (default: {})\n"
		   "  -v, --verbose     increase the log level\n"
		   "  -h, --help        show this help text\n",
		   program, GITGATE_DEFAULT_CONFIG_PATH, GITGATE_DEFAULT_PORT);
}

static unsigned
ParsePort(const char *s)
{
	char *endptr;
	const unsigned long value = strtoul(s, &endptr, 10);
	if (endptr == s || *endptr != 0 || value == 0 || value > 0xffff)
		throw std::runtime_error{fmt::format("Invalid port: {:?}", s)};

	return value;
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	enum Option {
		OPTION_CONFIG = 0x100,
	};

	static constexpr struct option long_options[] = {
		{"config", required_argument, nullptr, OPTION_CONFIG},
		{"port", required_argument, nullptr, 'p'},
		{"verbose", no_argument, nullptr, 'v'},
		{"help", no_argument, nullptr, 'h'},
		{nullptr, 0, nullptr, 0},
	};

	CommandLine cmdline;

	int ch;
	while ((ch = getopt_long(argc, argv, "p:vh",
				 long_options, nullptr)) != -1) {
		switch (ch) {
		case OPTION_CONFIG:
			cmdline.config_path = optarg;
			cmdline.explicit_config_path = true;
			break;

		case 'p':
			cmdline.port = ParsePort(optarg);
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'h':
			PrintUsage(argv[0]);
			exit(EXIT_SUCCESS);

		default:
			throw std::runtime_error{"Invalid command line; try --help"};
		}
	}

	if (optind < argc)
		throw std::runtime_error{"Too many arguments"};

	return cmdline;
}
