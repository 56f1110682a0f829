// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "Config.hxx"
#include "HostKey.hxx"
#include "key/Key.hxx"
#include "memory/fb_pool.hxx"
#include "spawn/Launch.hxx"
#include "system/ProcessName.hxx"
#include "system/SetupProcess.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"
#include "config.h"

#ifdef HAVE_LIBSYSTEMD
#include <systemd/sd-daemon.h>
#endif

#include <memory>

#include <stdlib.h>

static Config
LoadConfig(const CommandLine &cmdline)
{
	Config config;
	config.port = cmdline.port;

	/* the default path may be missing; an explicit one may
	   not */
	if (cmdline.explicit_config_path)
		LoadConfigFile(config, cmdline.config_path);
	else
		LoadOptionalConfigFile(config, cmdline.config_path);

	config.Check();
	return config;
}

static std::unique_ptr<SecretKey>
LoadHostKey(const Config &config)
{
	const auto path = MakeHostKeyPath(config.state_directory, config.port);
	auto result = LoadOrGenerateHostKey(path);
	if (result.generated) {
		const RootLogger logger;
		logger.Fmt(1, "Generated new host key {:?}", path.native());
	}

	return std::move(result.key);
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);

	InitProcessName(argc, argv);
	SetLogLevel(cmdline.verbose);

	const auto config = LoadConfig(cmdline);
	auto host_key = LoadHostKey(config);

	SetupProcess();

	/* fork the spawner before the event loop exists */
	auto spawner_socket = LaunchSpawnServer(config.spawn, nullptr);

	const ScopeFbPoolInit fb_pool_init;

	Instance instance{config, std::move(host_key), std::move(spawner_socket)};

	for (const auto &i : config.listeners)
		instance.AddListener(i);

#ifdef HAVE_LIBSYSTEMD
	sd_notify(0, "READY=1");
#endif

	instance.Run();
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
