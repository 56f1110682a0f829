// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Instance.hxx"
#include "Config.hxx"
#include "Listener.hxx"
#include "key/Key.hxx"
#include "spawn/Client.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/SocketAddressFormatter.hxx"
#include "net/SocketConfig.hxx"
#include "net/UniqueSocketDescriptor.hxx"

#include <fmt/core.h>

#include <signal.h>

Instance::Instance(const Config &_config,
		   std::unique_ptr<SecretKey> _host_key,
		   UniqueSocketDescriptor spawner_socket)
	:config(_config),
	 host_key(std::move(_host_key)),
	 identity_lookup(config.identity_file),
	 spawn_service(new SpawnServerClient(event_loop,
					     config.spawn,
					     std::move(spawner_socket),
					     false))
{
	for (const auto &i : config.unsupported_algorithms)
		logger.Fmt(1, "Ignoring unsupported algorithm {:?}", i);

	LoadIdentities();

	shutdown_listener.Enable();
	sighup_event.Enable();
}

Instance::~Instance() noexcept = default;

SpawnService &
Instance::GetSpawnService() const noexcept
{
	return *spawn_service;
}

void
Instance::AddListener(const ListenerConfig &listener_config)
{
	listeners.emplace_front(*this, listener_config);

	logger.Fmt(1, "Listening on {}", listener_config.bind_address);
}

void
Instance::LoadIdentities()
{
	const std::size_t n_malformed = identity_lookup.Reload();
	if (n_malformed > 0)
		logger.Fmt(1, "Skipped {} malformed lines in {:?}",
			   n_malformed, config.identity_file);

	logger.Fmt(1, "Loaded {} identities", identity_lookup.size());
}

void
Instance::OnExit() noexcept
{
	if (should_exit)
		return;

	should_exit = true;

	shutdown_listener.Disable();
	sighup_event.Disable();

	spawn_service->Shutdown();

	listeners.clear();
}

void
Instance::OnReload(int) noexcept
{
	try {
		LoadIdentities();
	} catch (...) {
		logger.Fmt(1, "Failed to reload identities: {}",
			   std::current_exception());
	}
}
