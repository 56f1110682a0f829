// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "identity/KeyFile.hxx"
#include "event/Loop.hxx"
#include "event/ShutdownListener.hxx"
#include "event/SignalEvent.hxx"
#include "io/Logger.hxx"

#include <forward_list>
#include <memory>

struct Config;
struct ListenerConfig;
class SecretKey;
class UniqueSocketDescriptor;
class Listener;
class SpawnService;
class SpawnServerClient;

class Instance final {
	const RootLogger logger;

	const Config &config;

	const std::unique_ptr<SecretKey> host_key;

	KeyFileIdentityLookup identity_lookup;

	EventLoop event_loop;

	bool should_exit = false;

	ShutdownListener shutdown_listener{event_loop, BIND_THIS_METHOD(OnExit)};
	SignalEvent sighup_event{event_loop, SIGHUP, BIND_THIS_METHOD(OnReload)};

	std::forward_list<Listener> listeners;

	std::unique_ptr<SpawnServerClient> spawn_service;

public:
	/**
	 * Throws if the identity file cannot be loaded.
	 *
	 * @param _config must outlive this object
	 */
	Instance(const Config &_config,
		 std::unique_ptr<SecretKey> _host_key,
		 UniqueSocketDescriptor spawner_socket);
	~Instance() noexcept;

	const RootLogger &GetLogger() const noexcept {
		return logger;
	}

	const Config &GetConfig() const noexcept {
		return config;
	}

	const SecretKey &GetHostKey() const noexcept {
		return *host_key;
	}

	IdentityLookup &GetIdentityLookup() noexcept {
		return identity_lookup;
	}

	auto &GetEventLoop() noexcept {
		return event_loop;
	}

	[[gnu::const]]
	SpawnService &GetSpawnService() const noexcept;

	/**
	 * Throws on error.
	 */
	void AddListener(const ListenerConfig &config);

	void Run() noexcept {
		event_loop.Run();
	}

private:
	/**
	 * Reload the identity file.  Throws on error (and keeps the
	 * old identities).
	 */
	void LoadIdentities();

	void OnExit() noexcept;
	void OnReload(int) noexcept;
};
