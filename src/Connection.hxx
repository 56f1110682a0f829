// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ssh/CConnection.hxx"
#include "event/CoarseTimerEvent.hxx"
#include "io/Logger.hxx"
#include "co/InvokeTask.hxx"
#include "co/Task.hxx"
#include "util/IntrusiveList.hxx"

#include <cstdint>
#include <memory>
#include <string>

struct Config;
class PublicKey;
struct SessionResult;
class Instance;
class Listener;
class SocketAddress;
class SpawnService;
template<class T> class AllocatedArray;

class Connection final
	: public AutoUnlinkIntrusiveListHook,
	  public SSH::CConnection
{
	/**
	 * After this number of failed USERAUTH_REQUESTs, the
	 * connection is closed.
	 */
	static constexpr unsigned MAX_AUTH_FAILURES = 6;

	/**
	 * What to send after a USERAUTH_REQUEST was processed.
	 */
	enum class AuthOutcome : uint_least8_t {
		/**
		 * The response (USERAUTH_SUCCESS or USERAUTH_PK_OK)
		 * has already been sent.
		 */
		DONE,

		/**
		 * Method "none": report the list of methods without
		 * counting a failure.
		 */
		LIST_METHODS,

		FAILED,
	};

	Instance &instance;

	Logger logger;

	/**
	 * This timer disconnects when the auth phase takes too long.
	 * At first, a very short duration is scheduled (10s) until
	 * encryption is established; when the first USERAUTH_REQUEST
	 * is received (#got_userauth_request), the timer is
	 * rescheduled, allowing some more time for the actual user
	 * auth.
	 */
	CoarseTimerEvent auth_timeout;

	/**
	 * The identity of the authenticated key (as returned by
	 * #IdentityLookup).  Empty until authentication succeeds.
	 */
	std::string key_id;

	/**
	 * If this is set, then the connection is currently occupied
	 * with an asynchronous operation (the identity lookup).
	 * Until it finishes, most incoming packets will cause the
	 * connection to be closed.
	 */
	Co::EagerInvokeTask occupied_task;

	unsigned n_auth_failures = 0;

	/**
	 * Has the reason for closing this connection not yet been
	 * logged?  Only the first one is interesting.
	 */
	bool log_disconnect = true;

	bool have_service_userauth = false;

	/**
	 * Tracks whether USERAUTH_REQUEST has been received already.
	 * This is used to reschedule #auth_timeout.
	 */
	bool got_userauth_request = false;

public:
	Connection(Instance &_instance,
		   UniqueSocketDescriptor fd, SocketAddress _peer_address);
	~Connection() noexcept;

	const auto &GetLogger() const noexcept {
		return logger;
	}

	[[gnu::const]]
	SpawnService &GetSpawnService() const noexcept;

	[[gnu::const]]
	const Config &GetConfig() const noexcept;

	std::string_view GetKeyId() const noexcept {
		return key_id;
	}

	/**
	 * Called by #SessionChannel when it is destroyed after an
	 * "exec" request.
	 */
	void OnSessionResult(const SessionResult &result) noexcept;

protected:
	void Destroy() noexcept override {
		delete this;
	}

private:
	bool IsOccupied() const noexcept {
		return occupied_task;
	}

	/**
	 * Log the reason why this connection is being closed, unless
	 * one was already logged.
	 */
	void LogClose(std::string_view reason) noexcept;
	void LogClose(std::exception_ptr error) noexcept;

	void HandleServiceRequest(std::span<const std::byte> payload);

	/**
	 * Send USERAUTH_FAILURE and count the failure.
	 *
	 * Throws #Disconnect if there were too many failures.
	 */
	void SendUserauthFailure();

	Co::Task<AuthOutcome> CoUserauth(std::span<const std::byte> payload);
	Co::EagerInvokeTask CoHandleUserauthRequest(AllocatedArray<std::byte> payload);

	/**
	 * Remember the identity and switch to the authenticated
	 * state.
	 */
	void AcceptIdentity(const PublicKey &key, std::string &&identity);
	void OnUserauthCompletion(std::exception_ptr error) noexcept;
	void HandleUserauthRequest(std::span<const std::byte> payload);

	void OnAuthTimeout() noexcept;

	/* virtual methods from class SSH::CConnection */
	std::unique_ptr<SSH::Channel> CreateChannel(std::string_view channel_type,
						    SSH::ChannelInit init,
						    std::span<const std::byte> payload) override;
	void OnGlobalRequest(std::string_view request_name) noexcept override;

	/* virtual methods from class SSH::Connection */
	void HandlePacket(SSH::MessageNumber msg,
			  std::span<const std::byte> payload) override;

	std::string_view GetServerHostKeyAlgorithms() const noexcept override;
	std::pair<const SecretKey *, std::string_view> ChooseHostKey(std::string_view algorithms) const noexcept override;
	std::string_view GetEncryptionAlgorithms() const noexcept override;
	std::string_view GetMacAlgorithms() const noexcept override;
	void OnDisconnecting(SSH::DisconnectReasonCode reason_code,
			     std::string_view msg) noexcept override;
	void OnDisconnected(SSH::DisconnectReasonCode reason_code,
			    std::string_view msg) noexcept override;

	/* virtual methods from class BufferedSocketHandler */
	void OnBufferedError(std::exception_ptr e) noexcept override;
};
