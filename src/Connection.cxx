// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Connection.hxx"
#include "Instance.hxx"
#include "Config.hxx"
#include "SessionChannel.hxx"
#include "SessionResult.hxx"
#include "PublickeyAuth.hxx"
#include "identity/Lookup.hxx"
#include "key/Fingerprint.hxx"
#include "key/Key.hxx"
#include "ssh/Protocol.hxx"
#include "ssh/MakePacket.hxx"
#include "ssh/ParsePacket.hxx"
#include "ssh/Channel.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "event/co/Sleep.hxx"
#include "net/SocketAddress.hxx"
#include "net/ToString.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "co/InvokeTask.hxx"
#include "co/Task.hxx"
#include "util/AllocatedArray.hxx"

#include <fmt/core.h>

#include <cassert>
#include <utility> // for std::exchange()

using std::string_view_literals::operator""sv;

/**
 * The only authentication method we offer.
 */
static constexpr std::string_view auth_methods = "publickey"sv;

Connection::Connection(Instance &_instance,
		       UniqueSocketDescriptor _fd, SocketAddress _peer_address)
	:SSH::CConnection(_instance.GetEventLoop(), std::move(_fd),
			  _instance.GetConfig().max_channels),
	 instance(_instance),
	 logger(StringLoggerDomain{ToString(_peer_address)}),
	 auth_timeout(_instance.GetEventLoop(), BIND_THIS_METHOD(OnAuthTimeout))
{
	auth_timeout.Schedule(std::chrono::seconds{10});

	logger(2, "Connected");
}

Connection::~Connection() noexcept
{
	/* delete the channels now, because they report their results
	   to this object */
	DestroyChannels();

	if (log_disconnect)
		logger(1, "Disconnected");
}

SpawnService &
Connection::GetSpawnService() const noexcept
{
	return instance.GetSpawnService();
}

const Config &
Connection::GetConfig() const noexcept
{
	return instance.GetConfig();
}

void
Connection::OnSessionResult(const SessionResult &result) noexcept
{
	if (result.outcome == SessionResult::Outcome::ABORTED)
		logger.Fmt(1, "Session {:?}: {} ({}) in={} out={}"sv,
			   result.command, ToString(result.outcome),
			   result.error, result.bytes_in, result.bytes_out);
	else
		logger.Fmt(1, "Session {:?}: {} status={} in={} out={}{}{}"sv,
			   result.command, ToString(result.outcome),
			   result.status, result.bytes_in, result.bytes_out,
			   result.error.empty() ? ""sv : " error="sv,
			   result.error);
}

std::unique_ptr<SSH::Channel>
Connection::CreateChannel(std::string_view channel_type,
			  SSH::ChannelInit init,
			  std::span<const std::byte> payload)
{
	logger.Fmt(2, "ChannelOpen type={:?} local_channel={} peer_channel={}"sv,
		   channel_type, init.local_channel, init.peer_channel);

	if (channel_type == "session"sv) {
		return std::make_unique<SessionChannel>(*this, init);
	} else
		return SSH::CConnection::CreateChannel(channel_type, init, payload);
}

void
Connection::OnGlobalRequest(std::string_view request_name) noexcept
{
	logger.Fmt(2, "Ignoring global request {:?}"sv, request_name);
}

inline void
Connection::HandleServiceRequest(std::span<const std::byte> payload)
{
	const auto p = SSH::ParseServiceRequest(payload);

	if (p.service_name == "ssh-userauth"sv) {
		have_service_userauth = true;
		SendPacket(SSH::MakeServiceAccept(p.service_name));
	} else {
		throw Disconnect{SSH::DisconnectReasonCode::SERVICE_NOT_AVAILABLE,
			"Unsupported service"sv};
	}
}

void
Connection::LogClose(std::string_view reason) noexcept
{
	if (log_disconnect) {
		log_disconnect = false;
		logger(1, reason);
	}
}

void
Connection::LogClose(std::exception_ptr error) noexcept
{
	if (log_disconnect) {
		log_disconnect = false;
		logger(1, error);
	}
}

void
Connection::SendUserauthFailure()
{
	if (++n_auth_failures >= MAX_AUTH_FAILURES) {
		LogClose("Too many authentication failures"sv);
		throw Disconnect{
			SSH::DisconnectReasonCode::NO_MORE_AUTH_METHODS_AVAILABLE,
			"Too many authentication failures"sv,
		};
	}

	SendPacket(SSH::MakeUserauthFailure(auth_methods, false));
}

inline void
Connection::AcceptIdentity(const PublicKey &key, std::string &&identity)
{
	assert(!identity.empty());

	key_id = std::move(identity);

	logger.Fmt(1, "Accepted publickey {} {} for key {:?}"sv,
		   key.GetType(), GetFingerprint(key), key_id);

	/* from now on, all log messages carry the key-id */
	logger = Logger{fmt::format("{} key={}", logger.GetDomain(), key_id)};

	auth_timeout.Cancel();
	SetAuthenticated();
}

Co::Task<Connection::AuthOutcome>
Connection::CoUserauth(std::span<const std::byte> payload)
{
	const auto r = ParseUserauthRequest(payload);

	logger.Fmt(2, "Userauth {:?} service={:?} method={:?}"sv,
		   r.user_name, r.service_name, r.method_name);

	if (r.service_name != "ssh-connection"sv)
		co_return AuthOutcome::FAILED;

	if (r.method_name == "none"sv)
		co_return AuthOutcome::LIST_METHODS;

	if (r.method_name != "publickey"sv)
		co_return AuthOutcome::FAILED;

	const auto &p = r.publickey;
	logger.Fmt(2, "  public_key_algorithm={:?} signed={}"sv,
		   p.algorithm, p.with_signature);

	auto result = co_await CheckPublickey(instance.GetIdentityLookup(),
					      GetSessionId(), p);

	switch (result.verdict) {
	case PublickeyVerdict::ACCEPTED:
		AcceptIdentity(*result.key, std::move(result.identity));
		SendPacket(SSH::PacketSerializer{SSH::MessageNumber::USERAUTH_SUCCESS});
		break;

	case PublickeyVerdict::ACCEPTABLE:
		/* the client is now expected to repeat the request
		   with a signature */
		SendPacket(SSH::MakeUserauthPkOk(p.algorithm, p.blob));
		break;

	case PublickeyVerdict::REJECTED:
		if (result.key)
			logger.Fmt(p.with_signature ? 1 : 2, "Rejected publickey {} {}: {}"sv,
				   result.key->GetType(), GetFingerprint(*result.key),
				   result.reason);
		else
			logger.Fmt(1, "Rejected publickey: {}"sv, result.reason);

		co_return AuthOutcome::FAILED;
	}

	co_return AuthOutcome::DONE;
}

inline Co::EagerInvokeTask
Connection::CoHandleUserauthRequest(AllocatedArray<std::byte> payload)
{
	assert(!IsAuthenticated());

	/* all failure responses are delayed until 100ms have elapsed
	   since the USERAUTH_REQUEST was received, to make timing
	   guesses harder */
	Co::LazySleep fail_sleep{GetEventLoop(), std::chrono::milliseconds{100}};

	switch (co_await CoUserauth(payload)) {
	case AuthOutcome::DONE:
		break;

	case AuthOutcome::LIST_METHODS:
		co_await fail_sleep;
		SendPacket(SSH::MakeUserauthFailure(auth_methods, false));
		break;

	case AuthOutcome::FAILED:
		co_await fail_sleep;
		SendUserauthFailure();
		break;
	}
}

inline void
Connection::OnUserauthCompletion(std::exception_ptr error) noexcept
{
	if (!error)
		return;

	try {
		std::rethrow_exception(error);
	} catch (const Disconnect &d) {
		DoDisconnect(d.reason_code, d.msg);
	} catch (...) {
		CloseError(std::move(error));
	}
}

inline void
Connection::HandleUserauthRequest(std::span<const std::byte> payload)
{
	assert(!occupied_task);

	/* RFC 4252 section 5.1: requests after USERAUTH_SUCCESS
	   SHOULD be ignored */
	if (IsAuthenticated())
		return;

	if (!have_service_userauth)
		throw Disconnect{
			SSH::DisconnectReasonCode::PROTOCOL_ERROR,
			"Service ssh-userauth not requested"sv
		};

	/* the short pre-auth timeout becomes the long one once the
	   client has started authenticating */
	if (!std::exchange(got_userauth_request, true))
		auth_timeout.Schedule(std::chrono::minutes{2});

	/* the coroutine gets its own copy of the payload because it
	   may outlive the input buffer; it is eager so errors
	   thrown before the first suspension propagate to our
	   caller */
	occupied_task = CoHandleUserauthRequest(AllocatedArray{payload});
	occupied_task.Start(BIND_THIS_METHOD(OnUserauthCompletion));
}

/**
 * May this message arrive while a USERAUTH_REQUEST is still being
 * processed?  These are the generic transport messages (DISCONNECT
 * to DEBUG) and the key exchange range 20-49 (RFC 4250 section
 * 4.1.2).
 */
[[gnu::const]]
static constexpr bool
IsAsyncTransportMessage(SSH::MessageNumber msg) noexcept
{
	const auto n = static_cast<uint_least8_t>(msg);
	return n <= static_cast<uint_least8_t>(SSH::MessageNumber::DEBUG) ||
		(n >= static_cast<uint_least8_t>(SSH::MessageNumber::KEXINIT) &&
		 n < 50);
}

void
Connection::HandlePacket(SSH::MessageNumber msg,
			 std::span<const std::byte> payload)
{
	if (!IsEncrypted()) {
		CConnection::HandlePacket(msg, payload);
		return;
	}

	if (IsOccupied() && !IsAsyncTransportMessage(msg))
		throw Disconnect{
			SSH::DisconnectReasonCode::PROTOCOL_ERROR,
			"Packet received during authentication"sv
		};

	if (msg == SSH::MessageNumber::SERVICE_REQUEST)
		HandleServiceRequest(payload);
	else if (msg == SSH::MessageNumber::USERAUTH_REQUEST)
		HandleUserauthRequest(payload);
	else
		CConnection::HandlePacket(msg, payload);
}

std::string_view
Connection::GetServerHostKeyAlgorithms() const noexcept
{
	return instance.GetHostKey().GetAlgorithms();
}

std::pair<const SecretKey *, std::string_view>
Connection::ChooseHostKey(std::string_view algorithms) const noexcept
{
	const SecretKey &host_key = instance.GetHostKey();
	const auto algorithm = SSH::NegotiateAlgorithm(algorithms,
						       host_key.GetAlgorithms());
	if (algorithm.empty())
		return {nullptr, {}};

	return {&host_key, algorithm};
}

std::string_view
Connection::GetEncryptionAlgorithms() const noexcept
{
	return GetConfig().ciphers;
}

std::string_view
Connection::GetMacAlgorithms() const noexcept
{
	return GetConfig().macs;
}

void
Connection::OnDisconnecting(SSH::DisconnectReasonCode reason_code,
			    std::string_view msg) noexcept
{
	CConnection::OnDisconnecting(reason_code, msg);

	/* stop everything now; destruction may be deferred */
	auth_timeout.Cancel();
	occupied_task = {};

	if (log_disconnect)
		LogClose(fmt::format("Disconnecting: {}", msg));
}

void
Connection::OnDisconnected([[maybe_unused]] SSH::DisconnectReasonCode reason_code,
			   std::string_view msg) noexcept
{
	if (log_disconnect)
		LogClose(fmt::format("Client disconnected: {}", msg));
}

void
Connection::OnBufferedError(std::exception_ptr e) noexcept
{
	LogClose(e);

	SSH::CConnection::OnBufferedError(std::move(e));
}

void
Connection::OnAuthTimeout() noexcept
{
	LogClose("Authentication timeout"sv);

	DoDisconnect(SSH::DisconnectReasonCode::CONNECTION_LOST,
		     "Timeout"sv);
}
