// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Connection.hxx"
#include "IdentificationString.hxx"
#include "KexInterface.hxx"
#include "KexFactory.hxx"
#include "KexHash.hxx"
#include "KexProposal.hxx"
#include "Sizes.hxx"
#include "Protocol.hxx"
#include "Serializer.hxx"
#include "MakePacket.hxx"
#include "ParsePacket.hxx"
#include "key/Key.hxx"
#include "cipher/Cipher.hxx"
#include "cipher/Factory.hxx"
#include "system/Urandom.hxx"
#include "net/UniqueSocketDescriptor.hxx"
#include "net/SocketError.hxx"
#include "net/SocketProtocolError.hxx"
#include "util/SpanCast.hxx"
#include "Digest.hxx"

#include <algorithm>
#include <tuple>

using std::string_view_literals::operator""sv;

namespace SSH {

/**
 * The public key algorithms we can verify in "publickey" user
 * authentication.
 */
static constexpr std::string_view all_public_key_algorithms =
	"ssh-ed25519,ecdsa-sha2-nistp256,rsa-sha2-512,rsa-sha2-256";

static void
SerializeKex(Serializer &s, std::span<const std::byte, KEX_COOKIE_SIZE> cookie,
	     const KexProposal &proposal)
{
	s.WriteN(cookie);
	SerializeProposal(s, proposal);
	s.WriteBool(false); // first_kex_packet_follows
	s.WriteU32(0); // reserved
}

[[noreturn]]
static void
ThrowKexFailed(std::string_view msg)
{
	throw Connection::Disconnect{DisconnectReasonCode::KEY_EXCHANGE_FAILED, msg};
}

[[gnu::pure]]
static std::string_view
FirstName(std::string_view list) noexcept
{
	return list.substr(0, list.find(','));
}

/**
 * Is this message number part of the transport layer protocol
 * (RFC 4250 section 4.1.2)?
 */
static constexpr bool
IsTransportMessage(MessageNumber msg) noexcept
{
	return static_cast<uint8_t>(msg) < 50;
}

static constexpr bool
IsKexMessage(MessageNumber msg) noexcept
{
	const auto i = static_cast<uint8_t>(msg);
	return i >= 30 && i < 50;
}

Connection::Connection(EventLoop &event_loop, UniqueSocketDescriptor _fd)
	:socket(event_loop),
	 input(*this),
	 output(socket)
{
	socket.Init(_fd.Release(), FD_TCP,
		    std::chrono::seconds(30),
		    *this);
	socket.ScheduleRead();

	if (socket.DirectWrite(AsBytes(IDENTIFICATION_STRING)) < 0)
		throw MakeSocketError("Failed to send VersionExchange");
}

Connection::~Connection() noexcept = default;

inline void
Connection::SendFinishedPacket(PacketSerializer &&s)
{
	const auto *send_cipher = output.GetCipher();
	output.Push(s.Finish(send_cipher != nullptr
			     ? send_cipher->GetBlockSize()
			     : 8,
			     send_cipher != nullptr &&
			     send_cipher->IsHeaderExcludedFromPadding()));
	socket.DeferWrite();
}

void
Connection::SendPacket(PacketSerializer &&s)
{
	if (kex_in_progress && !IsTransportMessage(s.GetMessageNumber())) {
		deferred_packets.emplace_back(std::move(s));
		return;
	}

	SendFinishedPacket(std::move(s));
}

inline void
Connection::FlushDeferredPackets()
{
	while (!deferred_packets.empty()) {
		SendFinishedPacket(std::move(deferred_packets.front()));
		deferred_packets.pop_front();
	}
}

void
Connection::DoDisconnect(DisconnectReasonCode reason_code, std::string_view msg) noexcept
{
	OnDisconnecting(reason_code, msg);

	try {
		SendFinishedPacket(MakeDisconnect(reason_code, msg));

		/* attempt to flush the DISCONNECT packet immediately
		   before we close the socket */
		if (output.Flush() == Output::FlushResult::DESTROYED)
			return;
	} catch (const std::exception &) {
		/* we're going to disconnect anyway; the reason has
		   already been reported by OnDisconnecting() */
	}

	Destroy();
}

std::string_view
Connection::GetEncryptionAlgorithms() const noexcept
{
	return all_encryption_algorithms;
}

std::string_view
Connection::GetMacAlgorithms() const noexcept
{
	return all_mac_algorithms;
}

std::string_view
Connection::GetServerSigAlgs() const noexcept
{
	return all_public_key_algorithms;
}

inline void
Connection::SendKexInit()
{
	PacketSerializer s{MessageNumber::KEXINIT};

	const KexProposal proposal{
		.kex_algorithms = all_server_kex_algorithms,
		.server_host_key_algorithms = GetServerHostKeyAlgorithms(),
		.encryption_algorithms_client_to_server = GetEncryptionAlgorithms(),
		.encryption_algorithms_server_to_client = GetEncryptionAlgorithms(),
		.mac_algorithms_client_to_server = GetMacAlgorithms(),
		.mac_algorithms_server_to_client = GetMacAlgorithms(),
		.compression_algorithms_client_to_server = "none"sv,
		.compression_algorithms_server_to_client = "none"sv,
		.languages_client_to_server = ""sv,
		.languages_server_to_client = ""sv,
	};

	std::array<std::byte, KEX_COOKIE_SIZE> cookie;
	UrandomFill(cookie);

	const auto kex_mark = s.Mark();
	SerializeKex(s, cookie, proposal);
	my_kexinit = s.Since(kex_mark);

	SendFinishedPacket(std::move(s));
}

/**
 * Invoke #f to write the contents of a length-prefixed string and
 * return a view of those contents.
 */
template<typename F>
static std::span<const std::byte>
WriteNested(Serializer &s, F &&f)
{
	const auto length = s.PrepareLength();
	const auto mark = s.Mark();
	f(s);
	const auto result = s.Since(mark);
	s.CommitLength(length);
	return result;
}

inline void
Connection::SendECDHKexInitReply(std::span<const std::byte> client_ephemeral_public_key)
{
	assert(kex_algorithm);
	assert(host_key != nullptr);

	PacketSerializer s{MessageNumber::ECDH_KEX_INIT_REPLY};

	const auto server_host_key_blob = WriteNested(s, [this](Serializer &o){
		host_key->SerializePublic(o);
	});

	const auto server_ephemeral_public_key = WriteNested(s, [this](Serializer &o){
		kex_algorithm->SerializeEphemeralPublicKey(o);
	});

	Serializer shared_secret;
	kex_algorithm->GenerateSharedSecret(client_ephemeral_public_key, shared_secret);
	const auto shared_secret_ = shared_secret.Finish();

	/* the exchange hash covers the identification strings
	   without CR LF */
	auto server_version = IDENTIFICATION_STRING;
	server_version.remove_suffix(2);

	const KexHashInput hash_input{
		.client_version = peer_version,
		.server_version = server_version,
		.client_kexinit = peer_kexinit,
		.server_kexinit = my_kexinit,
		.server_host_key_blob = server_host_key_blob,
		.client_ephemeral_public_key = client_ephemeral_public_key,
		.server_ephemeral_public_key = server_ephemeral_public_key,
		.shared_secret = shared_secret_,
	};

	std::byte hash_buffer[DIGEST_MAX_SIZE];
	const auto hashlen = CalcKexHash(KexState::hash_alg, hash_input,
					 hash_buffer);
	const auto hash = std::span{hash_buffer}.first(hashlen);

	WriteNested(s, [this, hash](Serializer &o){
		host_key->Sign(o, hash, host_key_algorithm);
	});

	SendFinishedPacket(std::move(s));

	kex_state.DeriveKeys(hash, shared_secret_);
	kex_algorithm.reset();
}

/**
 * Build the cipher for one direction from the keys derived in the
 * current key exchange.
 *
 * Throws #Disconnect if the negotiated algorithm is not available.
 */
inline std::unique_ptr<Cipher>
Connection::MakeNewCipher(Direction direction)
{
	const bool incoming = direction == Direction::INCOMING;

	auto cipher = kex_state.MakeCipher(incoming
					   ? encryption_algorithm_client_to_server
					   : encryption_algorithm_server_to_client,
					   incoming
					   ? mac_algorithm_client_to_server
					   : mac_algorithm_server_to_client,
					   direction);
	if (cipher == nullptr)
		ThrowKexFailed("Cipher not available"sv);

	return cipher;
}

template<typename F>
inline void
Connection::SwitchCipher(F &&f)
{
	const bool was_encrypted = IsEncrypted();
	f();

	if (!was_encrypted && IsEncrypted())
		OnEncrypted();
}

inline void
Connection::SendNewKeys()
{
	SendFinishedPacket(PacketSerializer{MessageNumber::NEWKEYS});

	/* everything after our NEWKEYS uses the new keys */
	SwitchCipher([this, cipher = MakeNewCipher(Direction::OUTGOING)]() mutable {
		output.SetCipher(std::move(cipher));
		kex_in_progress = false;
	});
}

inline void
Connection::SendExtInfo()
{
	/* RFC 8308; without "server-sig-algs", OpenSSH clients
	   skip RSA keys unless SHA-1 signatures are enabled */
	SendFinishedPacket(MakePacket(MessageNumber::EXT_INFO,
				      uint_least32_t{1},
				      "server-sig-algs"sv,
				      GetServerSigAlgs()));
}

inline void
Connection::HandleDisconnect(std::span<const std::byte> payload)
{
	const auto p = ParseDisconnect(payload);
	OnDisconnected(p.reason_code, p.description);

	Destroy();
	throw Destroyed{};
}

/**
 * Choose the cipher and (unless it is an AEAD cipher) the MAC for
 * one direction.
 */
static std::pair<std::string_view, std::string_view>
NegotiateCipher(std::string_view peer_ciphers, std::string_view peer_macs,
		std::string_view my_ciphers, std::string_view my_macs)
{
	const auto cipher = NegotiateAlgorithm(peer_ciphers, my_ciphers);
	if (cipher.empty())
		ThrowKexFailed("No common encryption algorithm"sv);

	if (IsAuthenticatedEncryption(cipher))
		return {cipher, {}};

	const auto mac = NegotiateAlgorithm(peer_macs, my_macs);
	if (mac.empty())
		ThrowKexFailed("No common MAC algorithm"sv);

	return {cipher, mac};
}

inline void
Connection::NegotiateAlgorithms(const KexInit &p)
{
	if (!NameListContains(p.compression_algorithms_client_to_server, "none"sv) ||
	    !NameListContains(p.compression_algorithms_server_to_client, "none"sv))
		ThrowKexFailed("No common compression algorithm"sv);

	const auto my_ciphers = GetEncryptionAlgorithms();
	const auto my_macs = GetMacAlgorithms();

	const auto [enc_c2s, mac_c2s] =
		NegotiateCipher(p.encryption_algorithms_client_to_server,
				p.mac_algorithms_client_to_server,
				my_ciphers, my_macs);
	const auto [enc_s2c, mac_s2c] =
		NegotiateCipher(p.encryption_algorithms_server_to_client,
				p.mac_algorithms_server_to_client,
				my_ciphers, my_macs);

	encryption_algorithm_client_to_server = enc_c2s;
	encryption_algorithm_server_to_client = enc_s2c;
	mac_algorithm_client_to_server = mac_c2s;
	mac_algorithm_server_to_client = mac_s2c;
}

inline void
Connection::HandleKexInit(std::span<const std::byte> payload)
{
	if (waiting_for_peer_newkeys)
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Duplicate KEXINIT"sv,
		};

	const auto p = ParseKexInit(payload);

	kex_algorithm = MakeKex(p.kex_algorithms);
	if (!kex_algorithm)
		ThrowKexFailed("No supported KEX algorithm"sv);

	std::tie(host_key, host_key_algorithm) = ChooseHostKey(p.server_host_key_algorithms);
	if (host_key == nullptr)
		ThrowKexFailed("No supported host key"sv);

	NegotiateAlgorithms(p);

	if (p.first_kex_packet_follows)
		ignore_next_kex_packet =
			FirstName(p.kex_algorithms) != NegotiateAlgorithm(p.kex_algorithms,
									  all_server_kex_algorithms) ||
			FirstName(p.server_host_key_algorithms) != host_key_algorithm;

	if (kex_state.session_id.empty()) {
		/* these are only evaluated in the first key
		   exchange */
		peer_wants_ext_info = NameListContains(p.kex_algorithms,
						       "ext-info-c"sv);

		peer_wants_strict_key_exchange =
			NameListContains(p.kex_algorithms,
					 "kex-strict-c-v00@openssh.com"sv);
		if (peer_wants_strict_key_exchange) {
			if (!first_packet_was_kexinit)
				ThrowKexFailed("First packet was not KEXINIT"sv);

			input.AutoResetSeq();
			output.AutoResetSeq();
		}
	}

	peer_kexinit = payload;
	kex_in_progress = true;
	waiting_for_peer_newkeys = true;

	SendKexInit();
}

inline void
Connection::HandleNewKeys()
{
	if (!waiting_for_peer_newkeys || kex_in_progress)
		/* NEWKEYS before our ECDH_KEX_INIT_REPLY */
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Unexpected NEWKEYS"sv,
		};

	SwitchCipher([this, cipher = MakeNewCipher(Direction::INCOMING)]() mutable {
		input.SetCipher(std::move(cipher));
		waiting_for_peer_newkeys = false;
	});
}

inline void
Connection::HandleECDHKexInit(std::span<const std::byte> payload)
{
	if (!kex_in_progress || !kex_algorithm)
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"No KEXINIT"sv,
		};

	const bool first_kex = kex_state.session_id.empty();

	const auto p = ParseECDHKexInit(payload);

	SendECDHKexInitReply(p.client_ephemeral_public_key);
	SendNewKeys();

	if (first_kex && peer_wants_ext_info)
		SendExtInfo();

	FlushDeferredPackets();
}

inline void
Connection::CheckPacketOrder(MessageNumber msg)
{
	if (!input.IsEncrypted()) {
		if (peer_kexinit == nullptr) {
			if (msg != MessageNumber::KEXINIT)
				first_packet_was_kexinit = false;
		} else if (peer_wants_strict_key_exchange) {
			/* strict KEX: nothing but the key exchange
			   until the first NEWKEYS */
			switch (msg) {
			case MessageNumber::DISCONNECT:
			case MessageNumber::NEWKEYS:
			case MessageNumber::ECDH_KEX_INIT:
				break;

			default:
				ThrowKexFailed("Unexpected KEX packet"sv);
			}
		}
	}

	if (waiting_for_peer_newkeys && !IsTransportMessage(msg))
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_ERROR,
			"Unexpected packet during key exchange"sv,
		};
}

void
Connection::HandlePacket(MessageNumber msg, std::span<const std::byte> payload)
{
	CheckPacketOrder(msg);

	if (ignore_next_kex_packet && IsKexMessage(msg)) {
		/* the peer's guess was wrong */
		ignore_next_kex_packet = false;
		return;
	}

	switch (msg) {
	case MessageNumber::DISCONNECT:
		HandleDisconnect(payload);

	case MessageNumber::IGNORE:
	case MessageNumber::DEBUG:
	case MessageNumber::UNIMPLEMENTED:
		break;

	case MessageNumber::KEXINIT:
		HandleKexInit(payload);
		break;

	case MessageNumber::NEWKEYS:
		HandleNewKeys();
		break;

	case MessageNumber::ECDH_KEX_INIT:
		HandleECDHKexInit(payload);
		break;

	default:
		if (!IsEncrypted())
			throw Disconnect{
				DisconnectReasonCode::PROTOCOL_ERROR,
				"Unexpected packet"sv,
			};

		SendPacket(MakeUnimplemented(input.GetSeq()));
	}
}

inline void
Connection::HandleRawPacket(std::span<const std::byte> payload)
try {
	assert(!payload.empty());

	HandlePacket(static_cast<MessageNumber>(payload.front()),
		     payload.subspan(1));
} catch (const MalformedPacket &) {
	throw Disconnect{
		DisconnectReasonCode::PROTOCOL_ERROR,
		"Malformed packet"sv,
	};
}

inline bool
Connection::ReceiveIdentification()
{
	const auto r = std::as_bytes(socket.ReadBuffer());
	const auto eol = std::find(r.begin(), r.end(), std::byte{'\n'});
	const std::size_t length = std::distance(r.begin(), eol);

	if (length >= MAX_IDENTIFICATION_LENGTH)
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_VERSION_NOT_SUPPORTED,
			"Identification string too long"sv,
		};

	if (eol == r.end())
		return false;

	auto line = ToStringView(r.first(length));
	if (line.ends_with('\r'))
		line.remove_suffix(1);

	if (!line.starts_with("SSH-2.0-"sv))
		throw Disconnect{
			DisconnectReasonCode::PROTOCOL_VERSION_NOT_SUPPORTED,
			"Unsupported protocol version"sv,
		};

	peer_version.assign(line);
	socket.KeepConsumed(length + 1);
	version_exchanged = true;
	return true;
}

BufferedResult
Connection::OnBufferedData()
{
	if (!version_exchanged) {
		try {
			if (!ReceiveIdentification())
				return BufferedResult::MORE;
		} catch (const Disconnect &d) {
			DoDisconnect(d.reason_code, d.msg);
			return BufferedResult::DESTROYED;
		}
	}

	if (!input.Feed(socket.GetInputBuffer()))
		return BufferedResult::DESTROYED;

	socket.GetInputBuffer().FreeIfEmpty();
	return socket.IsFull()
		? BufferedResult::OK
		: BufferedResult::MORE;
}

bool
Connection::OnBufferedWrite()
{
	OnWriteUnblocked();

	const auto result = output.Flush();
	if (result == Output::FlushResult::DESTROYED)
		return false;

	if (result == Output::FlushResult::MORE) {
		/* the socket is full; channels must stop producing
		   until it drains */
		socket.ScheduleWrite();
		OnWriteBlocked();
	} else
		socket.UnscheduleWrite();

	return true;
}

bool
Connection::OnBufferedClosed() noexcept
{
	Destroy();
	return false;
}

void
Connection::OnBufferedError([[maybe_unused]] std::exception_ptr e) noexcept
{
	Destroy();
}

bool
Connection::OnInputReady() noexcept
try {
	for (auto payload = input.ReadPacket(); payload.data() != nullptr;
	     payload = input.ReadPacket()) {
		HandleRawPacket(payload);
		input.ConsumePacket();
	}

	socket.ScheduleRead();
	return true;
} catch (const Disconnect &d) {
	DoDisconnect(d.reason_code, d.msg);
	return false;
} catch (const Destroyed &) {
	return false;
} catch (...) {
	OnBufferedError(std::current_exception());
	return false;
}

} // namespace SSH
