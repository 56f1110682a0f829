// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "IHandler.hxx"
#include "Input.hxx"
#include "Output.hxx"
#include "KexState.hxx"
#include "PacketSerializer.hxx"
#include "event/net/BufferedSocket.hxx"
#include "util/AllocatedArray.hxx"

#include <cstdint>
#include <list>
#include <span>
#include <string>

class SecretKey;

namespace SSH {

class Kex;
struct KexInit;
enum class MessageNumber : uint8_t;
enum class DisconnectReasonCode : uint32_t;

/**
 * The server side of the SSH transport layer protocol (RFC 4253):
 * version exchange, key exchange (including re-exchange initiated
 * by the client) and packet encryption.  Subclasses implement the
 * higher layers by overriding HandlePacket().
 */
class Connection : BufferedSocketHandler, InputHandler
{
	const SecretKey *host_key = nullptr;
	std::string host_key_algorithm;

	BufferedSocket socket;

	Input input;
	Output output;

	std::string peer_version;

	AllocatedArray<std::byte> peer_kexinit, my_kexinit;

	/**
	 * The algorithms negotiated in the current key exchange.
	 * The MAC names are empty for ciphers with built-in
	 * authentication.
	 */
	std::string encryption_algorithm_client_to_server,
		encryption_algorithm_server_to_client,
		mac_algorithm_client_to_server,
		mac_algorithm_server_to_client;

	KexState kex_state;

	std::unique_ptr<Kex> kex_algorithm;

	/**
	 * Packets submitted by the upper layers while a key
	 * re-exchange is in progress.  RFC 4253 section 7.1 forbids
	 * sending them before our NEWKEYS.
	 */
	std::list<PacketSerializer> deferred_packets;

	bool version_exchanged = false;

	bool authenticated = false;

	/**
	 * Between receiving KEXINIT and sending NEWKEYS.
	 */
	bool kex_in_progress = false;

	/**
	 * Between receiving KEXINIT and receiving NEWKEYS.  Only
	 * transport layer messages are allowed from the peer.
	 */
	bool waiting_for_peer_newkeys = false;

	/**
	 * The peer set "first_kex_packet_follows" but guessed wrong;
	 * the next key exchange packet must be ignored (RFC 4253
	 * section 7).
	 */
	bool ignore_next_kex_packet = false;

	/**
	 * Did the peer announce "ext-info-c"?
	 */
	bool peer_wants_ext_info = false;

	/**
	 * Did the peer announce "kex-strict-c-v00@openssh.com"?
	 */
	bool peer_wants_strict_key_exchange = false;

	/**
	 * Strict key exchange requires KEXINIT to be the first
	 * packet; this is cleared when anything else arrives first.
	 */
	bool first_packet_was_kexinit = true;

public:
	/**
	 * Thrown by packet handlers; the catcher sends DISCONNECT
	 * and destroys the connection.
	 */
	struct Disconnect {
		DisconnectReasonCode reason_code;
		std::string_view msg;
	};

	/**
	 * Thrown after the #Connection has destroyed itself; the
	 * catcher must not touch it.
	 */
	struct Destroyed {};

	/**
	 * Throws if sending the identification string fails.
	 */
	Connection(EventLoop &event_loop, UniqueSocketDescriptor fd);
	~Connection() noexcept;

	auto &GetEventLoop() const noexcept {
		return socket.GetEventLoop();
	}

	[[gnu::pure]]
	bool IsEncrypted() const noexcept {
		return input.IsEncrypted() && output.IsEncrypted();
	}

	bool IsAuthenticated() const noexcept {
		return authenticated;
	}

	/**
	 * Close this connection due to an error.
	 */
	void CloseError(std::exception_ptr e) noexcept {
		OnBufferedError(std::move(e));
	}

	/**
	 * Finish, encrypt and queue a packet.  During a key
	 * re-exchange, packets of the higher layers are held back
	 * until the new keys are in effect.
	 *
	 * Throws on error.
	 */
	void SendPacket(PacketSerializer &&s);

	/**
	 * Send a DISCONNECT packet and destroy the connection.
	 */
	void DoDisconnect(DisconnectReasonCode reason_code,
			  std::string_view msg) noexcept;

protected:
	virtual void Destroy() noexcept = 0;

	SocketDescriptor GetSocket() const noexcept {
		return socket.GetSocket();
	}

	std::span<const std::byte> GetSessionId() const noexcept {
		return kex_state.session_id;
	}

	std::string_view GetPeerVersion() const noexcept {
		return peer_version;
	}

	void SetAuthenticated() noexcept {
		assert(IsEncrypted());
		assert(!authenticated);

		authenticated = true;
	}

private:
	void SendFinishedPacket(PacketSerializer &&s);
	void FlushDeferredPackets();

	std::unique_ptr<Cipher> MakeNewCipher(Direction direction);

	/**
	 * Invoke #f which installs a new cipher, and call
	 * OnEncrypted() if this completes the first key exchange.
	 */
	template<typename F>
	void SwitchCipher(F &&f);

	void SendKexInit();
	void SendECDHKexInitReply(std::span<const std::byte> client_ephemeral_public_key);
	void SendNewKeys();
	void SendExtInfo();

	[[noreturn]]
	void HandleDisconnect(std::span<const std::byte> payload);
	void NegotiateAlgorithms(const KexInit &p);
	void HandleKexInit(std::span<const std::byte> payload);
	void HandleNewKeys();
	void HandleECDHKexInit(std::span<const std::byte> payload);

	/**
	 * Throws #Disconnect if #msg is not allowed in the current
	 * key exchange state.
	 */
	void CheckPacketOrder(MessageNumber msg);

	void HandleRawPacket(std::span<const std::byte> payload);

	/**
	 * Parse the peer's identification string (RFC 4253 section
	 * 4.2) from the input buffer.
	 *
	 * Throws #Disconnect on error.
	 *
	 * @return false if the line is not yet complete
	 */
	bool ReceiveIdentification();

protected:
	/**
	 * Handle a packet.  Subclasses override this to implement
	 * higher layers and call the base method for everything they
	 * don't handle.
	 *
	 * Throws #Disconnect, #Destroyed or any other exception
	 * (which closes the connection).
	 */
	virtual void HandlePacket(MessageNumber msg,
				  std::span<const std::byte> payload);

	/**
	 * The comma-separated list of host key algorithms we offer.
	 */
	[[gnu::pure]]
	virtual std::string_view GetServerHostKeyAlgorithms() const noexcept = 0;

	/**
	 * Pick a host key for one of the algorithms in the client's
	 * list.
	 *
	 * @return the key and the chosen signature algorithm or
	 * {nullptr, {}} if there is no match
	 */
	[[gnu::pure]]
	virtual std::pair<const SecretKey *, std::string_view> ChooseHostKey(std::string_view algorithms) const noexcept = 0;

	/**
	 * The encryption algorithms we offer, in our order of
	 * preference.
	 */
	[[gnu::pure]]
	virtual std::string_view GetEncryptionAlgorithms() const noexcept;

	/**
	 * The MAC algorithms we offer, in our order of preference.
	 */
	[[gnu::pure]]
	virtual std::string_view GetMacAlgorithms() const noexcept;

	/**
	 * The comma-separated list of public key algorithms sent in
	 * the "server-sig-algs" extension.
	 */
	[[gnu::pure]]
	virtual std::string_view GetServerSigAlgs() const noexcept;

	/**
	 * Both directions are encrypted now (after the first key
	 * exchange only).
	 */
	virtual void OnEncrypted() {}

	/**
	 * The socket is congested; stop producing packets.
	 */
	virtual void OnWriteBlocked() noexcept {}

	/**
	 * The congestion is over.  Implementations may only schedule
	 * events here, SendPacket() must not be called from inside
	 * this method.
	 */
	virtual void OnWriteUnblocked() noexcept {}

	/**
	 * We are about to send DISCONNECT.  For logging only.
	 */
	virtual void OnDisconnecting([[maybe_unused]] DisconnectReasonCode reason_code,
				     [[maybe_unused]] std::string_view msg) noexcept {}

	/**
	 * The peer has sent DISCONNECT.  For logging only; the
	 * connection is destroyed afterwards.
	 */
	virtual void OnDisconnected([[maybe_unused]] DisconnectReasonCode reason_code,
				    [[maybe_unused]] std::string_view msg) noexcept {}

	/* virtual methods from class BufferedSocketHandler */
	BufferedResult OnBufferedData() override;
	bool OnBufferedClosed() noexcept override;
	bool OnBufferedWrite() override;
	void OnBufferedError(std::exception_ptr e) noexcept override;

	/* virtual methods from class InputHandler */
	bool OnInputReady() noexcept final;
};

} // namespace SSH
