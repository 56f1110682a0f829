// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "util/IntrusiveList.hxx"

#include <cstddef>
#include <cstdint>
#include <exception>
#include <span>
#include <string_view>

namespace Co { template<typename T> class EagerTask; }

namespace SSH {

enum class ChannelExtendedDataType : uint32_t;
class CConnection;
class Serializer;

/**
 * Structure passed to the #Channel constructor to reduce the
 * boilerplate code for derived classes.
 */
struct ChannelInit {
	uint_least32_t local_channel, peer_channel;

	std::size_t send_window;

	/**
	 * The largest data packet the peer accepts.
	 */
	std::size_t max_packet_size;
};

/**
 * How a channel request completed.
 */
enum class RequestResult : uint_least8_t {
	/**
	 * Reply CHANNEL_SUCCESS (if the peer wants a reply).
	 */
	SUCCESS,

	/**
	 * Reply CHANNEL_FAILURE (if the peer wants a reply).
	 */
	FAILURE,

	/**
	 * Send no reply and close the channel.
	 */
	ABORT,
};

/**
 * One channel of a #CConnection (RFC 4254 section 5).  Instances
 * are owned by the #CConnection.
 */
class Channel {
	CConnection &connection;

	const uint_least32_t local_channel, peer_channel;

	/**
	 * How much data is the peer allowed to send?  Implementations
	 * should call SendWindowAdjust() to increase it.
	 */
	std::size_t receive_window;

	/**
	 * How much data are we allowed to send?  If this reaches
	 * zero, then we need to wait for CHANNEL_WINDOW_ADJUST.
	 */
	std::size_t send_window;

	const std::size_t max_packet_size;

	class PendingRequest;

	/**
	 * Requests whose reply has not been sent yet, oldest first.
	 */
	IntrusiveList<PendingRequest> pending_requests;

	bool eof_sent = false;

public:
	Channel(CConnection &_connection, ChannelInit init,
		std::size_t _receive_window) noexcept;

	virtual ~Channel() noexcept;

	Channel(const Channel &) = delete;
	Channel &operator=(const Channel &) = delete;

	CConnection &GetConnection() const noexcept {
		return connection;
	}

	uint_least32_t GetLocalChannel() const noexcept {
		return local_channel;
	}

	uint_least32_t GetPeerChannel() const noexcept {
		return peer_channel;
	}

	std::size_t GetReceiveWindow() const noexcept {
		return receive_window;
	}

	std::size_t GetSendWindow() const noexcept {
		return send_window;
	}

	std::size_t GetMaxPacketSize() const noexcept {
		return max_packet_size;
	}

	/**
	 * How many bytes may be passed to SendData() right now?
	 */
	[[gnu::pure]]
	std::size_t GetMaxSendSize() const noexcept;

	bool WasEofSent() const noexcept {
		return eof_sent;
	}

	/**
	 * Send CHANNEL_CLOSE and delete this object.
	 */
	void Close() noexcept;

	/**
	 * Close the connection this channel belongs to because of
	 * an error.  This object is deleted.
	 */
	void CloseError(std::exception_ptr error) noexcept;

	/* all the following methods throw if sending fails */

	void SendWindowAdjust(uint_least32_t nbytes);
	void SendData(std::span<const std::byte> src);
	void SendExtendedData(ChannelExtendedDataType data_type,
			      std::span<const std::byte> src);
	void SendStderr(std::span<const std::byte> src);
	void SendEof();
	void SendExitStatus(uint_least32_t exit_status);
	void SendExitSignal(std::string_view signal_name, bool core_dumped,
			    std::string_view error_message);

	void HandleRequest(std::string_view request_type,
			   std::span<const std::byte> type_specific,
			   bool want_reply);

private:
	/**
	 * @param data_type nullptr for CHANNEL_DATA
	 */
	void SendDataPacket(const ChannelExtendedDataType *data_type,
			    std::span<const std::byte> src);

	void SubmitRequestResponses() noexcept;

	/**
	 * A suspended request handler has completed.
	 */
	void OnRequestDone(std::exception_ptr error) noexcept;

protected:
	std::size_t ConsumeReceiveWindow(std::size_t nbytes) noexcept;

public:
	virtual void OnWindowAdjust(std::size_t nbytes);
	virtual void OnData(std::span<const std::byte> payload);
	virtual void OnExtendedData(ChannelExtendedDataType data_type,
				    std::span<const std::byte> payload);
	virtual void OnEof() {}

	/**
	 * Handle a CHANNEL_REQUEST.  The coroutine may complete
	 * asynchronously; replies are sent in the order the
	 * requests were received.
	 */
	[[nodiscard]]
	virtual Co::EagerTask<RequestResult> OnRequest(std::string_view request_type,
						       std::span<const std::byte> type_specific);

	virtual void OnWriteBlocked() noexcept {}
	virtual void OnWriteUnblocked() noexcept {}
};

} // namespace SSH
