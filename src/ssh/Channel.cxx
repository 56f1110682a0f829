// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Channel.hxx"
#include "CConnection.hxx"
#include "Serializer.hxx"
#include "MakePacket.hxx"
#include "co/InvokeTask.hxx"
#include "co/Task.hxx"
#include "util/DeleteDisposer.hxx"

#include <algorithm>
#include <cassert>
#include <optional>

using std::string_view_literals::operator""sv;

namespace SSH {

/**
 * A CHANNEL_REQUEST whose reply has not been sent yet.  Replies go
 * out in the order the requests arrived, so a finished request may
 * have to wait for an older one.
 */
class Channel::PendingRequest final : public IntrusiveListHook<> {
	Channel &channel;

	/**
	 * Set as soon as the handler coroutine completes.  Declared
	 * before #task because an eager coroutine may complete
	 * inside the constructor.
	 */
	std::optional<RequestResult> result;

	Co::EagerInvokeTask task;

public:
	const bool want_reply;

	PendingRequest(Channel &_channel, bool _want_reply,
		       Co::EagerTask<RequestResult> &&handler)
		:channel(_channel),
		 task(Await(std::move(handler))),
		 want_reply(_want_reply) {}

	const std::optional<RequestResult> &GetResult() const noexcept {
		return result;
	}

	/**
	 * The handler has suspended; get notified when it resumes
	 * and completes.
	 */
	void Wait() noexcept {
		assert(!result);

		task.Start(BIND_THIS_METHOD(OnTaskFinished));
	}

private:
	Co::EagerInvokeTask Await(Co::EagerTask<RequestResult> handler) {
		result = co_await handler;
	}

	void OnTaskFinished(std::exception_ptr &&error) noexcept {
		if (error)
			result = RequestResult::FAILURE;

		channel.OnRequestDone(std::move(error));
	}
};

Channel::Channel(CConnection &_connection, ChannelInit init,
		 std::size_t _receive_window) noexcept
	:connection(_connection),
	 local_channel(init.local_channel),
	 peer_channel(init.peer_channel),
	 receive_window(_receive_window),
	 send_window(init.send_window),
	 max_packet_size(init.max_packet_size) {}

Channel::~Channel() noexcept
{
	pending_requests.clear_and_dispose(DeleteDisposer{});
}

std::size_t
Channel::GetMaxSendSize() const noexcept
{
	return std::min(send_window, max_packet_size);
}

void
Channel::Close() noexcept
{
	connection.CloseChannel(*this);
}

void
Channel::CloseError(std::exception_ptr error) noexcept
{
	connection.CloseError(std::move(error));
}

std::size_t
Channel::ConsumeReceiveWindow(std::size_t nbytes) noexcept
{
	assert(nbytes <= receive_window);

	return receive_window -= nbytes;
}

void
Channel::SendWindowAdjust(uint_least32_t nbytes)
{
	assert(nbytes > 0);
	assert(nbytes <= SIZE_MAX - receive_window);

	connection.SendPacket(MakeChannelWindowAdjust(GetPeerChannel(), nbytes));

	receive_window += nbytes;
}

/**
 * Build a CHANNEL_DATA or CHANNEL_EXTENDED_DATA packet.
 */
static PacketSerializer
MakeDataPacket(uint_least32_t peer_channel,
	       const ChannelExtendedDataType *data_type,
	       std::span<const std::byte> src)
{
	PacketSerializer s{data_type != nullptr
		? MessageNumber::CHANNEL_EXTENDED_DATA
		: MessageNumber::CHANNEL_DATA};
	s.WriteU32(peer_channel);
	if (data_type != nullptr)
		s.WriteU32(static_cast<uint_least32_t>(*data_type));
	s.WriteLengthEncoded(src);
	return s;
}

inline void
Channel::SendDataPacket(const ChannelExtendedDataType *data_type,
			std::span<const std::byte> src)
{
	assert(src.size() <= GetMaxSendSize());
	assert(!eof_sent);

	connection.SendPacket(MakeDataPacket(GetPeerChannel(), data_type, src));
	send_window -= src.size();
}

void
Channel::SendData(std::span<const std::byte> src)
{
	SendDataPacket(nullptr, src);
}

void
Channel::SendExtendedData(ChannelExtendedDataType data_type,
			  std::span<const std::byte> src)
{
	SendDataPacket(&data_type, src);
}

void
Channel::SendStderr(std::span<const std::byte> src)
{
	SendExtendedData(ChannelExtendedDataType::STDERR, src);
}

void
Channel::SendEof()
{
	assert(!eof_sent);

	connection.SendPacket(MakeChannelEof(GetPeerChannel()));
	eof_sent = true;
}

/* RFC 4254 section 6.10: both are sent without want_reply */

void
Channel::SendExitStatus(uint_least32_t exit_status)
{
	auto s = MakeChannelRequest(GetPeerChannel(), "exit-status"sv, false);
	s.WriteU32(exit_status);
	connection.SendPacket(std::move(s));
}

void
Channel::SendExitSignal(std::string_view signal_name, bool core_dumped,
			std::string_view error_message)
{
	/* the signal name is without the "SIG" prefix */
	auto s = MakeChannelRequest(GetPeerChannel(), "exit-signal"sv, false);
	s.WriteString(signal_name);
	s.WriteBool(core_dumped);
	s.WriteString(error_message);
	s.WriteString(""sv); // language tag
	connection.SendPacket(std::move(s));
}

void
Channel::HandleRequest(std::string_view request_type,
		       std::span<const std::byte> type_specific,
		       bool want_reply)
{
	auto *request = new PendingRequest(*this, want_reply,
					   OnRequest(request_type, type_specific));
	pending_requests.push_back(*request);

	if (request->GetResult())
		SubmitRequestResponses();
	else
		request->Wait();
}

void
Channel::SubmitRequestResponses() noexcept
{
	while (!pending_requests.empty()) {
		auto &request = pending_requests.front();
		const auto result = request.GetResult();
		if (!result)
			/* still running; everything behind it has to
			   wait */
			break;

		const bool want_reply = request.want_reply;
		pending_requests.pop_front_and_dispose(DeleteDisposer{});

		if (*result == RequestResult::ABORT) {
			/* this deletes the channel */
			Close();
			return;
		}

		if (want_reply) {
			try {
				connection.SendPacket(MakeChannelRequestReply(peer_channel,
									      *result == RequestResult::SUCCESS));
			} catch (...) {
				CloseError(std::current_exception());
				return;
			}
		}
	}
}

inline void
Channel::OnRequestDone(std::exception_ptr error) noexcept
{
	assert(!pending_requests.empty());

	if (error)
		CloseError(std::move(error));
	else
		SubmitRequestResponses();
}

void
Channel::OnWindowAdjust(std::size_t nbytes)
{
	send_window += nbytes;
}

void
Channel::OnData(std::span<const std::byte> payload)
{
	ConsumeReceiveWindow(payload.size());
}

void
Channel::OnExtendedData([[maybe_unused]] ChannelExtendedDataType data_type,
			std::span<const std::byte> payload)
{
	ConsumeReceiveWindow(payload.size());
}

Co::EagerTask<RequestResult>
Channel::OnRequest([[maybe_unused]] std::string_view request_type,
		   [[maybe_unused]] std::span<const std::byte> type_specific)
{
	co_return RequestResult::FAILURE;
}

} // namespace SSH
