// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "ProcessSupervisor.hxx"
#include "SessionResult.hxx"
#include "SessionState.hxx"
#include "ssh/BufferedChannel.hxx"
#include "event/DeferEvent.hxx"

#include <forward_list>
#include <memory>
#include <string>
#include <vector>

namespace Co { template<typename T> class Task; }
struct PreparedChildProcess;
class CatFile;
class Connection;
class Logger;

/**
 * A "session" channel (RFC 4254 section 6) which accepts "env"
 * requests and exactly one "exec" request.  The command is either
 * the built-in "cat PATH" (which writes the channel input to a
 * file) or a process started by #ProcessSupervisor.
 */
class SessionChannel final : public SSH::BufferedChannel, ProcessSupervisorHandler
{
	Connection &connection;

	const Logger &logger;

	SessionState state;

	/**
	 * The destination file of the "cat" command.
	 */
	std::unique_ptr<CatFile> cat;

	std::unique_ptr<ProcessSupervisor> process;

	/**
	 * Begins relaying data after the reply to the "exec" request
	 * has been sent.
	 */
	DeferEvent start_event;

	SessionResult result;

	/**
	 * Has relaying data begun?  Until then, all channel input
	 * remains in the buffer.
	 */
	bool started = false;

	/**
	 * Was CHANNEL_EOF received before #started was set?
	 */
	bool input_eof = false;

	/**
	 * Is the SSH connection currently unable to send more data?
	 */
	bool write_blocked = false;

public:
	SessionChannel(Connection &_connection,
		       SSH::ChannelInit init) noexcept;

	~SessionChannel() noexcept override;

	/* virtual methods from class SSH::Channel */
	void OnWindowAdjust(std::size_t nbytes) override;
	Co::EagerTask<SSH::RequestResult> OnRequest(std::string_view request_type,
						    std::span<const std::byte> type_specific) override;
	void OnWriteBlocked() noexcept override;
	void OnWriteUnblocked() noexcept override;

	/* virtual methods from class SSH::BufferedChannel */
	std::size_t OnBufferedData(std::span<const std::byte> payload) override;
	void OnBufferedEof() override;

private:
	SSH::RequestResult HandleEnv(std::span<const std::byte> type_specific);

	/**
	 * Mark the session as aborted, log the error and return
	 * #SSH::RequestResult::ABORT.
	 */
	SSH::RequestResult Abort(std::string &&error) noexcept;

	SSH::RequestResult OpenCatFile(const char *path) noexcept;

	/**
	 * Finish the "cat" command: send the exit status and close
	 * the channel.
	 */
	void FinishCat();

	/**
	 * @param strings storage for strings referenced by #p
	 */
	void PrepareChildProcess(PreparedChildProcess &p,
				 const std::vector<std::string> &args,
				 std::forward_list<std::string> &strings);

	[[nodiscard]]
	Co::Task<SSH::RequestResult> SpawnProcess(const std::vector<std::string> &args);

	[[nodiscard]]
	Co::Task<SSH::RequestResult> Exec(std::string_view command_line);

	void OnStart() noexcept;

	/* virtual methods from class ProcessSupervisorHandler */
	std::size_t GetProcessOutputLimit() const noexcept override;
	void OnProcessOutput(bool is_stderr,
			     std::span<const std::byte> src) override;
	void OnProcessStdinReady() override;
	void OnProcessTimeout() noexcept override;
	void OnProcessDone(int status) noexcept override;
	void OnProcessError(std::exception_ptr error) noexcept override;
};
