// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "spawn/ExitListener.hxx"
#include "event/CoarseTimerEvent.hxx"
#include "event/PipeEvent.hxx"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <span>
#include <string_view>

struct PreparedChildProcess;
class ChildProcessHandle;
class FdHolder;
class SpawnService;

class ProcessSupervisorHandler {
public:
	/**
	 * How many bytes may be passed to OnProcessOutput() right
	 * now?  If this is zero, reading from the process is paused
	 * until ProcessSupervisor::ScheduleRead() is called.
	 */
	[[gnu::pure]]
	virtual std::size_t GetProcessOutputLimit() const noexcept = 0;

	/**
	 * The process has written data to its stdout or stderr.
	 * This method must not destroy the #ProcessSupervisor.
	 *
	 * Throws on error.
	 */
	virtual void OnProcessOutput(bool is_stderr,
				     std::span<const std::byte> src) = 0;

	/**
	 * The stdin pipe has become writable again after
	 * ProcessSupervisor::WriteStdin() was not able to consume
	 * everything.  This method must not destroy the
	 * #ProcessSupervisor.
	 *
	 * Throws on error.
	 */
	virtual void OnProcessStdinReady() = 0;

	/**
	 * The execution deadline has expired and SIGTERM was sent.
	 * This is only informational; OnProcessDone() or
	 * OnProcessError() will be called later.
	 */
	virtual void OnProcessTimeout() noexcept = 0;

	/**
	 * The process has exited and all of its output has been
	 * delivered.  The handler may destroy the
	 * #ProcessSupervisor.
	 *
	 * @param status the wait status (see waitpid())
	 */
	virtual void OnProcessDone(int status) noexcept = 0;

	/**
	 * An error has occurred while relaying data.  The handler
	 * may destroy the #ProcessSupervisor.
	 */
	virtual void OnProcessError(std::exception_ptr error) noexcept = 0;
};

enum class DeadlinePhase : uint_least8_t {
	/**
	 * The deadline has not expired yet.
	 */
	RUNNING,

	/**
	 * SIGTERM has been sent.
	 */
	TERMINATING,

	/**
	 * SIGKILL has been sent.
	 */
	KILLED,
};

enum class DeadlineAction : uint_least8_t {
	/**
	 * Send SIGTERM and wait for the grace period.
	 */
	TERMINATE,

	/**
	 * Send SIGKILL and wait for the grace period.
	 */
	KILL,

	/**
	 * Give up: report an error to the handler.  This happens if
	 * the process has exited but its stdout/stderr are still
	 * open (e.g. held by a grandchild), or if it did not go away
	 * even after SIGKILL.
	 */
	ABANDON,
};

/**
 * Decide what to do when the deadline timer fires.
 *
 * @param running true if the process has not yet exited
 */
[[gnu::const]]
constexpr DeadlineAction
NextDeadlineAction(DeadlinePhase phase, bool running) noexcept
{
	if (!running)
		return DeadlineAction::ABANDON;

	switch (phase) {
	case DeadlinePhase::RUNNING:
		return DeadlineAction::TERMINATE;

	case DeadlinePhase::TERMINATING:
		return DeadlineAction::KILL;

	case DeadlinePhase::KILLED:
		break;
	}

	return DeadlineAction::ABANDON;
}

/**
 * Owns one child process and the pipes connected to its stdin,
 * stdout and stderr.  Destroying this object kills the process.
 */
class ProcessSupervisor final : ExitListener {
	ProcessSupervisorHandler &handler;

	std::unique_ptr<ChildProcessHandle> child;

	PipeEvent stdin_pipe, stdout_pipe, stderr_pipe;

	/**
	 * How long to wait after SIGTERM and after SIGKILL.
	 */
	static constexpr Event::Duration KILL_GRACE_PERIOD = std::chrono::seconds{5};

	CoarseTimerEvent timeout_timer;

	const Event::Duration timeout;

	DeadlinePhase deadline_phase = DeadlinePhase::RUNNING;

	/**
	 * The wait status passed to OnChildProcessExit().
	 */
	int exit_status;

	bool exited = false;

public:
	/**
	 * @param _timeout the execution deadline; zero disables it
	 */
	ProcessSupervisor(EventLoop &event_loop,
			  ProcessSupervisorHandler &_handler,
			  Event::Duration _timeout) noexcept;

	~ProcessSupervisor() noexcept;

	ProcessSupervisor(const ProcessSupervisor &) = delete;
	ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

	/**
	 * Create the pipes and ask the spawner to start the process.
	 * Use GetChildProcess() to wait for the spawner's
	 * confirmation.
	 *
	 * Throws on error.
	 */
	void Spawn(SpawnService &spawn_service, std::string_view name,
		   PreparedChildProcess &&p);

	ChildProcessHandle &GetChildProcess() const noexcept {
		return *child;
	}

	/**
	 * Are stdout or stderr still open?
	 */
	bool IsOutputActive() const noexcept {
		return stdout_pipe.IsDefined() || stderr_pipe.IsDefined();
	}

	/**
	 * Write data to the process's stdin.  If the pipe has been
	 * closed by the process, the data is discarded.
	 *
	 * Throws on error.
	 *
	 * @return the number of bytes consumed; if that is less than
	 * the given size, OnProcessStdinReady() will be called later
	 */
	std::size_t WriteStdin(std::span<const std::byte> src);

	/**
	 * The peer will not send any more data; close the stdin
	 * pipe.
	 */
	void CloseStdin() noexcept {
		stdin_pipe.Close();
	}

	/**
	 * Resume reading stdout and stderr (e.g. after the peer has
	 * enlarged the window).
	 */
	void ScheduleRead() noexcept;

	/**
	 * Pause reading stdout and stderr.
	 */
	void CancelRead() noexcept;

private:
	void PreparePipes(PreparedChildProcess &p, FdHolder &close_fds);

	/**
	 * Invoke ProcessSupervisorHandler::OnProcessDone() if the
	 * process has exited and all output has been delivered.
	 *
	 * @return true if the handler was invoked (and this object
	 * may have been destroyed)
	 */
	bool CheckDone() noexcept;

	/**
	 * Read a chunk from stdout or stderr and pass it to the
	 * handler.  After end-of-file, this object may have been
	 * destroyed by CheckDone().
	 */
	void ReadOutput(PipeEvent &pipe, bool is_stderr);

	void OnStdinReady(unsigned events) noexcept;
	void OnStdoutReady(unsigned events) noexcept;
	void OnStderrReady(unsigned events) noexcept;
	void OnTimeout() noexcept;

	/* virtual methods from class ExitListener */
	void OnChildProcessExit(int status) noexcept override;
};
