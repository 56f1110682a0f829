// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ProcessSupervisor.hxx"
#include "spawn/Interface.hxx"
#include "spawn/Prepared.hxx"
#include "spawn/ProcessHandle.hxx"
#include "system/Error.hxx"
#include "io/FdHolder.hxx"
#include "io/Pipe.hxx"

#include <array>
#include <cassert>
#include <stdexcept>

#include <signal.h>

ProcessSupervisor::ProcessSupervisor(EventLoop &event_loop,
				     ProcessSupervisorHandler &_handler,
				     Event::Duration _timeout) noexcept
	:handler(_handler),
	 stdin_pipe(event_loop, BIND_THIS_METHOD(OnStdinReady)),
	 stdout_pipe(event_loop, BIND_THIS_METHOD(OnStdoutReady)),
	 stderr_pipe(event_loop, BIND_THIS_METHOD(OnStderrReady)),
	 timeout_timer(event_loop, BIND_THIS_METHOD(OnTimeout)),
	 timeout(_timeout)
{
}

ProcessSupervisor::~ProcessSupervisor() noexcept
{
	stdin_pipe.Close();
	stdout_pipe.Close();
	stderr_pipe.Close();
}

inline void
ProcessSupervisor::PreparePipes(PreparedChildProcess &p, FdHolder &close_fds)
{
	auto [stdin_r, stdin_w] = CreatePipe();
	auto [stdout_r, stdout_w] = CreatePipe();
	auto [stderr_r, stderr_w] = CreatePipe();

	/* allocate 256 kB for stdin/stdout to maximize throughput
	   of large pushes and clones */
	constexpr int PIPE_BUFFER_SIZE = 256 * 1024;
	stdout_w.SetPipeCapacity(PIPE_BUFFER_SIZE);
	stdin_w.SetPipeCapacity(PIPE_BUFFER_SIZE);

	p.stdin_fd = close_fds.Insert(std::move(stdin_r));
	p.stdout_fd = close_fds.Insert(std::move(stdout_w));
	p.stderr_fd = close_fds.Insert(std::move(stderr_w));

	stdin_w.SetNonBlocking();
	stdout_r.SetNonBlocking();
	stderr_r.SetNonBlocking();

	stdin_pipe.Open(stdin_w.Release());
	stdout_pipe.Open(stdout_r.Release());
	stderr_pipe.Open(stderr_r.Release());
}

void
ProcessSupervisor::Spawn(SpawnService &spawn_service, std::string_view name,
			 PreparedChildProcess &&p)
{
	assert(!child);

	/* the spawner duplicates the child's pipe ends; our copies
	   are closed when this method returns */
	FdHolder close_fds;
	PreparePipes(p, close_fds);

	child = spawn_service.SpawnChildProcess(name, std::move(p));
	child->SetExitListener(*this);

	if (timeout.count() > 0)
		timeout_timer.Schedule(timeout);
}

std::size_t
ProcessSupervisor::WriteStdin(std::span<const std::byte> src)
{
	if (!stdin_pipe.IsDefined())
		/* the process has closed its stdin (or has exited);
		   discard the data */
		return src.size();

	const auto nbytes = stdin_pipe.GetFileDescriptor().Write(src);
	if (nbytes < 0) {
		switch (const int e = errno; e) {
		case EAGAIN:
			stdin_pipe.ScheduleWrite();
			return 0;

		case EPIPE:
			stdin_pipe.Close();
			return src.size();

		default:
			throw MakeErrno(e, "Failed to write to stdin pipe");
		}
	}

	const std::size_t consumed = static_cast<std::size_t>(nbytes);
	if (consumed < src.size())
		stdin_pipe.ScheduleWrite();

	return consumed;
}

void
ProcessSupervisor::ScheduleRead() noexcept
{
	if (stdout_pipe.IsDefined())
		stdout_pipe.ScheduleRead();
	if (stderr_pipe.IsDefined())
		stderr_pipe.ScheduleRead();
}

void
ProcessSupervisor::CancelRead() noexcept
{
	/* cancel completely to avoid getting HANGUP events which we
	   can't handle while paused */
	stdout_pipe.Cancel();
	stderr_pipe.Cancel();
}

bool
ProcessSupervisor::CheckDone() noexcept
{
	if (!exited || IsOutputActive())
		return false;

	timeout_timer.Cancel();
	handler.OnProcessDone(exit_status);
	return true;
}

inline void
ProcessSupervisor::ReadOutput(PipeEvent &pipe, bool is_stderr)
{
	std::array<std::byte, 16384> buffer;
	std::span<std::byte> dest{buffer};

	const std::size_t limit = handler.GetProcessOutputLimit();
	if (limit == 0) {
		/* wait for the peer to enlarge the window */
		CancelRead();
		return;
	}

	if (limit < dest.size())
		dest = dest.first(limit);

	const auto nbytes = pipe.GetFileDescriptor().Read(dest);
	if (nbytes > 0) {
		handler.OnProcessOutput(is_stderr, dest.first(nbytes));

		if (handler.GetProcessOutputLimit() == 0)
			CancelRead();

		return;
	}

	if (nbytes < 0) {
		if (const int e = errno; e == EAGAIN)
			return;

		throw MakeErrno(e, "Failed to read from pipe");
	}

	/* end of file */
	pipe.Close();
	CheckDone();
}

void
ProcessSupervisor::OnStdinReady(unsigned events) noexcept
try {
	stdin_pipe.CancelWrite();

	if (events & (PipeEvent::ERROR|PipeEvent::HANGUP))
		/* the process has closed its end of the pipe */
		stdin_pipe.Close();

	handler.OnProcessStdinReady();
} catch (...) {
	handler.OnProcessError(std::current_exception());
}

void
ProcessSupervisor::OnStdoutReady([[maybe_unused]] unsigned events) noexcept
try {
	ReadOutput(stdout_pipe, false);
} catch (...) {
	handler.OnProcessError(std::current_exception());
}

void
ProcessSupervisor::OnStderrReady([[maybe_unused]] unsigned events) noexcept
try {
	ReadOutput(stderr_pipe, true);
} catch (...) {
	handler.OnProcessError(std::current_exception());
}

void
ProcessSupervisor::OnTimeout() noexcept
{
	switch (NextDeadlineAction(deadline_phase, child != nullptr)) {
	case DeadlineAction::TERMINATE:
		deadline_phase = DeadlinePhase::TERMINATING;
		child->Kill(SIGTERM);
		timeout_timer.Schedule(KILL_GRACE_PERIOD);
		handler.OnProcessTimeout();
		break;

	case DeadlineAction::KILL:
		deadline_phase = DeadlinePhase::KILLED;
		child->Kill(SIGKILL);
		timeout_timer.Schedule(KILL_GRACE_PERIOD);
		break;

	case DeadlineAction::ABANDON:
		handler.OnProcessError(std::make_exception_ptr(std::runtime_error{"Execution timeout"}));
		break;
	}
}

void
ProcessSupervisor::OnChildProcessExit(int status) noexcept
{
	/* the deadline timer keeps running until all output has been
	   delivered */
	child.reset();
	stdin_pipe.Close();

	exit_status = status;
	exited = true;

	CheckDone();
}
