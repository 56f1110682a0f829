// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "SessionChannel.hxx"
#include "CatFile.hxx"
#include "Connection.hxx"
#include "Config.hxx"
#include "LookPath.hxx"
#include "Sanitize.hxx"
#include "ssh/Deserializer.hxx"
#include "ssh/ParsePacket.hxx"
#include "spawn/Prepared.hxx"
#include "spawn/ProcessHandle.hxx"
#include "spawn/CoEnqueue.hxx"
#include "spawn/CoWaitSpawnCompletion.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "co/Task.hxx"

#include <fmt/core.h>

#include <stdlib.h> // for getenv()
#include <unistd.h> // for geteuid()

using std::string_view_literals::operator""sv;

SessionChannel::SessionChannel(Connection &_connection,
			       SSH::ChannelInit init) noexcept
	:SSH::BufferedChannel(_connection, init),
	 connection(_connection),
	 logger(_connection.GetLogger()),
	 start_event(_connection.GetEventLoop(), BIND_THIS_METHOD(OnStart))
{
}

SessionChannel::~SessionChannel() noexcept
{
	if (state.IsExecReceived())
		connection.OnSessionResult(result);
}

inline SSH::RequestResult
SessionChannel::HandleEnv(std::span<const std::byte> type_specific)
{
	SSH::EnvRequest p;

	try {
		p = SSH::ParseEnvRequest(type_specific);
	} catch (const SSH::MalformedPacket &) {
		logger(1, "Malformed env request");
		return SSH::RequestResult::FAILURE;
	}

	switch (state.AddEnv(p.name, p.value)) {
	case EnvVerdict::ACCEPTED:
		logger.Fmt(2, "  env {}={:?}"sv, p.name, p.value);
		return SSH::RequestResult::SUCCESS;

	case EnvVerdict::TOO_LATE:
		logger.Fmt(1, "Ignoring env request {:?} after exec"sv, p.name);
		break;

	case EnvVerdict::INVALID:
		logger.Fmt(1, "Invalid env request {:?}={:?}"sv, p.name, p.value);
		break;

	case EnvVerdict::REFUSED:
		logger.Fmt(1, "Refusing environment variable {:?}"sv, p.name);
		break;

	case EnvVerdict::TOO_LARGE:
		logger(1, "Environment too large");
		break;
	}

	return SSH::RequestResult::FAILURE;
}

SSH::RequestResult
SessionChannel::Abort(std::string &&error) noexcept
{
	logger.Fmt(1, "Failed to execute {:?}: {}"sv, result.command, error);

	process.reset();
	cat.reset();

	result.outcome = SessionResult::Outcome::ABORTED;
	result.error = std::move(error);
	return SSH::RequestResult::ABORT;
}

inline SSH::RequestResult
SessionChannel::OpenCatFile(const char *path) noexcept
try {
	cat = std::make_unique<CatFile>(path);

	logger.Fmt(2, "Writing to {:?}"sv, path);

	start_event.Schedule();
	return SSH::RequestResult::SUCCESS;
} catch (...) {
	return Abort(fmt::format("{}", std::current_exception()));
}

void
SessionChannel::FinishCat()
{
	result.outcome = SessionResult::Outcome::FILE_WRITTEN;
	result.status = cat->Finish();

	if (cat->HasError()) {
		logger.Fmt(1, "Failed to write {:?}: {}"sv,
			   result.command, cat->GetError());
		result.error = cat->GetError();
	}

	cat.reset();

	SendExitStatus(result.status);
	SendEof();
	Close();
}

inline void
SessionChannel::PrepareChildProcess(PreparedChildProcess &p,
				    const std::vector<std::string> &args,
				    std::forward_list<std::string> &strings)
{
	const auto &config = connection.GetConfig();
	const std::string_view key_id = connection.GetKeyId();

	if (!config.serv_command.empty()) {
		/* run the trusted command instead of the requested
		   one; it gets the original command line from the
		   environment */
		p.exec_path = config.serv_command.c_str();
		p.Append(config.serv_command.c_str());
		p.Append("serv");
		p.Append(strings.emplace_front(fmt::format("key-{}"sv, key_id)).c_str());
		if (!config.serv_argument.empty())
			p.Append(config.serv_argument.c_str());
	} else {
		p.exec_path = strings.emplace_front(LookPath(args.front())).c_str();
		for (const auto &i : args)
			p.Append(i.c_str());
	}

	/* run with our own effective uid/gid */
	p.uid_gid.effective_uid = geteuid();
	p.uid_gid.effective_gid = getegid();

	for (const auto &i : state.GetEnv())
		p.PutEnv(i.c_str());

	p.SetEnv("SSH_ORIGINAL_COMMAND"sv, result.command);
	p.SetEnv("GITGATE_KEY_ID"sv, key_id);

	const char *path = getenv("PATH");
	p.SetEnv("PATH"sv, path != nullptr ? path : DEFAULT_SEARCH_PATH);

	if (const char *home = getenv("HOME"))
		p.SetEnv("HOME"sv, home);
}

inline Co::Task<SSH::RequestResult>
SessionChannel::SpawnProcess(const std::vector<std::string> &args)
{
	const auto &config = connection.GetConfig();

	/* throttle if the spawner is under pressure */
	co_await CoEnqueueSpawner(connection.GetSpawnService());

	std::forward_list<std::string> strings;
	PreparedChildProcess p;
	PrepareChildProcess(p, args, strings);

	process = std::make_unique<ProcessSupervisor>(connection.GetEventLoop(),
						      *this,
						      config.exec_timeout);
	process->Spawn(connection.GetSpawnService(), args.front(), std::move(p));

	co_await CoWaitSpawnCompletion{process->GetChildProcess()};

	logger.Fmt(2, "Started {:?}"sv, result.command);

	start_event.Schedule();
	co_return SSH::RequestResult::SUCCESS;
}

inline Co::Task<SSH::RequestResult>
SessionChannel::Exec(std::string_view command_line)
{
	const auto args = SanitizeCommand(command_line);

	for (const auto &i : args) {
		if (!result.command.empty())
			result.command.push_back(' ');
		result.command.append(i);
	}

	switch (ClassifyCommand(args)) {
	case CommandKind::EMPTY:
		co_return Abort("Empty command");

	case CommandKind::CAT_WITHOUT_PATH:
		co_return Abort("Missing destination path");

	case CommandKind::CAT:
		co_return OpenCatFile(args[1].c_str());

	case CommandKind::SPAWN:
		break;
	}

	co_return co_await SpawnProcess(args);
}

Co::EagerTask<SSH::RequestResult>
SessionChannel::OnRequest(std::string_view request_type,
			  std::span<const std::byte> type_specific)
{
	logger.Fmt(2, "ChannelRequest {:?}"sv, request_type);

	if (request_type == "env"sv) {
		co_return HandleEnv(type_specific);
	} else if (request_type == "exec"sv) {
		std::string_view command;

		try {
			command = SSH::ParseExecRequest(type_specific).command;
		} catch (const SSH::MalformedPacket &) {
			logger(1, "Malformed exec request");
			co_return SSH::RequestResult::FAILURE;
		}

		static constexpr std::size_t MAX_LOG_SIZE = 256;
		logger.Fmt(2, "  exec {:?}{}"sv,
			   command.substr(0, MAX_LOG_SIZE),
			   command.size() > MAX_LOG_SIZE ? "..."sv : ""sv);

		if (!state.BeginExec()) {
			/* only one command per channel */
			logger(1, "Refusing second exec request");
			co_return SSH::RequestResult::FAILURE;
		}

		try {
			co_return co_await Exec(command);
		} catch (...) {
			co_return Abort(fmt::format("{}", std::current_exception()));
		}
	} else
		co_return SSH::RequestResult::FAILURE;
}

void
SessionChannel::OnStart() noexcept
try {
	started = true;

	if (process && !write_blocked)
		process->ScheduleRead();

	if (!input_eof)
		ReadBuffer();
	else if (cat)
		FinishCat();
	else if (process)
		process->CloseStdin();
} catch (...) {
	CloseError(std::current_exception());
}

void
SessionChannel::OnWindowAdjust(std::size_t nbytes)
{
	Channel::OnWindowAdjust(nbytes);

	if (process && started && !write_blocked)
		/* re-schedule all read events, because we may now be
		   allowed to send data again */
		process->ScheduleRead();
}

std::size_t
SessionChannel::OnBufferedData(std::span<const std::byte> payload)
{
	if (!started)
		/* keep it in the buffer until the reply to "exec"
		   has been sent */
		return 0;

	if (cat) {
		cat->Write(payload);

		/* after an error, the rest of the input is
		   discarded */
		result.bytes_in += payload.size();
		return payload.size();
	}

	if (process) {
		const std::size_t nbytes = process->WriteStdin(payload);
		result.bytes_in += nbytes;
		return nbytes;
	}

	return payload.size();
}

void
SessionChannel::OnBufferedEof()
{
	if (!started)
		input_eof = true;
	else if (cat)
		FinishCat();
	else if (process)
		process->CloseStdin();
}

void
SessionChannel::OnWriteBlocked() noexcept
{
	write_blocked = true;

	if (process)
		process->CancelRead();
}

void
SessionChannel::OnWriteUnblocked() noexcept
{
	write_blocked = false;

	if (process && started)
		process->ScheduleRead();
}

std::size_t
SessionChannel::GetProcessOutputLimit() const noexcept
{
	return write_blocked ? 0 : GetMaxSendSize();
}

void
SessionChannel::OnProcessOutput(bool is_stderr,
				std::span<const std::byte> src)
{
	if (is_stderr)
		SendStderr(src);
	else
		SendData(src);

	result.bytes_out += src.size();
}

void
SessionChannel::OnProcessStdinReady()
{
	ReadBuffer();
}

void
SessionChannel::OnProcessTimeout() noexcept
{
	logger.Fmt(1, "Execution timeout for {:?}, sending SIGTERM"sv,
		   result.command);
	result.error = "Execution timeout";
}

void
SessionChannel::OnProcessDone(int status) noexcept
try {
	process.reset();

	const auto report = DescribeExit(status);
	result.status = report.status;

	if (report.IsSignaled()) {
		result.outcome = SessionResult::Outcome::SIGNALED;
		SendExitSignal(report.signal_name, report.core_dumped, {});
	} else {
		result.outcome = SessionResult::Outcome::EXITED;
		SendExitStatus(result.status);
	}

	SendEof();
	Close();
} catch (...) {
	CloseError(std::current_exception());
}

void
SessionChannel::OnProcessError(std::exception_ptr error) noexcept
{
	logger.Fmt(1, "Process {:?} failed: {}"sv, result.command, error);

	result.outcome = SessionResult::Outcome::ABORTED;
	result.error = fmt::format("{}", error);

	/* this kills the process */
	Close();
}
