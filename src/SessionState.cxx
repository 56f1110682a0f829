// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SessionState.hxx"
#include "Sanitize.hxx"

#include <fmt/core.h>

#include <utility> // for std::exchange()

#include <string.h> // for sigabbrev_np()
#include <sys/wait.h>

using std::string_view_literals::operator""sv;

EnvVerdict
SessionState::AddEnv(std::string_view name, std::string_view value)
{
	if (exec_received)
		/* too late; the process has already been started */
		return EnvVerdict::TOO_LATE;

	if (name.empty() || value.empty() ||
	    value.find('\0') != value.npos)
		return EnvVerdict::INVALID;

	if (!IsAcceptableEnvName(name))
		return EnvVerdict::REFUSED;

	/* this integer addition cannot overflow because the packet
	   size is limited; the 32 is an arbitrary number to limit the
	   number of (tiny) environment variables */
	const std::size_t new_size = env_size + name.size() + value.size() + 32;
	if (new_size > MAX_ENV_SIZE)
		return EnvVerdict::TOO_LARGE;

	env.emplace_front(fmt::format("{}={}"sv, name, value));
	env_size = new_size;
	return EnvVerdict::ACCEPTED;
}

bool
SessionState::BeginExec() noexcept
{
	return !std::exchange(exec_received, true);
}

CommandKind
ClassifyCommand(const std::vector<std::string> &args) noexcept
{
	if (args.empty())
		return CommandKind::EMPTY;

	if (args.front() == "cat"sv)
		return args.size() < 2
			? CommandKind::CAT_WITHOUT_PATH
			: CommandKind::CAT;

	return CommandKind::SPAWN;
}

ExitReport
DescribeExit(int wait_status) noexcept
{
	if (WIFSIGNALED(wait_status)) {
		const int signo = WTERMSIG(wait_status);
		const char *name = sigabbrev_np(signo);

		return {
			name != nullptr ? name : "UNKNOWN",
			signo,
			WCOREDUMP(wait_status) != 0,
		};
	}

	return {nullptr, WEXITSTATUS(wait_status), false};
}
