// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <forward_list>
#include <string>
#include <string_view>
#include <vector>

enum class EnvVerdict : uint_least8_t {
	ACCEPTED,

	/**
	 * The "exec" request has already been received.
	 */
	TOO_LATE,

	/**
	 * Empty name or value, or a null byte in the value.
	 */
	INVALID,

	/**
	 * The name is not on the list of variables a client may
	 * set (see IsAcceptableEnvName()).
	 */
	REFUSED,

	TOO_LARGE,
};

/**
 * The request bookkeeping of a session channel: the environment
 * collected from "env" requests and whether "exec" has been seen.
 * A refused "env" request leaves this object unchanged.
 */
class SessionState {
	/**
	 * The maximum total size of all environment variables.
	 */
	static constexpr std::size_t MAX_ENV_SIZE = 16 * 1024;

	/**
	 * Environment variables for the new process: a linked list of
	 * "NAME=VALUE" strings.
	 */
	std::forward_list<std::string> env;

	std::size_t env_size = 0;

	bool exec_received = false;

public:
	EnvVerdict AddEnv(std::string_view name, std::string_view value);

	const std::forward_list<std::string> &GetEnv() const noexcept {
		return env;
	}

	bool IsExecReceived() const noexcept {
		return exec_received;
	}

	/**
	 * Mark the "exec" request as received.
	 *
	 * @return false if there already was one (which must then be
	 * refused without looking at it)
	 */
	bool BeginExec() noexcept;
};

enum class CommandKind : uint_least8_t {
	EMPTY,

	/**
	 * The built-in "cat PATH" command.
	 */
	CAT,

	/**
	 * "cat" without a destination path.
	 */
	CAT_WITHOUT_PATH,

	/**
	 * Anything else is spawned as a child process.
	 */
	SPAWN,
};

/**
 * Decide how to execute a sanitized command.
 */
[[gnu::pure]]
CommandKind
ClassifyCommand(const std::vector<std::string> &args) noexcept;

/**
 * What to report to the client about a terminated child process.
 */
struct ExitReport {
	/**
	 * The signal name without the "SIG" prefix (for
	 * "exit-signal"); nullptr if the process has exited
	 * normally.
	 */
	const char *signal_name;

	/**
	 * The exit status or the signal number.
	 */
	int status;

	bool core_dumped;

	bool IsSignaled() const noexcept {
		return signal_name != nullptr;
	}
};

/**
 * Translate a waitpid() status.
 */
[[gnu::pure]]
ExitReport
DescribeExit(int wait_status) noexcept;
