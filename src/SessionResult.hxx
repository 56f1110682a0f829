// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

/**
 * The outcome of one "exec" request, reported by the
 * #SessionChannel to its #Connection when the channel is destroyed.
 */
struct SessionResult {
	enum class Outcome : uint_least8_t {
		/**
		 * The process has exited; #status is its exit code.
		 */
		EXITED,

		/**
		 * The process was killed; #status is the signal number.
		 */
		SIGNALED,

		/**
		 * The "cat" command has written the channel input to
		 * a file; #status is the exit status sent to the
		 * peer.
		 */
		FILE_WRITTEN,

		/**
		 * The command was not executed or the channel was
		 * aborted because of an error; see #error.
		 */
		ABORTED,

		/**
		 * The peer closed the channel (or the connection)
		 * before the command finished.
		 */
		CLOSED_BY_PEER,
	};

	/**
	 * The sanitized command line.
	 */
	std::string command;

	Outcome outcome = Outcome::CLOSED_BY_PEER;

	int status = 0;

	/**
	 * Bytes received from the peer (written to stdin or to the
	 * file) and bytes sent to the peer (stdout and stderr).
	 */
	uint_least64_t bytes_in = 0, bytes_out = 0;

	std::string error;
};

[[gnu::const]]
std::string_view
ToString(SessionResult::Outcome outcome) noexcept;
