// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "io/UniqueFileDescriptor.hxx"

#include <cstddef>
#include <span>
#include <string>

/**
 * The destination of the built-in "cat PATH" command: the file is
 * created (or truncated) and receives the channel input verbatim.
 */
class CatFile {
	UniqueFileDescriptor fd;

	/**
	 * The first error; after that, all data is discarded.
	 */
	std::string error;

public:
	/**
	 * Throws std::system_error if the file cannot be created.
	 */
	explicit CatFile(const char *path);

	bool HasError() const noexcept {
		return !error.empty();
	}

	const std::string &GetError() const noexcept {
		return error;
	}

	/**
	 * Append data to the file.  Errors are not thrown but
	 * remembered (see HasError()).
	 */
	void Write(std::span<const std::byte> src) noexcept;

	/**
	 * Close the file.
	 *
	 * @return the exit status to be reported to the client
	 */
	int Finish() noexcept;
};
