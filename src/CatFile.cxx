// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CatFile.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "lib/fmt/SystemError.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <fcntl.h>

CatFile::CatFile(const char *path)
{
	if (!fd.Open(path, O_CREAT|O_TRUNC|O_WRONLY|O_NOCTTY, 0644))
		throw FmtErrno("Failed to create {:?}", path);
}

/**
 * Write the whole buffer to a (blocking) file.
 *
 * Throws on error.
 */
static void
WriteFull(FileDescriptor fd, std::span<const std::byte> src)
{
	while (!src.empty()) {
		const auto nbytes = fd.Write(src);
		if (nbytes < 0)
			throw MakeErrno("Failed to write file");

		src = src.subspan(static_cast<std::size_t>(nbytes));
	}
}

void
CatFile::Write(std::span<const std::byte> src) noexcept
{
	if (HasError())
		return;

	try {
		WriteFull(fd, src);
	} catch (...) {
		error = fmt::format("{}", std::current_exception());
	}
}

int
CatFile::Finish() noexcept
{
	if (fd.IsDefined() && !fd.Close() && !HasError())
		error = MakeErrno("Failed to close file").what();

	return HasError() ? 1 : 0;
}
