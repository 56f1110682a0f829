// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "LookPath.hxx"
#include "util/IterableSplitString.hxx"

#include <fmt/core.h>

#include <stdexcept>

#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

static bool
IsExecutableFile(const char *path) noexcept
{
	struct stat st;
	return stat(path, &st) == 0 && S_ISREG(st.st_mode) &&
		access(path, X_OK) == 0;
}

std::string
LookPath(std::string_view name, std::string_view search_path)
{
	if (name.empty())
		throw std::runtime_error{"Empty program name"};

	if (name.find('/') != name.npos) {
		if (!name.starts_with('/'))
			throw std::runtime_error{fmt::format("Relative program path not allowed: {:?}", name)};

		std::string path{name};
		if (!IsExecutableFile(path.c_str()))
			throw std::runtime_error{fmt::format("Not an executable: {:?}", name)};

		return path;
	}

	for (const std::string_view directory : IterableSplitString(search_path, ':')) {
		if (!directory.starts_with('/'))
			/* don't look up programs relative to the
			   current working directory */
			continue;

		std::string path{directory};
		if (!path.ends_with('/'))
			path.push_back('/');
		path.append(name);

		if (IsExecutableFile(path.c_str()))
			return path;
	}

	throw std::runtime_error{fmt::format("Executable not found in search path: {:?}", name)};
}

std::string
LookPath(std::string_view name)
{
	const char *search_path = getenv("PATH");
	if (search_path == nullptr)
		search_path = DEFAULT_SEARCH_PATH;

	return LookPath(name, search_path);
}
