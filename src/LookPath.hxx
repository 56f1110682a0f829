// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

/**
 * The search path used if $PATH is not set.
 */
inline constexpr const char *DEFAULT_SEARCH_PATH = "/usr/local/bin:/usr/bin:/bin";

/**
 * Resolve a program name to the absolute path of an executable
 * file, similar to execvp().  An absolute path is not looked up;
 * it is only checked.  Other names containing a slash are refused
 * because they would be resolved relative to the current working
 * directory.  Empty and relative elements of the search path are
 * skipped.
 *
 * Throws std::runtime_error if no executable was found.
 *
 * @param search_path a colon-separated list of directories
 */
std::string
LookPath(std::string_view name, std::string_view search_path);

/**
 * Like LookPath(), but use $PATH (or #DEFAULT_SEARCH_PATH).
 */
std::string
LookPath(std::string_view name);
