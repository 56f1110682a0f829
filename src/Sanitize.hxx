// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * Strip everything before the first occurrence of "git".  Some
 * clients (e.g. with a ProxyCommand) send a garbage prefix before
 * the actual git command.  If the line does not contain "git" or
 * if it starts with the built-in "cat" command, it is returned
 * as-is.
 */
[[gnu::pure]]
std::string_view
StripCommandPrefix(std::string_view line) noexcept;

/**
 * Is this Unicode code point printable?  Control characters,
 * separators other than U+0020, format characters, surrogates,
 * private-use characters and noncharacters are not.
 *
 * Unlike a full Unicode "graphic" test, this does not consult the
 * character database: code points which are currently unassigned
 * (e.g. U+0378) count as printable.  They cannot hide or reorder
 * text, and treating them as printable keeps the result stable
 * across Unicode versions.
 */
[[gnu::const]]
bool
IsPrintableCodePoint(char32_t ch) noexcept;

/**
 * Remove all non-printable characters and all invalid UTF-8
 * sequences from the given string.
 */
std::string
DropNonPrintable(std::string_view s);

/**
 * Convert an untrusted "exec" command line to an argument list:
 * StripCommandPrefix(), trim leading quotes and parentheses, split
 * at whitespace, DropNonPrintable() and finally drop empty tokens.
 * Shell quoting is not interpreted.
 *
 * The returned list may be empty; the caller must check that
 * before looking at the first token.
 */
std::vector<std::string>
SanitizeCommand(std::string_view line);

/**
 * May the peer set this environment variable (with an "env"
 * request)?  The name must be a valid shell identifier, and
 * variables which gitgate sets for the child process or which
 * affect the dynamic linker are refused.
 */
[[gnu::pure]]
bool
IsAcceptableEnvName(std::string_view name) noexcept;
