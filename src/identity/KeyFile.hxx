// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "Lookup.hxx"

#include <cstddef>
#include <map>
#include <string>

class BufferedReader;

/**
 * An #IdentityLookup implementation which reads a text file.  Each
 * line contains the identity, the key type and the base64 encoded
 * public key blob, separated by spaces; anything after that is a
 * comment.  Empty lines and lines starting with '#' are ignored.
 *
 *     42 ssh-ed25519 AAAAC3NzaC1lZDI1NTE5AAAA... alice@laptop
 */
class KeyFileIdentityLookup final : public IdentityLookup {
	/**
	 * Maps the canonical "TYPE BASE64" string to the identity.
	 */
	std::map<std::string, std::string, std::less<>> keys;

	const std::string path;

public:
	/**
	 * @param _path the file to be loaded by Reload(); may be
	 * empty if the caller uses Load() instead
	 */
	explicit KeyFileIdentityLookup(std::string_view _path={}) noexcept
		:path(_path) {}

	std::size_t size() const noexcept {
		return keys.size();
	}

	/**
	 * Replace all keys with the ones from the given text.
	 *
	 * @return the number of malformed lines that were skipped
	 */
	std::size_t Load(std::string_view contents);

	/**
	 * Replace all keys with the contents of the file specified in
	 * the constructor.  On error, the old keys are kept.
	 *
	 * Throws on I/O error.
	 *
	 * @return the number of malformed lines that were skipped
	 */
	std::size_t Reload();

	/**
	 * Synchronous version of Lookup() (for unit tests and the
	 * coroutine).
	 */
	[[gnu::pure]]
	std::string_view Find(std::string_view authorized_key) const noexcept;

	/* virtual methods from class IdentityLookup */
	Co::Task<std::string> Lookup(std::string_view authorized_key) override;

private:
	using Map = decltype(keys);

	static bool LoadLine(Map &map, std::string_view line);
	static std::size_t Load(Map &map, BufferedReader &r);
};
