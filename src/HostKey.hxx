// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <filesystem>
#include <memory>
#include <string>

class SecretKey;
class RSAKey;

/**
 * The path of the host key file for the given port:
 * "STATE_DIRECTORY/ssh/gitgate_PORT.rsa".
 */
std::filesystem::path
MakeHostKeyPath(const std::filesystem::path &state_directory,
		unsigned port) noexcept;

/**
 * Encode the key pair as an unencrypted PEM (PKCS#8) file.
 *
 * Throws on error.
 */
std::string
FormatPemPrivateKey(const RSAKey &key);

struct LoadedHostKey {
	std::unique_ptr<SecretKey> key;

	/**
	 * Was the key generated just now (because the file did not
	 * exist)?
	 */
	bool generated;
};

/**
 * Load the host key from the given file.  If the file does not
 * exist, generate a new RSA key and store it.  The new file is
 * written to a temporary file and then link()ed to its final name,
 * so concurrent processes never see a partial file; if another
 * process wins the race, its key is loaded.
 *
 * Throws on error.
 */
LoadedHostKey
LoadOrGenerateHostKey(const std::filesystem::path &path);
