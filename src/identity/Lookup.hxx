// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <string>
#include <string_view>

namespace Co { template<typename T> class Task; }

/**
 * Maps a client's public key to the identity ("key-id") of the
 * account it belongs to.  This is the only authorization decision
 * gitgate makes.
 */
class IdentityLookup {
public:
	virtual ~IdentityLookup() noexcept = default;

	/**
	 * Look up a public key.
	 *
	 * Throws on error (which fails the authentication attempt).
	 *
	 * @param authorized_key the key in canonical "TYPE BASE64"
	 * form (see FormatAuthorizedKey()); the caller must keep it
	 * alive until the coroutine finishes
	 * @return the identity or an empty string if the key is
	 * unknown
	 */
	virtual Co::Task<std::string> Lookup(std::string_view authorized_key) = 0;
};
