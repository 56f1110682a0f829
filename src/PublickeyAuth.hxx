// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace Co { template<typename T> class Task; }
class PublicKey;
class IdentityLookup;

/**
 * The method-specific part of a "publickey" USERAUTH_REQUEST
 * (RFC 4252 section 7).
 */
struct PublickeyRequest {
	std::string_view algorithm;
	std::span<const std::byte> blob;

	/**
	 * Everything from the user name up to (and including) the
	 * key blob; the client signs this (prefixed with the session
	 * id and the message number).
	 */
	std::span<const std::byte> signed_part;

	/**
	 * The signature; empty if this is only a query.
	 */
	std::span<const std::byte> signature;

	bool with_signature = false;
};

/**
 * A USERAUTH_REQUEST payload (without the message number).
 */
struct UserauthRequest {
	std::string_view user_name, service_name, method_name;

	/**
	 * Only set if #method_name is "publickey".
	 */
	PublickeyRequest publickey;
};

/**
 * Throws SSH::MalformedPacket on error.
 */
UserauthRequest
ParseUserauthRequest(std::span<const std::byte> payload);

enum class PublickeyVerdict : uint_least8_t {
	/**
	 * The signature is valid and the key belongs to an
	 * identity: reply USERAUTH_SUCCESS.
	 */
	ACCEPTED,

	/**
	 * A query without signature for a known key: reply
	 * USERAUTH_PK_OK.
	 */
	ACCEPTABLE,

	REJECTED,
};

struct PublickeyResult {
	PublickeyVerdict verdict = PublickeyVerdict::REJECTED;

	std::unique_ptr<PublicKey> key;

	/**
	 * The identity returned by #IdentityLookup (if the key is
	 * known).
	 */
	std::string identity;

	/**
	 * A human-readable explanation for #REJECTED.
	 */
	std::string reason;

	PublickeyResult() noexcept;
	~PublickeyResult() noexcept;
	PublickeyResult(PublickeyResult &&) noexcept;
	PublickeyResult &operator=(PublickeyResult &&) noexcept;
};

/**
 * Check a "publickey" request: parse the key, verify the signature
 * (if there is one) against the session identifier and finally ask
 * the #IdentityLookup.  Errors (malformed keys, failed lookups) are
 * not thrown but reported as #PublickeyVerdict::REJECTED.
 *
 * The caller must keep #request and the buffers it points to alive
 * until the coroutine finishes.
 */
Co::Task<PublickeyResult>
CheckPublickey(IdentityLookup &lookup,
	       std::span<const std::byte> session_id,
	       const PublickeyRequest &request);
