// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>

/**
 * Format a public key blob in the canonical single-line
 * "authorized_keys" form: the key type, one space and the
 * (padded) base64 encoding of the blob.  No comment and no
 * trailing newline.
 *
 * Throws std::invalid_argument if the blob does not begin with a
 * key type string.
 */
std::string
FormatAuthorizedKey(std::span<const std::byte> public_key_blob);

/**
 * Parse "TYPE BASE64" and return it in canonical form (see
 * FormatAuthorizedKey()).  Anything after the base64 field (a
 * comment) is ignored.
 *
 * Throws std::invalid_argument on error, or if the key type
 * does not match the type inside the blob.
 */
std::string
CanonicalizeAuthorizedKey(std::string_view type, std::string_view base64);
