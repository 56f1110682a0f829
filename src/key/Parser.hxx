// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <memory>
#include <span>

class PublicKey;
class SecretKey;

/**
 * Parse a public key blob as sent by the client in a
 * SSH_MSG_USERAUTH_REQUEST.
 *
 * Throws std::invalid_argument on error.
 */
std::unique_ptr<PublicKey>
ParsePublicKeyBlob(std::span<const std::byte> src);

/**
 * Parse an unencrypted private key file: OpenSSH format (binary or
 * base64) or PEM.  Only RSA keys are supported.
 *
 * Throws std::invalid_argument (or #SslError for PEM files) on
 * error.
 */
std::unique_ptr<SecretKey>
ParseSecretKey(std::span<const std::byte> src);
