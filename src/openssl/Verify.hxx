// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "Digest.hxx"

#include <openssl/evp.h>

#include <cstddef>
#include <span>

/**
 * Check a raw signature (PKCS#1 for RSA, DER for ECDSA) over the
 * given message.
 *
 * Throws if OpenSSL fails for a reason other than a mismatch.
 *
 * @return true if the signature is valid
 */
bool
VerifySignature(EVP_PKEY &key, DigestAlgorithm hash_alg,
		std::span<const std::byte> message,
		std::span<const std::byte> signature);

/**
 * Like VerifySignature(), but the signature is an SSH ECDSA
 * signature blob (RFC 5656 section 3.1.2: two mpints "r" and "s").
 */
bool
VerifyECDSASignature(EVP_PKEY &key, DigestAlgorithm hash_alg,
		     std::span<const std::byte> message,
		     std::span<const std::byte> signature);
