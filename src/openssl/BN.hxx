// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/openssl/UniqueBN.hxx"

#include <cstddef>
#include <span>

/**
 * Convert an unsigned big-endian number to a #BIGNUM.
 *
 * Throws on error.
 */
template<bool clear>
UniqueBIGNUM<clear>
BN_bin2bn(std::span<const std::byte> src);

/**
 * Parse the payload of an SSH "mpint" (RFC 4251 section 5).  Negative
 * numbers are rejected.
 *
 * Throws on error.
 */
UniqueBIGNUM<true>
DeserializeBIGNUM(std::span<const std::byte> src);

/**
 * Calculate "d mod (factor - 1)", i.e. one of the RSA CRT
 * exponents.
 *
 * Throws on error.
 */
UniqueBIGNUM<true>
CalcCRTExponent(const BIGNUM &d, const BIGNUM &factor, BN_CTX &ctx);
