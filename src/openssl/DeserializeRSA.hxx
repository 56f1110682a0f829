// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "lib/openssl/UniqueEVP.hxx"

#include <cstddef>
#include <span>

/**
 * Build an RSA public key from the "e" and "n" mpints of an
 * "ssh-rsa" key blob (RFC 4253 section 6.6).
 *
 * Throws on error.
 */
UniqueEVP_PKEY
DeserializeRSAPublic(std::span<const std::byte> e,
		     std::span<const std::byte> n);

/**
 * Build an RSA key pair from the fields of an OpenSSH "ssh-rsa"
 * private key.  The CRT exponents are not part of that format and
 * are calculated here.
 *
 * Throws on error.
 */
UniqueEVP_PKEY
DeserializeRSA(std::span<const std::byte> n,
	       std::span<const std::byte> e,
	       std::span<const std::byte> d,
	       std::span<const std::byte> iqmp,
	       std::span<const std::byte> p,
	       std::span<const std::byte> q);
