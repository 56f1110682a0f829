// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>

/**
 * The hash algorithms used by key exchange and signatures.  The
 * numeric values are indices into an internal table.
 */
enum class DigestAlgorithm {
	SHA256,
	SHA512,
};

static constexpr std::size_t DIGEST_MAX_SIZE = 64;

[[gnu::const]]
std::size_t
DigestSize(DigestAlgorithm a) noexcept;

std::size_t
Digest(DigestAlgorithm a, std::span<const std::byte> src,
       std::byte *dest) noexcept;

/**
 * Calculate the digest of the concatenation of all #src buffers.
 */
std::size_t
Digest(DigestAlgorithm a,
       std::initializer_list<std::span<const std::byte>> src,
       std::byte *dest) noexcept;
