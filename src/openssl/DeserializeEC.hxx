// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "lib/openssl/UniqueEVP.hxx"

#include <cstddef>
#include <span>
#include <string_view>

/**
 * Construct an EC public key from its uncompressed point encoding.
 *
 * @param curve_name the OpenSSL group name, e.g. "P-256"
 */
UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q);
