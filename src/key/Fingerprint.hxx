// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>
#include <span>
#include <string>

class PublicKey;

/**
 * Format the OpenSSH style fingerprint of a public key blob,
 * e.g. "SHA256:...".
 */
std::string
GetFingerprint(std::span<const std::byte> public_key_blob);

std::string
GetFingerprint(const PublicKey &key);
