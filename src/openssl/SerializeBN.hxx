// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <openssl/bn.h>

namespace SSH { class Serializer; }

/**
 * Write the magnitude of a non-negative #BIGNUM in SSH "mpint"
 * format, without the length prefix.
 */
void
Serialize(SSH::Serializer &s, const BIGNUM &bn);
