// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "../Digest.hxx"

#include <openssl/evp.h>

[[gnu::const]]
inline const EVP_MD *
ToEvpMD(DigestAlgorithm a) noexcept
{
	switch (a) {
	case DigestAlgorithm::SHA256:
		return EVP_sha256();

	case DigestAlgorithm::SHA512:
		return EVP_sha512();
	}

	return nullptr;
}
