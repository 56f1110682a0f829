// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include "lib/openssl/UniqueEVP.hxx"
#include "lib/openssl/Error.hxx"

#include <openssl/core.h>

/**
 * Construct an EVP_PKEY from an OSSL_PARAM array.
 *
 * @param id the key type, e.g. EVP_PKEY_RSA
 * @param selection EVP_PKEY_PUBLIC_KEY or EVP_PKEY_KEYPAIR
 */
inline UniqueEVP_PKEY
PkeyFromData(int id, int selection, OSSL_PARAM *param)
{
	const UniqueEVP_PKEY_CTX ctx{EVP_PKEY_CTX_new_id(id, nullptr)};
	if (!ctx)
		throw SslError{"EVP_PKEY_CTX_new_id() failed"};

	if (EVP_PKEY_fromdata_init(ctx.get()) != 1)
		throw SslError{"EVP_PKEY_fromdata_init() failed"};

	EVP_PKEY *pkey = nullptr;
	if (EVP_PKEY_fromdata(ctx.get(), &pkey, selection, param) != 1)
		throw SslError{"EVP_PKEY_fromdata() failed"};

	return UniqueEVP_PKEY{pkey};
}
