// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "DeserializeEC.hxx"
#include "FromData.hxx"
#include "lib/openssl/Error.hxx"
#include "util/ScopeExit.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_*
#include <openssl/param_build.h>

#include <string>

static OSSL_PARAM *
ToParam(std::string_view curve_name, std::span<const std::byte> q)
{
	OSSL_PARAM_BLD *const bld = OSSL_PARAM_BLD_new();
	if (bld == nullptr)
		throw SslError{};

	AtScopeExit(bld) { OSSL_PARAM_BLD_free(bld); };

	/* the group name must be null-terminated */
	const std::string group{curve_name};

	if (!OSSL_PARAM_BLD_push_utf8_string(bld, OSSL_PKEY_PARAM_GROUP_NAME,
					     group.c_str(), group.size()) ||
	    !OSSL_PARAM_BLD_push_octet_string(bld, OSSL_PKEY_PARAM_PUB_KEY,
					      q.data(), q.size()))
		throw SslError{};

	OSSL_PARAM *param = OSSL_PARAM_BLD_to_param(bld);
	if (param == nullptr)
		throw SslError{};

	return param;
}

UniqueEVP_PKEY
DeserializeECPublic(std::string_view curve_name, std::span<const std::byte> q)
{
	OSSL_PARAM *param = ToParam(curve_name, q);
	AtScopeExit(param) { OSSL_PARAM_free(param); };

	return PkeyFromData(EVP_PKEY_EC, EVP_PKEY_PUBLIC_KEY, param);
}
