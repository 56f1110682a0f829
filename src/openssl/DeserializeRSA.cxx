// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "DeserializeRSA.hxx"
#include "FromData.hxx"
#include "BN.hxx"
#include "lib/openssl/Error.hxx"
#include "util/ScopeExit.hxx"

#include <openssl/core_names.h> // for OSSL_PKEY_PARAM_RSA_*
#include <openssl/param_build.h>

#include <initializer_list>

struct RSAParam {
	const char *name;
	const BIGNUM &value;
};

/**
 * Build an OSSL_PARAM array from the given bignums.  The caller is
 * responsible for freeing the return value.
 */
static OSSL_PARAM *
BuildParams(std::initializer_list<RSAParam> params)
{
	OSSL_PARAM_BLD *const bld = OSSL_PARAM_BLD_new();
	if (bld == nullptr)
		throw SslError{};

	AtScopeExit(bld) { OSSL_PARAM_BLD_free(bld); };

	for (const auto &i : params)
		if (!OSSL_PARAM_BLD_push_BN(bld, i.name, &i.value))
			throw SslError{"OSSL_PARAM_BLD_push_BN() failed"};

	OSSL_PARAM *result = OSSL_PARAM_BLD_to_param(bld);
	if (result == nullptr)
		throw SslError{"OSSL_PARAM_BLD_to_param() failed"};

	return result;
}

UniqueEVP_PKEY
DeserializeRSAPublic(std::span<const std::byte> e,
		     std::span<const std::byte> n)
{
	const auto e_ = DeserializeBIGNUM(e), n_ = DeserializeBIGNUM(n);

	OSSL_PARAM *const params = BuildParams({
		{OSSL_PKEY_PARAM_RSA_N, *n_},
		{OSSL_PKEY_PARAM_RSA_E, *e_},
	});
	AtScopeExit(params) { OSSL_PARAM_free(params); };

	return PkeyFromData(EVP_PKEY_RSA, EVP_PKEY_PUBLIC_KEY, params);
}

UniqueEVP_PKEY
DeserializeRSA(std::span<const std::byte> n,
	       std::span<const std::byte> e,
	       std::span<const std::byte> d,
	       std::span<const std::byte> iqmp,
	       std::span<const std::byte> p,
	       std::span<const std::byte> q)
{
	const auto n_ = DeserializeBIGNUM(n), e_ = DeserializeBIGNUM(e),
		d_ = DeserializeBIGNUM(d), iqmp_ = DeserializeBIGNUM(iqmp),
		p_ = DeserializeBIGNUM(p), q_ = DeserializeBIGNUM(q);

	BN_CTX *const bn_ctx = BN_CTX_secure_new();
	if (bn_ctx == nullptr)
		throw SslError{};

	AtScopeExit(bn_ctx) { BN_CTX_free(bn_ctx); };

	/* d mod (p-1) and d mod (q-1) */
	const auto dmp = CalcCRTExponent(*d_, *p_, *bn_ctx);
	const auto dmq = CalcCRTExponent(*d_, *q_, *bn_ctx);

	OSSL_PARAM *const params = BuildParams({
		{OSSL_PKEY_PARAM_RSA_N, *n_},
		{OSSL_PKEY_PARAM_RSA_E, *e_},
		{OSSL_PKEY_PARAM_RSA_D, *d_},
		{OSSL_PKEY_PARAM_RSA_FACTOR1, *p_},
		{OSSL_PKEY_PARAM_RSA_FACTOR2, *q_},
		{OSSL_PKEY_PARAM_RSA_EXPONENT1, *dmp},
		{OSSL_PKEY_PARAM_RSA_EXPONENT2, *dmq},
		{OSSL_PKEY_PARAM_RSA_COEFFICIENT1, *iqmp_},
	});
	AtScopeExit(params) { OSSL_PARAM_clear_free(params); };

	return PkeyFromData(EVP_PKEY_RSA, EVP_PKEY_KEYPAIR, params);
}
