// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "BN.hxx"
#include "lib/openssl/Error.hxx"

#include <algorithm>
#include <stdexcept>

/**
 * Refuse numbers larger than a 16 kbit RSA modulus.
 */
static constexpr std::size_t MAX_BIGNUM_SIZE = 16384 / 8;

template<bool clear>
UniqueBIGNUM<clear>
BN_bin2bn(std::span<const std::byte> src)
{
	UniqueBIGNUM<clear> bn{BN_new()};
	if (!bn)
		throw SslError{"BN_new() failed"};

	if (BN_bin2bn(reinterpret_cast<const unsigned char *>(src.data()),
		      src.size(), bn.get()) == nullptr)
		throw SslError{"BN_bin2bn() failed"};

	return bn;
}

template UniqueBIGNUM<false> BN_bin2bn(std::span<const std::byte> src);
template UniqueBIGNUM<true> BN_bin2bn(std::span<const std::byte> src);

UniqueBIGNUM<true>
DeserializeBIGNUM(std::span<const std::byte> src)
{
	if (!src.empty() && (src.front() & std::byte{0x80}) != std::byte{})
		throw std::invalid_argument{"Negative BIGNUM"};

	const auto first_nonzero = std::find_if(src.begin(), src.end(), [](std::byte b){
		return b != std::byte{};
	});

	src = src.subspan(std::distance(src.begin(), first_nonzero));
	if (src.size() > MAX_BIGNUM_SIZE)
		throw std::invalid_argument{"BIGNUM too large"};

	return BN_bin2bn<true>(src);
}

UniqueBIGNUM<true>
CalcCRTExponent(const BIGNUM &d, const BIGNUM &factor, BN_CTX &ctx)
{
	UniqueBIGNUM<true> factor_minus_one{BN_dup(&factor)};
	if (!factor_minus_one)
		throw SslError{"BN_dup() failed"};

	if (!BN_sub_word(factor_minus_one.get(), 1))
		throw SslError{"BN_sub_word() failed"};

	UniqueBIGNUM<true> result{BN_secure_new()};
	if (!result)
		throw SslError{"BN_secure_new() failed"};

	if (!BN_mod(result.get(), &d, factor_minus_one.get(), &ctx))
		throw SslError{"BN_mod() failed"};

	return result;
}
