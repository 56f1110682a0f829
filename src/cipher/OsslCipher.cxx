// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "OsslCipher.hxx"
#include "lib/openssl/Error.hxx"

#include <algorithm> // for std::copy()
#include <cassert>
#include <stdexcept>
#include <utility> // for std::cmp_less()

namespace SSH {

static inline unsigned char *
ToUChar(std::byte *p) noexcept
{
	return reinterpret_cast<unsigned char *>(p);
}

static inline const unsigned char *
ToUChar(const std::byte *p) noexcept
{
	return reinterpret_cast<const unsigned char *>(p);
}

static void
GcmControl(EVP_CIPHER_CTX &ctx, int cmd, std::span<std::byte> p,
	   const char *what)
{
	if (!EVP_CIPHER_CTX_ctrl(&ctx, cmd, static_cast<int>(p.size()), p.data()))
		throw SslError{what};
}

OsslCipher::OsslCipher(const EVP_CIPHER &cipher,
		       std::size_t _block_size,
		       std::size_t _auth_size,
		       std::span<const std::byte> key,
		       std::span<const std::byte> iv,
		       bool do_encrypt)
	:Cipher(_block_size, _auth_size, _auth_size > 0),
	 ctx(EVP_CIPHER_CTX_new())
{
	if (!ctx)
		throw SslError{};

	if (std::cmp_less(iv.size(), EVP_CIPHER_get_iv_length(&cipher)))
		throw std::invalid_argument{"Bad IV"};

	/* the key is set in a second step, after the key length
	   has been verified */
	if (!EVP_CipherInit(ctx.get(), &cipher, nullptr, ToUChar(iv.data()),
			    do_encrypt))
		throw SslError{"EVP_CipherInit() failed"};

	if (HasAuth())
		/* -1 means: the whole IV is the fixed field, the
		   invocation counter lives in its last 8 bytes */
		if (!EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IV_FIXED, -1,
					 const_cast<std::byte *>(iv.data())))
			throw SslError{"EVP_CTRL_GCM_SET_IV_FIXED failed"};

	const int key_length = EVP_CIPHER_CTX_get_key_length(ctx.get());
	if (key_length > 0 && std::cmp_not_equal(key.size(), key_length))
		throw std::invalid_argument{"Wrong key size"};

	if (!EVP_CipherInit(ctx.get(), nullptr, ToUChar(key.data()), nullptr, -1))
		throw SslError{"EVP_CipherInit() failed"};
}

OsslCipher::~OsslCipher() noexcept = default;

inline void
OsslCipher::IncrementIV()
{
	std::byte last_iv[1];
	GcmControl(*ctx, EVP_CTRL_GCM_IV_GEN, last_iv,
		   "EVP_CTRL_GCM_IV_GEN failed");
}

std::size_t
OsslCipher::Update(std::byte *dest, std::span<const std::byte> src)
{
	int outl;
	if (EVP_CipherUpdate(ctx.get(), ToUChar(dest), &outl,
			     ToUChar(src.data()), src.size()) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};

	return outl;
}

inline void
OsslCipher::BeginGcmPacket(std::span<const std::byte, HEADER_SIZE> header)
{
	IncrementIV();

	/* the packet length is additional authenticated data */
	int outl;
	if (EVP_CipherUpdate(ctx.get(), nullptr, &outl,
			     ToUChar(header.data()), header.size()) != 1)
		throw SslError{"EVP_CipherUpdate() failed"};
}

void
OsslCipher::DecryptHeader([[maybe_unused]] uint_least64_t seqnr,
			  std::span<const std::byte, HEADER_SIZE> src,
			  std::span<std::byte, HEADER_SIZE> dest)
{
	if (HasAuth()) {
		/* GCM leaves the packet length in plain text */
		std::copy(src.begin(), src.end(), dest.begin());
		return;
	}

	/* CTR: the header is the first block of this packet's key
	   stream; DecryptPayload() skips it */
	if (Update(dest.data(), src) != dest.size())
		throw SslError{"EVP_CipherUpdate() failed"};
}

std::size_t
OsslCipher::DecryptPayload([[maybe_unused]] uint_least64_t seqnr,
			   std::span<const std::byte> src,
			   std::span<std::byte> dest)
{
	const std::size_t auth_size = GetAuthSize();
	assert(src.size() >= HEADER_SIZE + auth_size);

	const auto header = src.first<HEADER_SIZE>();
	const auto payload = src.subspan(HEADER_SIZE,
					 src.size() - HEADER_SIZE - auth_size);
	assert(payload.size() % GetBlockSize() == 0 ||
	       !IsHeaderExcludedFromPadding());

	if (!HasAuth())
		return Update(dest.data(), payload);

	BeginGcmPacket(header);

	std::byte tag[16];
	assert(auth_size == sizeof(tag));
	std::copy(src.end() - auth_size, src.end(), tag);
	GcmControl(*ctx, EVP_CTRL_GCM_SET_TAG, tag,
		   "EVP_CTRL_GCM_SET_TAG failed");

	std::size_t n = Update(dest.data(), payload);

	int outl;
	if (EVP_CipherFinal_ex(ctx.get(), ToUChar(dest.data() + n), &outl) != 1)
		throw std::invalid_argument{"Invalid GCM tag"};

	return n + outl;
}

std::size_t
OsslCipher::Encrypt([[maybe_unused]] uint_least64_t seqnr,
		    std::span<const std::byte> src,
		    std::span<std::byte> dest)
{
	assert(src.size() >= HEADER_SIZE);
	assert(dest.size() >= GetEncryptedSize(src.size()));

	if (!HasAuth())
		return Update(dest.data(), src);

	const auto header = src.first<HEADER_SIZE>();
	const auto payload = src.subspan(HEADER_SIZE);
	assert(payload.size() % GetBlockSize() == 0);

	BeginGcmPacket(header);

	std::byte *p = std::copy(header.begin(), header.end(), dest.data());
	p += Update(p, payload);

	int outl;
	if (EVP_CipherFinal_ex(ctx.get(), ToUChar(p), &outl) != 1)
		throw SslError{"EVP_CipherFinal_ex() failed"};
	p += outl;

	GcmControl(*ctx, EVP_CTRL_GCM_GET_TAG, {p, GetAuthSize()},
		   "EVP_CTRL_GCM_GET_TAG failed");
	p += GetAuthSize();

	return p - dest.data();
}

} // namespace SSH
