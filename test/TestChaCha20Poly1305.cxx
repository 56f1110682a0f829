// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "cipher/Cipher.hxx"
#include "cipher/Factory.hxx"
#include "ssh/PacketSerializer.hxx"
#include "memory/fb_pool.hxx"

#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <stdexcept>
#include <vector>

using std::string_view_literals::operator""sv;

static constexpr auto chacha20_poly1305 = "chacha20-poly1305@openssh.com"sv;

static std::array<std::byte, 64>
MakeKey(uint_least8_t seed) noexcept
{
	std::array<std::byte, 64> key;
	for (std::size_t i = 0; i < key.size(); ++i)
		key[i] = static_cast<std::byte>(seed + i * 7);
	return key;
}

class ChaCha20Poly1305Test : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;

protected:
	const std::array<std::byte, 64> key = MakeKey(1);

	std::unique_ptr<SSH::Cipher> encrypt, decrypt;

	void SetUp() override {
		encrypt = SSH::MakeCipher(chacha20_poly1305, {}, key, {}, {}, true);
		decrypt = SSH::MakeCipher(chacha20_poly1305, {}, key, {}, {}, false);
		ASSERT_TRUE(encrypt);
		ASSERT_TRUE(decrypt);
	}

	std::vector<std::byte> Encrypt(uint_least64_t seq,
				       std::span<const std::byte> packet) {
		std::vector<std::byte> result(encrypt->GetEncryptedSize(packet.size()));
		result.resize(encrypt->Encrypt(seq, packet, result));
		return result;
	}

	/**
	 * @return the decrypted packet including the header
	 */
	std::vector<std::byte> Decrypt(uint_least64_t seq,
				       std::span<const std::byte> src) {
		std::vector<std::byte> result(src.size());
		decrypt->DecryptHeader(seq, src.first<SSH::HEADER_SIZE>(),
				       std::span{result}.first<SSH::HEADER_SIZE>());

		const auto n = decrypt->DecryptPayload(seq, src,
						       std::span{result}.subspan(SSH::HEADER_SIZE));
		result.resize(SSH::HEADER_SIZE + n);
		return result;
	}
};

static std::span<const std::byte>
MakePacket(SSH::PacketSerializer &s, std::size_t block_size)
{
	s.WriteU32(3);
	s.WriteString("exec"sv);
	s.WriteBool(true);
	s.WriteString("git-upload-pack 'repo.git'"sv);
	return s.Finish(block_size, true);
}

TEST_F(ChaCha20Poly1305Test, Properties)
{
	EXPECT_EQ(encrypt->GetBlockSize(), 8U);
	EXPECT_EQ(encrypt->GetAuthSize(), 16U);
	EXPECT_TRUE(encrypt->HasAuth());
	EXPECT_TRUE(encrypt->IsHeaderExcludedFromPadding());
	EXPECT_EQ(encrypt->GetEncryptedSize(32), 48U);
	EXPECT_TRUE(SSH::IsAuthenticatedEncryption(chacha20_poly1305));
}

TEST_F(ChaCha20Poly1305Test, RoundTrip)
{
	SSH::PacketSerializer s{SSH::MessageNumber::CHANNEL_REQUEST};
	const auto packet = MakePacket(s, encrypt->GetBlockSize());

	for (uint_least64_t seq : {0U, 1U, 0xffffffffU}) {
		const auto encrypted = Encrypt(seq, packet);
		EXPECT_EQ(encrypted.size(), packet.size() + 16);
		EXPECT_FALSE(std::equal(packet.begin(), packet.end(),
					encrypted.begin()));

		const auto decrypted = Decrypt(seq, encrypted);
		ASSERT_EQ(decrypted.size(), packet.size());
		EXPECT_TRUE(std::equal(packet.begin(), packet.end(),
				       decrypted.begin()));
	}
}

TEST_F(ChaCha20Poly1305Test, Tampered)
{
	SSH::PacketSerializer s{SSH::MessageNumber::CHANNEL_REQUEST};
	const auto packet = MakePacket(s, encrypt->GetBlockSize());

	auto encrypted = Encrypt(7, packet);
	encrypted[SSH::HEADER_SIZE + 2] ^= std::byte{0x01};

	EXPECT_THROW(Decrypt(7, encrypted), std::invalid_argument);
}

TEST_F(ChaCha20Poly1305Test, WrongSequenceNumber)
{
	SSH::PacketSerializer s{SSH::MessageNumber::CHANNEL_REQUEST};
	const auto packet = MakePacket(s, encrypt->GetBlockSize());

	const auto encrypted = Encrypt(7, packet);
	EXPECT_THROW(Decrypt(8, encrypted), std::invalid_argument);
}

TEST_F(ChaCha20Poly1305Test, WrongKey)
{
	SSH::PacketSerializer s{SSH::MessageNumber::CHANNEL_REQUEST};
	const auto packet = MakePacket(s, encrypt->GetBlockSize());
	const auto encrypted = Encrypt(0, packet);

	decrypt = SSH::MakeCipher(chacha20_poly1305, {}, MakeKey(2), {}, {}, false);
	EXPECT_THROW(Decrypt(0, encrypted), std::invalid_argument);
}

TEST(CipherFactory, Unknown)
{
	const auto key = MakeKey(1);
	EXPECT_FALSE(SSH::MakeCipher("3des-cbc"sv, "hmac-sha2-256"sv,
				     key, {}, {}, true));
	EXPECT_THROW(SSH::MakeCipher(chacha20_poly1305, {},
				     std::span{key}.first(32), {}, {}, true),
		     std::invalid_argument);
}
