// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ssh/PacketSerializer.hxx"
#include "memory/fb_pool.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

TEST(Padding, Minimum)
{
	/* the smallest packet is 16 bytes */
	EXPECT_EQ(SSH::Padding(6), 10U);
	EXPECT_EQ(SSH::Padding(12), 4U);
}

TEST(Padding, BlockSize)
{
	for (std::size_t block_size : {8U, 16U}) {
		for (std::size_t size = 13; size < 200; ++size) {
			const auto padding = SSH::Padding(size, block_size);
			EXPECT_GE(padding, SSH::MIN_PADDING);
			EXPECT_LT(padding, SSH::MIN_PADDING + block_size);
			EXPECT_EQ((size + padding) % block_size, 0U);
		}
	}
}

class PacketSerializerTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(PacketSerializerTest, Finish)
{
	SSH::PacketSerializer s{SSH::MessageNumber::CHANNEL_REQUEST};
	EXPECT_EQ(s.GetMessageNumber(), SSH::MessageNumber::CHANNEL_REQUEST);

	s.WriteU32(0);
	s.WriteString("exit-status"sv);
	s.WriteBool(false);
	s.WriteU32(0);

	const auto packet = s.Finish(8, false);
	EXPECT_EQ(packet.size() % 8, 0U);

	const auto &header = *reinterpret_cast<const SSH::PacketHeader *>(packet.data());
	EXPECT_EQ(static_cast<std::size_t>(header.length),
		  packet.size() - sizeof(header));

	const std::size_t padding_length =
		static_cast<std::size_t>(packet[sizeof(header)]);
	EXPECT_GE(padding_length, SSH::MIN_PADDING);
	EXPECT_EQ(packet[sizeof(header) + 1],
		  static_cast<std::byte>(SSH::MessageNumber::CHANNEL_REQUEST));
}

TEST_F(PacketSerializerTest, WithoutHeader)
{
	/* chacha20-poly1305 and AES-GCM pad only the part after the
	   length field */
	SSH::PacketSerializer s{SSH::MessageNumber::IGNORE};
	s.WriteString("x"sv);

	const auto packet = s.Finish(16, true);
	EXPECT_EQ((packet.size() - sizeof(SSH::PacketHeader)) % 16, 0U);
}
