// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "ssh/Serializer.hxx"
#include "ssh/Deserializer.hxx"
#include "openssl/BN.hxx"
#include "openssl/SerializeBN.hxx"
#include "memory/fb_pool.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>
#include <stdexcept>
#include <vector>

using std::string_view_literals::operator""sv;

using Bytes = std::vector<std::byte>;

template<typename... Args>
static Bytes
MakeBytes(Args... args) noexcept
{
	return Bytes{static_cast<std::byte>(args)...};
}

static Bytes
ToVector(std::span<const std::byte> src) noexcept
{
	return {src.begin(), src.end()};
}

class SerializerTest : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(SerializerTest, Integers)
{
	SSH::Serializer s;
	s.WriteU8(0x12);
	s.WriteBool(true);
	s.WriteU32(0x01020304);
	s.WriteU64(0x05060708090a0b0c);

	EXPECT_EQ(ToVector(s.Finish()),
		  MakeBytes(0x12, 0x01,
			    0x01, 0x02, 0x03, 0x04,
			    0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c));
}

TEST_F(SerializerTest, String)
{
	SSH::Serializer s;
	s.WriteString("env"sv);
	s.WriteString(""sv);

	EXPECT_EQ(ToVector(s.Finish()),
		  MakeBytes(0, 0, 0, 3, 'e', 'n', 'v',
			    0, 0, 0, 0));
}

TEST_F(SerializerTest, Length)
{
	SSH::Serializer s;
	s.WriteU8(0xff);

	const auto length = s.PrepareLength();
	s.WriteString("ab"sv);
	s.CommitLength(length);

	EXPECT_EQ(ToVector(s.Finish()),
		  MakeBytes(0xff, 0, 0, 0, 6, 0, 0, 0, 2, 'a', 'b'));
}

TEST_F(SerializerTest, Rewind)
{
	SSH::Serializer s;
	s.WriteU8(1);

	const auto mark = s.Mark();
	s.WriteU32(0xdeadbeef);
	EXPECT_EQ(ToVector(s.Since(mark)), MakeBytes(0xde, 0xad, 0xbe, 0xef));

	s.Rewind(mark);
	s.WriteU8(2);
	EXPECT_EQ(ToVector(s.Finish()), MakeBytes(1, 2));
}

TEST_F(SerializerTest, Overflow)
{
	SSH::Serializer s;
	s.WriteN(SSH::MAX_PACKET_SIZE - 2);
	EXPECT_THROW(s.WriteU32(0), SSH::SerializerOverflow);
}

TEST_F(SerializerTest, Deserialize)
{
	SSH::Serializer s;
	s.WriteU32(42);
	s.WriteString("exec"sv);
	s.WriteBool(false);

	SSH::Deserializer d{s.Finish()};
	EXPECT_EQ(d.ReadU32(), 42U);
	EXPECT_EQ(d.ReadString(), "exec"sv);
	EXPECT_FALSE(d.ReadBool());
	EXPECT_NO_THROW(d.ExpectEnd());
	EXPECT_THROW(d.ReadU8(), SSH::MalformedPacket);
}

TEST_F(SerializerTest, DeserializeTruncated)
{
	static constexpr std::array data{
		std::byte{0}, std::byte{0}, std::byte{0}, std::byte{5},
		std::byte{'a'}, std::byte{'b'},
	};

	SSH::Deserializer d{data};
	EXPECT_THROW(d.ReadString(), SSH::MalformedPacket);
}

class WriteBignum2 : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

TEST_F(WriteBignum2, Zero)
{
	SSH::Serializer s;
	s.WriteBignum2({});
	EXPECT_TRUE(s.Finish().empty());

	/* zero is an empty string, no matter how many zero bytes */
	const auto zeroes = MakeBytes(0, 0, 0);
	s.WriteBignum2(zeroes);
	EXPECT_TRUE(s.Finish().empty());
}

TEST_F(WriteBignum2, StripLeadingZeroes)
{
	SSH::Serializer s;
	s.WriteBignum2(MakeBytes(0, 0, 0x12, 0x34));
	EXPECT_EQ(ToVector(s.Finish()), MakeBytes(0x12, 0x34));
}

TEST_F(WriteBignum2, SignByte)
{
	/* the most significant bit is set: a zero byte must be
	   inserted, which shifts the data to the right */
	SSH::Serializer s;
	s.WriteBignum2(MakeBytes(0x80, 0x01));
	EXPECT_EQ(ToVector(s.Finish()), MakeBytes(0x00, 0x80, 0x01));
}

TEST_F(WriteBignum2, ZeroAndSignByte)
{
	/* one leading zero is stripped and then re-inserted */
	SSH::Serializer s;
	s.WriteBignum2(MakeBytes(0x00, 0xff));
	EXPECT_EQ(ToVector(s.Finish()), MakeBytes(0x00, 0xff));
}

TEST_F(WriteBignum2, Append)
{
	SSH::Serializer s;
	s.WriteU8(0xaa);
	s.WriteBignum2(MakeBytes(0x90));
	s.WriteU8(0xbb);
	EXPECT_EQ(ToVector(s.Finish()), MakeBytes(0xaa, 0x00, 0x90, 0xbb));
}

class SerializeBignum : public testing::Test {
	const ScopeFbPoolInit fb_pool_init;
};

static Bytes
SerializeBIGNUM(const Bytes &big_endian)
{
	const auto bn = BN_bin2bn<false>(big_endian);

	SSH::Serializer s;
	Serialize(s, *bn);
	return ToVector(s.Finish());
}

TEST_F(SerializeBignum, Small)
{
	EXPECT_EQ(SerializeBIGNUM(MakeBytes(0x42)), MakeBytes(0x42));
	EXPECT_EQ(SerializeBIGNUM(MakeBytes(0x01, 0x23)), MakeBytes(0x01, 0x23));
	EXPECT_TRUE(SerializeBIGNUM(MakeBytes(0x00)).empty());
}

TEST_F(SerializeBignum, SignByte)
{
	EXPECT_EQ(SerializeBIGNUM(MakeBytes(0x80, 0x42)),
		  MakeBytes(0x00, 0x80, 0x42));
}

TEST_F(SerializeBignum, Long)
{
	Bytes input(64);
	for (std::size_t i = 0; i < input.size(); ++i)
		input[i] = static_cast<std::byte>(0xff - i);

	const auto result = SerializeBIGNUM(input);
	ASSERT_EQ(result.size(), 65U);
	EXPECT_EQ(result.front(), std::byte{});
	EXPECT_EQ(result[1], std::byte{0xff});
	EXPECT_EQ(result.back(), std::byte{0xff - 63});
}

TEST(DeserializeBIGNUM, Basic)
{
	const auto bn = DeserializeBIGNUM(MakeBytes(0x00, 0x00, 0x80, 0x01));
	EXPECT_EQ(BN_num_bytes(bn.get()), 2);
	EXPECT_EQ(BN_get_word(bn.get()), 0x8001U);

	EXPECT_TRUE(BN_is_zero(DeserializeBIGNUM({}).get()));
}

TEST(DeserializeBIGNUM, Negative)
{
	EXPECT_THROW(DeserializeBIGNUM(MakeBytes(0x80)), std::invalid_argument);
}

TEST(DeserializeBIGNUM, TooLarge)
{
	Bytes input(16384 / 8 + 1, std::byte{0x01});
	EXPECT_THROW(DeserializeBIGNUM(input), std::invalid_argument);
}
