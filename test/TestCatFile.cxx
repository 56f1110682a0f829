// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "CatFile.hxx"
#include "util/SpanCast.hxx"

#include <gtest/gtest.h>

#include <array>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

#include <stdlib.h>

using std::string_view_literals::operator""sv;

class CatFileTest : public testing::Test {
protected:
	std::string dir;

	void SetUp() override {
		char tmpl[] = "/tmp/gitgate-test-XXXXXX";
		ASSERT_NE(mkdtemp(tmpl), nullptr);
		dir = tmpl;
	}

	void TearDown() override {
		std::filesystem::remove_all(dir);
	}

	static std::string ReadFile(const std::string &path) {
		std::ifstream f{path, std::ios::binary};
		return {std::istreambuf_iterator<char>{f}, {}};
	}

	static void WriteFile(const std::string &path, std::string_view contents) {
		std::ofstream f{path, std::ios::binary};
		f.write(contents.data(), contents.size());
	}
};

TEST_F(CatFileTest, Create)
{
	const std::string path = dir + "/config";

	CatFile cat{path.c_str()};
	cat.Write(AsBytes("[core]\n"sv));
	cat.Write(AsBytes("\tbare = true\n"sv));
	EXPECT_FALSE(cat.HasError());
	EXPECT_EQ(cat.Finish(), 0);

	EXPECT_EQ(ReadFile(path), "[core]\n\tbare = true\n");
}

TEST_F(CatFileTest, Truncate)
{
	const std::string path = dir + "/description";
	WriteFile(path, "an old and much longer description\n"sv);

	CatFile cat{path.c_str()};
	cat.Write(AsBytes("new\n"sv));
	EXPECT_EQ(cat.Finish(), 0);

	EXPECT_EQ(ReadFile(path), "new\n");
}

TEST_F(CatFileTest, Empty)
{
	const std::string path = dir + "/empty";
	WriteFile(path, "old"sv);

	CatFile cat{path.c_str()};
	EXPECT_EQ(cat.Finish(), 0);

	EXPECT_EQ(ReadFile(path), "");
}

TEST_F(CatFileTest, Binary)
{
	/* data is written verbatim; nothing is sanitized or
	   translated */
	static constexpr std::array<std::byte, 8> data{
		std::byte{0x00}, std::byte{0xff}, std::byte{'\r'}, std::byte{'\n'},
		std::byte{0x1b}, std::byte{0x80}, std::byte{0x00}, std::byte{'x'},
	};

	const std::string path = dir + "/blob";

	CatFile cat{path.c_str()};
	cat.Write(data);
	cat.Write(std::span{data}.first(3));
	EXPECT_EQ(cat.Finish(), 0);

	const auto contents = ReadFile(path);
	ASSERT_EQ(contents.size(), data.size() + 3);
	EXPECT_EQ(contents.substr(0, data.size()), ToStringView(std::span{data}));
	EXPECT_EQ(contents.substr(data.size()), ToStringView(std::span{data}.first(3)));
}

TEST_F(CatFileTest, NoDirectory)
{
	const std::string path = dir + "/no/such/directory/file";
	EXPECT_THROW(CatFile{path.c_str()}, std::system_error);
	EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(CatFileTest, WriteError)
{
	if (!std::filesystem::exists("/dev/full"))
		GTEST_SKIP();

	CatFile cat{"/dev/full"};
	cat.Write(AsBytes("data"sv));
	EXPECT_TRUE(cat.HasError());

	/* further data is discarded */
	cat.Write(AsBytes("more"sv));
	EXPECT_EQ(cat.Finish(), 1);
	EXPECT_FALSE(cat.GetError().empty());
}
