// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "LookPath.hxx"

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include <fcntl.h>
#include <stdlib.h>
#include <unistd.h>

class LookPathTest : public testing::Test {
protected:
	std::string dir1, dir2;

	void SetUp() override {
		char tmpl[] = "/tmp/gitgate-test-XXXXXX";
		ASSERT_NE(mkdtemp(tmpl), nullptr);
		dir1 = std::string{tmpl} + "/a";
		dir2 = std::string{tmpl} + "/b";
		std::filesystem::create_directory(dir1);
		std::filesystem::create_directory(dir2);
	}

	void TearDown() override {
		std::filesystem::remove_all(std::filesystem::path{dir1}.parent_path());
	}

	static void CreateFile(const std::string &path, mode_t mode) {
		const int fd = open(path.c_str(), O_CREAT|O_WRONLY|O_TRUNC, mode);
		ASSERT_GE(fd, 0);
		close(fd);
		ASSERT_EQ(chmod(path.c_str(), mode), 0);
	}

	std::string SearchPath() const {
		return dir1 + ":" + dir2;
	}
};

TEST_F(LookPathTest, Found)
{
	CreateFile(dir2 + "/git-upload-pack", 0755);

	EXPECT_EQ(LookPath("git-upload-pack", SearchPath()),
		  dir2 + "/git-upload-pack");
}

TEST_F(LookPathTest, FirstMatchWins)
{
	CreateFile(dir1 + "/tool", 0755);
	CreateFile(dir2 + "/tool", 0755);

	EXPECT_EQ(LookPath("tool", SearchPath()), dir1 + "/tool");
}

TEST_F(LookPathTest, TrailingSlash)
{
	CreateFile(dir1 + "/tool", 0755);

	EXPECT_EQ(LookPath("tool", dir1 + "/"), dir1 + "/tool");
}

TEST_F(LookPathTest, NotExecutable)
{
	CreateFile(dir1 + "/tool", 0644);
	CreateFile(dir2 + "/tool", 0755);

	EXPECT_EQ(LookPath("tool", SearchPath()), dir2 + "/tool");
	EXPECT_THROW(LookPath("tool", dir1), std::runtime_error);
}

TEST_F(LookPathTest, Directory)
{
	std::filesystem::create_directory(dir1 + "/tool");

	EXPECT_THROW(LookPath("tool", dir1), std::runtime_error);
}

TEST_F(LookPathTest, NotFound)
{
	EXPECT_THROW(LookPath("no-such-program", SearchPath()),
		     std::runtime_error);
	EXPECT_THROW(LookPath("", SearchPath()), std::runtime_error);
}

TEST_F(LookPathTest, RelativeElementsSkipped)
{
	CreateFile(dir1 + "/tool", 0755);
	ASSERT_EQ(chdir(dir1.c_str()), 0);

	EXPECT_THROW(LookPath("tool", ":.:a"), std::runtime_error);

	ASSERT_EQ(chdir("/"), 0);
}

TEST_F(LookPathTest, Slash)
{
	const std::string path = dir1 + "/tool";
	CreateFile(path, 0755);

	/* names with a slash are not looked up */
	EXPECT_EQ(LookPath(path, "/nonexistent"), path);
	EXPECT_THROW(LookPath(dir2 + "/tool", SearchPath()),
		     std::runtime_error);
}

TEST_F(LookPathTest, RelativeSlash)
{
	std::filesystem::create_directory(dir1 + "/bin");
	CreateFile(dir1 + "/bin/tool", 0755);
	ASSERT_EQ(chdir(dir1.c_str()), 0);

	/* these exist relative to the working directory, but must
	   not be found */
	EXPECT_THROW(LookPath("bin/tool", SearchPath()), std::runtime_error);
	EXPECT_THROW(LookPath("./bin/tool", SearchPath()), std::runtime_error);
	EXPECT_THROW(LookPath("../a/bin/tool", SearchPath()), std::runtime_error);

	ASSERT_EQ(chdir("/"), 0);
}
