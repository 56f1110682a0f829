// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Sanitize.hxx"

#include <gtest/gtest.h>

using std::string_view_literals::operator""sv;

using Args = std::vector<std::string>;

TEST(Sanitize, StripCommandPrefix)
{
	EXPECT_EQ(StripCommandPrefix("git-upload-pack 'foo.git'"sv),
		  "git-upload-pack 'foo.git'"sv);
	EXPECT_EQ(StripCommandPrefix("/usr/bin/git-receive-pack x"sv),
		  "git-receive-pack x"sv);
	EXPECT_EQ(StripCommandPrefix("cat /tmp/x"sv), "cat /tmp/x"sv);
	EXPECT_EQ(StripCommandPrefix(""sv), ""sv);
}

TEST(Sanitize, CatPathContainingGit)
{
	/* the prefix rule does not apply to the built-in "cat"
	   command */
	EXPECT_EQ(StripCommandPrefix("cat /srv/git/repo/x"sv),
		  "cat /srv/git/repo/x"sv);
	EXPECT_EQ(SanitizeCommand("cat /srv/git/repo/x"sv),
		  (Args{"cat", "/srv/git/repo/x"}));
	EXPECT_EQ(SanitizeCommand("  cat\t/home/git/.ssh/authorized_keys"sv),
		  (Args{"cat", "/home/git/.ssh/authorized_keys"}));

	/* "cat" must be a complete token */
	EXPECT_EQ(SanitizeCommand("catalog /srv/git/x"sv),
		  (Args{"git/x"}));

	/* garbage before a git command is still removed */
	EXPECT_EQ(SanitizeCommand("proxycommand; git foo"sv),
		  (Args{"git", "foo"}));
}

TEST(Sanitize, Simple)
{
	EXPECT_EQ(SanitizeCommand("git-upload-pack 'foo.git'"sv),
		  (Args{"git-upload-pack", "'foo.git'"}));
	EXPECT_EQ(SanitizeCommand("cat /tmp/out"sv),
		  (Args{"cat", "/tmp/out"}));
}

TEST(Sanitize, Prefix)
{
	EXPECT_EQ(SanitizeCommand("garbage git-receive-pack repo"sv),
		  (Args{"git-receive-pack", "repo"}));
}

TEST(Sanitize, LeadingQuotes)
{
	/* without "git", only the leading quote characters are
	   removed */
	EXPECT_EQ(SanitizeCommand("'(cat' /tmp/x"sv),
		  (Args{"cat'", "/tmp/x"}));
	EXPECT_EQ(SanitizeCommand("'()'"sv), Args{});
}

TEST(Sanitize, Whitespace)
{
	EXPECT_EQ(SanitizeCommand("  git-upload-pack \t\t repo\r\n"sv),
		  (Args{"git-upload-pack", "repo"}));
	EXPECT_EQ(SanitizeCommand(" \t "sv), Args{});
	EXPECT_EQ(SanitizeCommand(""sv), Args{});
}

TEST(Sanitize, NonPrintable)
{
	EXPECT_EQ(SanitizeCommand("git-upload-pack re\x01po\x7f"sv),
		  (Args{"git-upload-pack", "repo"}));

	/* a token consisting only of control characters vanishes */
	EXPECT_EQ(SanitizeCommand("git-upload-pack \x1b\x07 repo"sv),
		  (Args{"git-upload-pack", "repo"}));
}

TEST(Sanitize, UTF8)
{
	/* printable non-ASCII characters are kept */
	EXPECT_EQ(DropNonPrintable("r\xc3\xa4po"sv), "r\xc3\xa4po");

	/* zero width space (U+200B) and BOM (U+FEFF) are dropped */
	EXPECT_EQ(DropNonPrintable("a\xe2\x80\x8b" "b\xef\xbb\xbf"sv), "ab");

	/* invalid and overlong sequences are dropped */
	EXPECT_EQ(DropNonPrintable("a\xff" "b\xc0\xaf" "c"sv), "abc");

	/* truncated sequence at the end */
	EXPECT_EQ(DropNonPrintable("abc\xe2\x82"sv), "abc");
}

TEST(Sanitize, IsPrintableCodePoint)
{
	EXPECT_TRUE(IsPrintableCodePoint('a'));
	EXPECT_TRUE(IsPrintableCodePoint(' '));
	EXPECT_TRUE(IsPrintableCodePoint(0xe4));
	EXPECT_TRUE(IsPrintableCodePoint(0x1f600));

	EXPECT_FALSE(IsPrintableCodePoint(0));
	EXPECT_FALSE(IsPrintableCodePoint('\t'));
	EXPECT_FALSE(IsPrintableCodePoint(0x7f));
	EXPECT_FALSE(IsPrintableCodePoint(0x85));
	EXPECT_FALSE(IsPrintableCodePoint(0xa0));
	EXPECT_FALSE(IsPrintableCodePoint(0x2028));
	EXPECT_FALSE(IsPrintableCodePoint(0xe000));
	EXPECT_FALSE(IsPrintableCodePoint(0xfffe));
	EXPECT_FALSE(IsPrintableCodePoint(0x110000));

	/* unassigned code points are not looked up in the Unicode
	   database; they are kept */
	EXPECT_TRUE(IsPrintableCodePoint(0x378));
	EXPECT_TRUE(IsPrintableCodePoint(0x2fffd));
	EXPECT_EQ(DropNonPrintable("a\xcd\xb8" "b"sv), "a\xcd\xb8" "b");
}

TEST(Sanitize, IsAcceptableEnvName)
{
	EXPECT_TRUE(IsAcceptableEnvName("GIT_PROTOCOL"sv));
	EXPECT_TRUE(IsAcceptableEnvName("LANG"sv));
	EXPECT_TRUE(IsAcceptableEnvName("_x1"sv));

	EXPECT_FALSE(IsAcceptableEnvName(""sv));
	EXPECT_FALSE(IsAcceptableEnvName("1X"sv));
	EXPECT_FALSE(IsAcceptableEnvName("A-B"sv));
	EXPECT_FALSE(IsAcceptableEnvName("A=B"sv));
	EXPECT_FALSE(IsAcceptableEnvName("PATH"sv));
	EXPECT_FALSE(IsAcceptableEnvName("HOME"sv));
	EXPECT_FALSE(IsAcceptableEnvName("SSH_ORIGINAL_COMMAND"sv));
	EXPECT_FALSE(IsAcceptableEnvName("GITGATE_KEY_ID"sv));
	EXPECT_FALSE(IsAcceptableEnvName("LD_PRELOAD"sv));
}
