// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SessionState.hxx"
#include "Sanitize.hxx"

#include <gtest/gtest.h>

#include <forward_list>
#include <string>
#include <vector>

#include <signal.h>
#include <stdlib.h>
#include <sys/wait.h>
#include <unistd.h>

using std::string_view_literals::operator""sv;

static std::vector<std::string>
ToVector(const std::forward_list<std::string> &l)
{
	return {l.begin(), l.end()};
}

TEST(SessionState, Env)
{
	SessionState state;
	EXPECT_EQ(state.AddEnv("LANG"sv, "C.UTF-8"sv), EnvVerdict::ACCEPTED);
	EXPECT_EQ(state.AddEnv("GIT_PROTOCOL"sv, "version=2"sv), EnvVerdict::ACCEPTED);

	const auto env = ToVector(state.GetEnv());
	ASSERT_EQ(env.size(), 2U);
	EXPECT_EQ(env[0], "GIT_PROTOCOL=version=2");
	EXPECT_EQ(env[1], "LANG=C.UTF-8");
}

TEST(SessionState, InvalidEnvKeepsChannelUsable)
{
	SessionState state;
	EXPECT_EQ(state.AddEnv(""sv, "x"sv), EnvVerdict::INVALID);
	EXPECT_EQ(state.AddEnv("LANG"sv, ""sv), EnvVerdict::INVALID);
	EXPECT_EQ(state.AddEnv("LANG"sv, "a\0b"sv), EnvVerdict::INVALID);
	EXPECT_EQ(state.AddEnv("PATH"sv, "/tmp"sv), EnvVerdict::REFUSED);
	EXPECT_EQ(state.AddEnv("LD_PRELOAD"sv, "/tmp/x.so"sv), EnvVerdict::REFUSED);
	EXPECT_TRUE(state.GetEnv().empty());

	/* the refused requests did not affect later ones */
	EXPECT_EQ(state.AddEnv("LANG"sv, "C"sv), EnvVerdict::ACCEPTED);
	EXPECT_FALSE(state.IsExecReceived());
	EXPECT_TRUE(state.BeginExec());

	const auto env = ToVector(state.GetEnv());
	ASSERT_EQ(env.size(), 1U);
	EXPECT_EQ(env.front(), "LANG=C");
}

TEST(SessionState, EnvTooLarge)
{
	SessionState state;
	const std::string value(1000, 'x');

	unsigned n = 0;
	while (state.AddEnv("LANG"sv, value) == EnvVerdict::ACCEPTED)
		++n;

	EXPECT_GT(n, 0U);
	EXPECT_LT(n, 20U);
	EXPECT_EQ(state.AddEnv("LANG"sv, value), EnvVerdict::TOO_LARGE);

	/* a small one may still fit */
	EXPECT_EQ(state.AddEnv("TZ"sv, "UTC"sv), EnvVerdict::ACCEPTED);
}

TEST(SessionState, ExecOnce)
{
	SessionState state;
	EXPECT_FALSE(state.IsExecReceived());
	EXPECT_TRUE(state.BeginExec());
	EXPECT_TRUE(state.IsExecReceived());

	/* a second "exec" is refused */
	EXPECT_FALSE(state.BeginExec());
	EXPECT_FALSE(state.BeginExec());

	/* so is "env" after "exec" */
	EXPECT_EQ(state.AddEnv("LANG"sv, "C"sv), EnvVerdict::TOO_LATE);
	EXPECT_TRUE(state.GetEnv().empty());
}

TEST(ClassifyCommand, Basic)
{
	EXPECT_EQ(ClassifyCommand({}), CommandKind::EMPTY);
	EXPECT_EQ(ClassifyCommand({"cat"}), CommandKind::CAT_WITHOUT_PATH);
	EXPECT_EQ(ClassifyCommand({"cat", "/srv/git/x"}), CommandKind::CAT);
	EXPECT_EQ(ClassifyCommand({"git-upload-pack", "repo.git"}), CommandKind::SPAWN);
	EXPECT_EQ(ClassifyCommand({"catalog"}), CommandKind::SPAWN);
}

TEST(ClassifyCommand, SanitizedLine)
{
	EXPECT_EQ(ClassifyCommand(SanitizeCommand("  \t "sv)), CommandKind::EMPTY);
	EXPECT_EQ(ClassifyCommand(SanitizeCommand("cat  /tmp/x"sv)), CommandKind::CAT);
	EXPECT_EQ(ClassifyCommand(SanitizeCommand("git-receive-pack 'r.git'"sv)),
		  CommandKind::SPAWN);
}

/**
 * Fork a child which terminates the given way and return its
 * waitpid() status.
 */
static int
RunChild(int exit_status, int signo=0)
{
	const pid_t pid = fork();
	if (pid == 0) {
		if (signo != 0)
			kill(getpid(), signo);
		_exit(exit_status);
	}

	int status = 0;
	if (pid < 0 || waitpid(pid, &status, 0) != pid)
		ADD_FAILURE() << "fork/waitpid failed";
	return status;
}

TEST(DescribeExit, Exited)
{
	const auto zero = DescribeExit(RunChild(0));
	EXPECT_FALSE(zero.IsSignaled());
	EXPECT_EQ(zero.status, 0);

	const auto three = DescribeExit(RunChild(3));
	EXPECT_FALSE(three.IsSignaled());
	EXPECT_EQ(three.status, 3);
	EXPECT_FALSE(three.core_dumped);
}

TEST(DescribeExit, Signaled)
{
	const auto report = DescribeExit(RunChild(0, SIGKILL));
	ASSERT_TRUE(report.IsSignaled());
	EXPECT_EQ(report.status, SIGKILL);
	EXPECT_STREQ(report.signal_name, "KILL");
	EXPECT_FALSE(report.core_dumped);

	const auto term = DescribeExit(RunChild(0, SIGTERM));
	ASSERT_TRUE(term.IsSignaled());
	EXPECT_STREQ(term.signal_name, "TERM");
}
