// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "ProcessSupervisor.hxx"

#include <gtest/gtest.h>

TEST(Deadline, Escalation)
{
	/* SIGTERM first, then SIGKILL, then give up */
	EXPECT_EQ(NextDeadlineAction(DeadlinePhase::RUNNING, true),
		  DeadlineAction::TERMINATE);
	EXPECT_EQ(NextDeadlineAction(DeadlinePhase::TERMINATING, true),
		  DeadlineAction::KILL);
	EXPECT_EQ(NextDeadlineAction(DeadlinePhase::KILLED, true),
		  DeadlineAction::ABANDON);
}

TEST(Deadline, ExitedWithPendingOutput)
{
	/* the process has exited, but somebody else still holds
	   its stdout/stderr: there is nobody left to signal */
	EXPECT_EQ(NextDeadlineAction(DeadlinePhase::RUNNING, false),
		  DeadlineAction::ABANDON);
	EXPECT_EQ(NextDeadlineAction(DeadlinePhase::TERMINATING, false),
		  DeadlineAction::ABANDON);
	EXPECT_EQ(NextDeadlineAction(DeadlinePhase::KILLED, false),
		  DeadlineAction::ABANDON);
}

static_assert(NextDeadlineAction(DeadlinePhase::RUNNING, true) == DeadlineAction::TERMINATE);
