// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "SessionResult.hxx"

#include <utility> // for std::unreachable()

using std::string_view_literals::operator""sv;

std::string_view
ToString(SessionResult::Outcome outcome) noexcept
{
	using O = SessionResult::Outcome;
	switch (outcome) {
	case O::EXITED:
		return "exited"sv;

	case O::SIGNALED:
		return "signaled"sv;

	case O::FILE_WRITTEN:
		return "file_written"sv;

	case O::ABORTED:
		return "aborted"sv;

	case O::CLOSED_BY_PEER:
		return "closed_by_peer"sv;
	}

	std::unreachable();
}
