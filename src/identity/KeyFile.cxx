// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "KeyFile.hxx"
#include "key/AuthorizedKey.hxx"
#include "io/BufferedReader.hxx"
#include "io/FdReader.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "lib/fmt/SystemError.hxx"
#include "co/Task.hxx"
#include "util/CharUtil.hxx"
#include "util/IterableSplitString.hxx"
#include "util/StringSplit.hxx"
#include "util/StringStrip.hxx"
#include "util/StringVerify.hxx"

#include <stdexcept>

static constexpr bool
IsIdentityChar(char ch) noexcept
{
	return IsAlphaNumericASCII(ch) ||
		ch == '-' || ch == '_' || ch == '.' || ch == '@';
}

[[gnu::pure]]
static bool
IsValidIdentity(std::string_view identity) noexcept
{
	return identity.size() <= 255 &&
		CheckCharsNonEmpty(identity, IsIdentityChar);
}

bool
KeyFileIdentityLookup::LoadLine(Map &map, std::string_view line)
{
	line = Strip(line);
	if (line.empty() || line.front() == '#')
		return true;

	const auto [identity, rest] = Split(line, ' ');
	const auto [key_type, rest2] = Split(StripLeft(rest), ' ');
	const auto [blob_base64, comment] = Split(StripLeft(rest2), ' ');

	if (!IsValidIdentity(identity) || key_type.empty() ||
	    blob_base64.empty())
		return false;

	try {
		map.emplace(CanonicalizeAuthorizedKey(key_type, blob_base64),
			    identity);
		return true;
	} catch (const std::invalid_argument &) {
		return false;
	}
}

std::size_t
KeyFileIdentityLookup::Load(Map &map, BufferedReader &r)
{
	std::size_t n_malformed = 0;

	while (const char *line = r.ReadLine())
		if (!LoadLine(map, line))
			++n_malformed;

	return n_malformed;
}

std::size_t
KeyFileIdentityLookup::Load(std::string_view contents)
{
	Map map;
	std::size_t n_malformed = 0;

	for (const std::string_view line : IterableSplitString(contents, '\n'))
		if (!LoadLine(map, line))
			++n_malformed;

	keys = std::move(map);
	return n_malformed;
}

std::size_t
KeyFileIdentityLookup::Reload()
{
	if (path.empty())
		return 0;

	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path.c_str()))
		throw FmtErrno("Failed to open {:?}", path);

	FdReader r{fd};
	BufferedReader br{r};

	Map map;
	const std::size_t n_malformed = Load(map, br);

	keys = std::move(map);
	return n_malformed;
}

std::string_view
KeyFileIdentityLookup::Find(std::string_view authorized_key) const noexcept
{
	if (const auto i = keys.find(authorized_key); i != keys.end())
		return i->second;

	return {};
}

Co::Task<std::string>
KeyFileIdentityLookup::Lookup(std::string_view authorized_key)
{
	co_return std::string{Find(authorized_key)};
}
