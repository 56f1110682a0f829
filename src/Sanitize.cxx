// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "Sanitize.hxx"
#include "util/CharUtil.hxx"
#include "util/StringCompare.hxx"

#include <cstdint>
#include <utility> // for std::pair

using std::string_view_literals::operator""sv;

/**
 * ASCII whitespace which separates command-line arguments.  Other
 * control characters are removed by DropNonPrintable() instead.
 */
[[gnu::const]]
static constexpr bool
IsArgumentSeparator(char ch) noexcept
{
	return ch == ' ' || ch == '\t' || ch == '\n' ||
		ch == '\v' || ch == '\f' || ch == '\r';
}

[[gnu::pure]]
static constexpr std::string_view
TrimLeftQuotes(std::string_view s) noexcept
{
	const auto i = s.find_first_not_of("'()"sv);
	return i == s.npos ? std::string_view{} : s.substr(i);
}

/**
 * Is the first token of this line a command which gitgate
 * implements itself?
 */
[[gnu::pure]]
static bool
IsBuiltinCommand(std::string_view line) noexcept
{
	while (!line.empty() && IsArgumentSeparator(line.front()))
		line.remove_prefix(1);

	line = TrimLeftQuotes(line);

	return StringStartsWith(line, "cat"sv) &&
		(line.size() == 3 || IsArgumentSeparator(line[3]));
}

std::string_view
StripCommandPrefix(std::string_view line) noexcept
{
	if (IsBuiltinCommand(line))
		/* leave the arguments alone; a path may well
		   contain "git" */
		return line;

	if (const auto i = line.find("git"sv); i != line.npos)
		line.remove_prefix(i);

	return line;
}

/**
 * Unicode general category "Cf" (format characters).
 */
[[gnu::const]]
static constexpr bool
IsFormatCodePoint(char32_t ch) noexcept
{
	return ch == 0xad ||
		(ch >= 0x600 && ch <= 0x605) ||
		ch == 0x61c || ch == 0x6dd || ch == 0x70f ||
		ch == 0x180e ||
		(ch >= 0x200b && ch <= 0x200f) ||
		(ch >= 0x202a && ch <= 0x202e) ||
		(ch >= 0x2060 && ch <= 0x2064) ||
		(ch >= 0x2066 && ch <= 0x206f) ||
		ch == 0xfeff ||
		(ch >= 0xfff9 && ch <= 0xfffb) ||
		ch == 0xe0001 ||
		(ch >= 0xe0020 && ch <= 0xe007f);
}

/**
 * Unicode general categories "Zs", "Zl" and "Zp" (separators).
 */
[[gnu::const]]
static constexpr bool
IsSeparatorCodePoint(char32_t ch) noexcept
{
	return ch == 0x20 || ch == 0xa0 || ch == 0x1680 ||
		(ch >= 0x2000 && ch <= 0x200a) ||
		ch == 0x2028 || ch == 0x2029 ||
		ch == 0x202f || ch == 0x205f || ch == 0x3000;
}

bool
IsPrintableCodePoint(char32_t ch) noexcept
{
	if (ch < 0x20 || (ch >= 0x7f && ch < 0xa0))
		/* C0, DEL and C1 control characters */
		return false;

	if (ch == ' ')
		return true;

	if (IsSeparatorCodePoint(ch) || IsFormatCodePoint(ch))
		return false;

	if (ch >= 0xd800 && ch <= 0xdfff)
		/* surrogates */
		return false;

	if ((ch >= 0xe000 && ch <= 0xf8ff) || ch >= 0xf0000)
		/* private use */
		return false;

	if ((ch >= 0xfdd0 && ch <= 0xfdef) || (ch & 0xfffe) == 0xfffe)
		/* noncharacters */
		return false;

	return ch <= 0x10ffff;
}

/**
 * Decode one UTF-8 sequence.
 *
 * @return the length of the sequence and the code point; a
 * length of 0 means the first byte does not start a valid
 * sequence
 */
static std::pair<std::size_t, char32_t>
DecodeUTF8(std::string_view s) noexcept
{
	const auto b0 = static_cast<uint_least8_t>(s.front());

	std::size_t length;
	char32_t ch, min;

	if (b0 < 0x80)
		return {1, b0};
	else if ((b0 & 0xe0) == 0xc0) {
		length = 2;
		ch = b0 & 0x1f;
		min = 0x80;
	} else if ((b0 & 0xf0) == 0xe0) {
		length = 3;
		ch = b0 & 0x0f;
		min = 0x800;
	} else if ((b0 & 0xf8) == 0xf0) {
		length = 4;
		ch = b0 & 0x07;
		min = 0x10000;
	} else
		return {0, 0};

	if (s.size() < length)
		return {0, 0};

	for (std::size_t i = 1; i < length; ++i) {
		const auto b = static_cast<uint_least8_t>(s[i]);
		if ((b & 0xc0) != 0x80)
			return {0, 0};

		ch = (ch << 6) | (b & 0x3f);
	}

	if (ch < min || ch > 0x10ffff || (ch >= 0xd800 && ch <= 0xdfff))
		/* overlong encoding, out of range or surrogate */
		return {0, 0};

	return {length, ch};
}

std::string
DropNonPrintable(std::string_view s)
{
	std::string result;
	result.reserve(s.size());

	while (!s.empty()) {
		const auto [length, ch] = DecodeUTF8(s);
		if (length == 0) {
			/* skip one byte of garbage and resynchronize */
			s.remove_prefix(1);
			continue;
		}

		if (IsPrintableCodePoint(ch))
			result.append(s.substr(0, length));

		s.remove_prefix(length);
	}

	return result;
}

std::vector<std::string>
SanitizeCommand(std::string_view line)
{
	line = TrimLeftQuotes(StripCommandPrefix(line));

	std::vector<std::string> result;

	while (true) {
		while (!line.empty() && IsArgumentSeparator(line.front()))
			line.remove_prefix(1);

		if (line.empty())
			break;

		std::size_t end = 0;
		while (end < line.size() && !IsArgumentSeparator(line[end]))
			++end;

		if (auto token = DropNonPrintable(line.substr(0, end));
		    !token.empty())
			result.emplace_back(std::move(token));

		line.remove_prefix(end);
	}

	return result;
}

bool
IsAcceptableEnvName(std::string_view name) noexcept
{
	if (name.empty() || IsDigitASCII(name.front()))
		return false;

	for (const char ch : name)
		if (!IsAlphaNumericASCII(ch) && ch != '_')
			return false;

	return name != "PATH"sv && name != "HOME"sv &&
		name != "SSH_ORIGINAL_COMMAND"sv &&
		name != "GITGATE_KEY_ID"sv &&
		!StringStartsWith(name, "LD_"sv);
}
