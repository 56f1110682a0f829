// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "Fingerprint.hxx"
#include "Key.hxx"
#include "ssh/Serializer.hxx"
#include "lib/sodium/Base64.hxx"
#include "lib/sodium/SHA256.hxx"
#include "util/AllocatedString.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

std::string
GetFingerprint(std::span<const std::byte> public_key_blob)
{
	const auto digest = SHA256(public_key_blob);
	return fmt::format("SHA256:{}"sv, SodiumBase64(digest).c_str());
}

std::string
GetFingerprint(const PublicKey &key)
{
	SSH::Serializer s;
	key.SerializePublic(s);
	return GetFingerprint(s.Finish());
}
