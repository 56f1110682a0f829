// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "AuthorizedKey.hxx"
#include "ssh/Deserializer.hxx"
#include "lib/sodium/Base64.hxx"
#include "util/AllocatedArray.hxx"

#include <sodium/utils.h>

#include <stdexcept>

static std::string_view
ReadKeyType(std::span<const std::byte> blob)
try {
	SSH::Deserializer d{blob};
	const auto type = d.ReadString();
	if (type.empty())
		throw std::invalid_argument{"Empty key type"};
	return type;
} catch (const SSH::MalformedPacket &) {
	throw std::invalid_argument{"Malformed public key blob"};
}

std::string
FormatAuthorizedKey(std::span<const std::byte> public_key_blob)
{
	const auto type = ReadKeyType(public_key_blob);

	constexpr int variant = sodium_base64_VARIANT_ORIGINAL;
	const std::size_t base64_size =
		sodium_base64_ENCODED_LEN(public_key_blob.size(), variant);

	std::string result;
	result.reserve(type.size() + 1 + base64_size);
	result.append(type);
	result.push_back(' ');

	const std::size_t base64_position = result.size();
	result.resize(base64_position + base64_size);
	sodium_bin2base64(result.data() + base64_position, base64_size,
			  reinterpret_cast<const unsigned char *>(public_key_blob.data()),
			  public_key_blob.size(), variant);

	/* strip the null terminator written by libsodium */
	result.resize(result.size() - 1);
	return result;
}

std::string
CanonicalizeAuthorizedKey(std::string_view type, std::string_view base64)
{
	const auto blob = DecodeBase64(base64);
	if (blob == nullptr)
		throw std::invalid_argument{"Malformed base64"};

	if (ReadKeyType(blob) != type)
		throw std::invalid_argument{"Key type mismatch"};

	return FormatAuthorizedKey(blob);
}
