// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#include "KexHash.hxx"
#include "Protocol.hxx"
#include "util/PackedBigEndian.hxx"
#include "util/SpanCast.hxx"

namespace SSH {

std::size_t
CalcKexHash(DigestAlgorithm hash_alg, const KexHashInput &input,
	    std::byte *hash) noexcept
{
	const PackedBE32 client_version_length(input.client_version.size());
	const PackedBE32 server_version_length(input.server_version.size());

	/* the KEXINIT payloads are hashed as "string" including the
	   message number byte */
	const PackedBE32 client_kexinit_size(input.client_kexinit.size() + 1);
	const PackedBE32 server_kexinit_size(input.server_kexinit.size() + 1);
	const auto kexinit_msg_number = static_cast<uint8_t>(MessageNumber::KEXINIT);

	const PackedBE32 server_host_key_blob_size(input.server_host_key_blob.size());
	const PackedBE32 client_ephemeral_public_key_size(input.client_ephemeral_public_key.size());
	const PackedBE32 server_ephemeral_public_key_size(input.server_ephemeral_public_key.size());

	return Digest(hash_alg, {
			ReferenceAsBytes(client_version_length),
			AsBytes(input.client_version),
			ReferenceAsBytes(server_version_length),
			AsBytes(input.server_version),
			ReferenceAsBytes(client_kexinit_size),
			ReferenceAsBytes(kexinit_msg_number),
			input.client_kexinit,
			ReferenceAsBytes(server_kexinit_size),
			ReferenceAsBytes(kexinit_msg_number),
			input.server_kexinit,
			ReferenceAsBytes(server_host_key_blob_size),
			input.server_host_key_blob,
			ReferenceAsBytes(client_ephemeral_public_key_size),
			input.client_ephemeral_public_key,
			ReferenceAsBytes(server_ephemeral_public_key_size),
			input.server_ephemeral_public_key,
			input.shared_secret,
		}, hash);
}

} // namespace SSH
