// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "PublickeyAuth.hxx"
#include "identity/Lookup.hxx"
#include "key/AuthorizedKey.hxx"
#include "key/Parser.hxx"
#include "key/Key.hxx"
#include "ssh/KexProposal.hxx"
#include "ssh/Protocol.hxx"
#include "ssh/Deserializer.hxx"
#include "ssh/Serializer.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "co/Task.hxx"

#include <fmt/core.h>

using std::string_view_literals::operator""sv;

PublickeyResult::PublickeyResult() noexcept = default;
PublickeyResult::~PublickeyResult() noexcept = default;
PublickeyResult::PublickeyResult(PublickeyResult &&) noexcept = default;
PublickeyResult &PublickeyResult::operator=(PublickeyResult &&) noexcept = default;

UserauthRequest
ParseUserauthRequest(std::span<const std::byte> payload)
{
	SSH::Deserializer d{payload};
	const auto start = d.Mark();

	UserauthRequest r;
	r.user_name = d.ReadString();
	r.service_name = d.ReadString();
	r.method_name = d.ReadString();

	if (r.method_name != "publickey"sv)
		/* other methods are refused without looking at
		   their fields */
		return r;

	auto &p = r.publickey;
	p.with_signature = d.ReadBool();
	p.algorithm = d.ReadString();
	p.blob = d.ReadLengthEncoded();

	if (p.with_signature) {
		p.signed_part = d.Since(start);
		p.signature = d.ReadLengthEncoded();
	}

	d.ExpectEnd();
	return r;
}

/**
 * Throws on error.
 */
static bool
VerifyUserauthSignature(const PublicKey &key, std::span<const std::byte> session_id,
			const PublickeyRequest &r)
{
	SSH::Serializer s;
	s.WriteLengthEncoded(session_id);
	s.WriteU8(static_cast<uint_least8_t>(SSH::MessageNumber::USERAUTH_REQUEST));
	s.WriteN(r.signed_part);

	return key.Verify(s.Finish(), r.signature);
}

static PublickeyResult
Reject(PublickeyResult &&result, std::string &&reason) noexcept
{
	result.verdict = PublickeyVerdict::REJECTED;
	result.reason = std::move(reason);
	return std::move(result);
}

Co::Task<PublickeyResult>
CheckPublickey(IdentityLookup &lookup,
	       std::span<const std::byte> session_id,
	       const PublickeyRequest &request)
{
	PublickeyResult result;
	std::string authorized_key;

	try {
		result.key = ParsePublicKeyBlob(request.blob);
		authorized_key = FormatAuthorizedKey(request.blob);
	} catch (...) {
		co_return Reject(std::move(result),
				 fmt::format("Malformed public key: {}",
					     std::current_exception()));
	}

	if (!SSH::NameListContains(result.key->GetAlgorithms(), request.algorithm))
		co_return Reject(std::move(result),
				 fmt::format("Algorithm {:?} does not match key type {:?}",
					     request.algorithm, result.key->GetType()));

	if (request.with_signature) {
		bool valid;

		try {
			valid = VerifyUserauthSignature(*result.key, session_id, request);
		} catch (...) {
			/* provider errors count as a bad signature */
			co_return Reject(std::move(result),
					 fmt::format("Signature verification failed: {}",
						     std::current_exception()));
		}

		if (!valid)
			co_return Reject(std::move(result), "Bad signature");
	}

	/* the lookup happens only after the signature was checked */
	try {
		result.identity = co_await lookup.Lookup(authorized_key);
	} catch (...) {
		co_return Reject(std::move(result),
				 fmt::format("Identity lookup failed: {}",
					     std::current_exception()));
	}

	if (result.identity.empty())
		co_return Reject(std::move(result), "Unknown key");

	result.verdict = request.with_signature
		? PublickeyVerdict::ACCEPTED
		: PublickeyVerdict::ACCEPTABLE;
	co_return result;
}
