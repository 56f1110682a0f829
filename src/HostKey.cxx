// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#include "HostKey.hxx"
#include "key/Parser.hxx"
#include "key/RSAKey.hxx"
#include "lib/fmt/SystemError.hxx"
#include "lib/openssl/Error.hxx"
#include "lib/openssl/UniqueBIO.hxx"
#include "system/Error.hxx"
#include "io/UniqueFileDescriptor.hxx"
#include "util/ScopeExit.hxx"
#include "util/SpanCast.hxx"

#include <fmt/core.h>

#include <openssl/pem.h>

#include <sodium/utils.h>

#include <array>
#include <exception> // for std::throw_with_nested()
#include <stdexcept>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

static constexpr std::size_t MAX_KEY_FILE_SIZE = 32768;

std::filesystem::path
MakeHostKeyPath(const std::filesystem::path &state_directory,
		unsigned port) noexcept
{
	return state_directory / "ssh" / fmt::format("gitgate_{}.rsa", port);
}

/**
 * Read the whole (regular) file into the given buffer.
 */
static std::span<const std::byte>
ReadKeyFile(FileDescriptor fd, std::span<std::byte> buffer)
{
	struct stat st;
	if (fstat(fd.Get(), &st) < 0)
		throw MakeErrno("Failed to stat file");

	if (!S_ISREG(st.st_mode))
		throw std::runtime_error{"Not a regular file"};

	if (st.st_size > (off_t)buffer.size())
		throw std::runtime_error{"File is too large"};

	std::size_t fill = 0;
	while (fill < buffer.size()) {
		const auto nbytes = fd.Read(buffer.subspan(fill));
		if (nbytes < 0)
			throw MakeErrno("Failed to read file");

		if (nbytes == 0)
			break;

		fill += static_cast<std::size_t>(nbytes);
	}

	return buffer.first(fill);
}

static std::unique_ptr<SecretKey>
LoadHostKeyFile(FileDescriptor fd)
{
	std::array<std::byte, MAX_KEY_FILE_SIZE> buffer;
	AtScopeExit(&buffer) { sodium_memzero(&buffer, sizeof(buffer)); };

	return ParseSecretKey(ReadKeyFile(fd, buffer));
}

std::string
FormatPemPrivateKey(const RSAKey &key)
{
	const UniqueBIO bio{BIO_new(BIO_s_mem())};
	if (!bio)
		throw SslError{"BIO_new() failed"};

	if (!PEM_write_bio_PrivateKey(bio.get(), &key.GetEvpPkey(),
				      nullptr, nullptr, 0, nullptr, nullptr))
		throw SslError{"PEM_write_bio_PrivateKey() failed"};

	char *data;
	const long size = BIO_get_mem_data(bio.get(), &data);
	if (size <= 0)
		throw std::runtime_error{"PEM encoder produced no data"};

	return {data, static_cast<std::size_t>(size)};
}

static void
WriteFull(FileDescriptor fd, std::span<const std::byte> src)
{
	while (!src.empty()) {
		const auto nbytes = fd.Write(src);
		if (nbytes < 0)
			throw MakeErrno("Failed to write file");

		src = src.subspan(static_cast<std::size_t>(nbytes));
	}
}

/**
 * Generate a new key and try to store it at the given path.
 *
 * @return the new key or nullptr if the file was created
 * concurrently by somebody else
 */
static std::unique_ptr<SecretKey>
GenerateHostKey(const std::filesystem::path &path)
{
	auto key = std::make_unique<RSAKey>(RSAKey::Generate{});

	std::string pem = FormatPemPrivateKey(*key);
	AtScopeExit(&pem) { sodium_memzero(pem.data(), pem.size()); };

	const auto tmp_path = fmt::format("{}.{}.tmp", path.native(), getpid());

	/* remove a stale file left over by a crashed process with
	   the same PID */
	(void)unlink(tmp_path.c_str());

	UniqueFileDescriptor fd;
	if (!fd.Open(tmp_path.c_str(), O_CREAT|O_EXCL|O_WRONLY, 0600))
		throw FmtErrno("Failed to create {:?}", tmp_path);

	AtScopeExit(&tmp_path) { unlink(tmp_path.c_str()); };

	WriteFull(fd, AsBytes(pem));

	if (fsync(fd.Get()) < 0)
		throw FmtErrno("Failed to commit {:?}", tmp_path);

	fd.Close();

	if (link(tmp_path.c_str(), path.c_str()) < 0) {
		if (errno == EEXIST)
			return nullptr;

		throw FmtErrno("Failed to create {:?}", path.native());
	}

	return key;
}

LoadedHostKey
LoadOrGenerateHostKey(const std::filesystem::path &path)
{
	UniqueFileDescriptor fd;
	if (!fd.OpenReadOnly(path.c_str())) {
		if (errno != ENOENT)
			throw FmtErrno("Failed to open {:?}", path.native());

		std::filesystem::create_directories(path.parent_path());

		if (auto key = GenerateHostKey(path))
			return {std::move(key), true};

		if (!fd.OpenReadOnly(path.c_str()))
			throw FmtErrno("Failed to open {:?}", path.native());
	}

	try {
		return {LoadHostKeyFile(fd), false};
	} catch (...) {
		std::throw_with_nested(std::runtime_error{
				fmt::format("Failed to load host key from {:?}",
					    path.native())});
	}
}
