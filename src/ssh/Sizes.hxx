// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

#include <cstddef>

namespace SSH {

static constexpr std::size_t HEADER_SIZE = 4;

/**
 * The maximum size of a packet (excluding the length field and the
 * MAC) we accept and generate.  RFC 4253 section 6.1 requires
 * support for at least 35000 bytes.
 */
static constexpr std::size_t MAX_PACKET_SIZE = 35000;

static constexpr std::size_t KEX_COOKIE_SIZE = 16;

/**
 * The maximum size of the "data" field of a CHANNEL_DATA packet we
 * announce to the peer.
 */
static constexpr std::size_t CHANNEL_MAX_PACKET_SIZE = 32768;

/**
 * The initial receive window of a channel.
 */
static constexpr std::size_t CHANNEL_WINDOW_SIZE = 1024 * 1024;

} // namespace SSH
