// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <mk@cm4all.com>

#pragma once

#include "memory/SliceFifoBuffer.hxx"

/**
 * The input buffer type of #BufferedSocket.  Buffers are slices from
 * the global #fb_pool, which must be initialized (ScopeFbPoolInit)
 * before the first connection reads data.
 */
class DefaultFifoBuffer : public SliceFifoBuffer {
public:
	void Allocate() noexcept;
	void AllocateIfNull() noexcept;
	void CycleIfEmpty() noexcept;
};
