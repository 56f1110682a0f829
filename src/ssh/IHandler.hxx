// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH
// author: Max Kellermann <max.kellermann@ionos.com>

#pragma once

namespace SSH {

/**
 * Handler for #Input.
 */
class InputHandler {
public:
	/**
	 * New data has been fed into the #Input; the handler shall
	 * now call Input::ReadPacket() until it returns nullptr.
	 *
	 * @return false if the #Input was destroyed
	 */
	virtual bool OnInputReady() noexcept = 0;
};

} // namespace SSH
