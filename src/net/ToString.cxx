// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ToString.hxx"
#include "SocketAddress.hxx"

#include <netdb.h>

std::string
HostToString(SocketAddress address) noexcept
{
	char buffer[NI_MAXHOST];

	if (address.IsNull() ||
	    getnameinfo(address.GetAddress(), address.GetSize(),
			buffer, sizeof(buffer), nullptr, 0,
			NI_NUMERICHOST) != 0)
		return {};

	return buffer;
}
