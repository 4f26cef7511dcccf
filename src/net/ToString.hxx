// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_TO_STRING_HXX
#define MILO_NET_TO_STRING_HXX

#include <string>

class SocketAddress;

/**
 * Format the host part of a socket address numerically, without the
 * port.
 *
 * @return an empty string on error
 */
[[gnu::pure]]
std::string
HostToString(SocketAddress address) noexcept;

#endif
