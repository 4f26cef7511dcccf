// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_IPV4_ADDRESS_HXX
#define MILO_NET_IPV4_ADDRESS_HXX

#include "SocketAddress.hxx"

#include <cstdint>
#include <optional>

#include <netinet/in.h>

/**
 * An IPv4 endpoint (struct sockaddr_in).
 */
class IPv4Address {
	struct sockaddr_in address{};

	IPv4Address() = default;

public:
	/**
	 * Parse a dotted-quad address; host names are not resolved.
	 *
	 * @return std::nullopt if the string is not a numeric IPv4
	 * address
	 */
	[[gnu::pure]]
	static std::optional<IPv4Address> Parse(const char *numeric,
						uint16_t port) noexcept;

	operator SocketAddress() const noexcept {
		return {reinterpret_cast<const struct sockaddr *>(&address),
			sizeof(address)};
	}
};

#endif
