// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_SOCKET_ADDRESS_HXX
#define MILO_NET_SOCKET_ADDRESS_HXX

#include <sys/socket.h>

/**
 * A non-owning view of a struct sockaddr and its length.
 */
class SocketAddress {
	const struct sockaddr *address = nullptr;
	socklen_t size = 0;

public:
	SocketAddress() = default;

	constexpr SocketAddress(const struct sockaddr *_address,
				socklen_t _size) noexcept
		:address(_address), size(_size) {}

	constexpr bool IsNull() const noexcept {
		return address == nullptr;
	}

	constexpr const struct sockaddr *GetAddress() const noexcept {
		return address;
	}

	constexpr socklen_t GetSize() const noexcept {
		return size;
	}
};

#endif
