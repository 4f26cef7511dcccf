// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_UNIQUE_SOCKET_DESCRIPTOR_HXX
#define MILO_NET_UNIQUE_SOCKET_DESCRIPTOR_HXX

#include "SocketDescriptor.hxx"

#include <utility>

/**
 * A #SocketDescriptor which is closed by the destructor unless
 * ownership is given up with Release().
 */
class UniqueSocketDescriptor : public SocketDescriptor {
public:
	UniqueSocketDescriptor() = default;

	UniqueSocketDescriptor(UniqueSocketDescriptor &&src) noexcept
		:SocketDescriptor(src.Release()) {}

	~UniqueSocketDescriptor() noexcept {
		Close();
	}

	UniqueSocketDescriptor &operator=(UniqueSocketDescriptor &&src) noexcept {
		std::swap(fd, src.fd);
		return *this;
	}

	SocketDescriptor Release() noexcept {
		return SocketDescriptor{std::exchange(fd, -1)};
	}
};

#endif
