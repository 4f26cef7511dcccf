// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_SOCKET_DESCRIPTOR_HXX
#define MILO_NET_SOCKET_DESCRIPTOR_HXX

#include <cstddef>
#include <span>

#include <sys/types.h>

class SocketAddress;

/**
 * A non-owning handle to a socket (or any other file descriptor
 * which can be passed to poll()).  See #UniqueSocketDescriptor for
 * the owning variant.
 *
 * All I/O is non-blocking; methods returning bool set errno on
 * failure.
 */
class SocketDescriptor {
protected:
	int fd = -1;

public:
	SocketDescriptor() = default;

	explicit constexpr SocketDescriptor(int _fd) noexcept
		:fd(_fd) {}

	static constexpr SocketDescriptor Undefined() noexcept {
		return SocketDescriptor{};
	}

	constexpr bool IsDefined() const noexcept {
		return fd >= 0;
	}

	constexpr int Get() const noexcept {
		return fd;
	}

	void Close() noexcept;

	/**
	 * Create a socket with O_NONBLOCK and FD_CLOEXEC.
	 */
	bool CreateNonBlock(int domain, int type, int protocol) noexcept;

	/**
	 * Disable the Nagle algorithm (TCP_NODELAY).
	 */
	bool SetNoDelay() const noexcept;

	/**
	 * Start connecting.  This usually fails with EINPROGRESS; the
	 * result is known when the socket becomes writable, see
	 * GetError().
	 */
	bool Connect(SocketAddress address) const noexcept;

	/**
	 * Fetch and clear the pending error (SO_ERROR).
	 *
	 * @return 0 if there is none, or an errno value
	 */
	int GetError() const noexcept;

	ssize_t Receive(std::span<std::byte> dest) const noexcept;

	/**
	 * Never raises SIGPIPE.
	 */
	ssize_t Send(std::span<const std::byte> src) const noexcept;
};

#endif
