// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SocketDescriptor.hxx"
#include "SocketAddress.hxx"

#include <utility>

#include <errno.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

void
SocketDescriptor::Close() noexcept
{
	if (fd >= 0)
		::close(std::exchange(fd, -1));
}

bool
SocketDescriptor::CreateNonBlock(int domain, int type, int protocol) noexcept
{
	const int new_fd = ::socket(domain, type|SOCK_NONBLOCK|SOCK_CLOEXEC,
				    protocol);
	if (new_fd < 0)
		return false;

	Close();
	fd = new_fd;
	return true;
}

bool
SocketDescriptor::SetNoDelay() const noexcept
{
	static constexpr int one = 1;
	return setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one)) == 0;
}

bool
SocketDescriptor::Connect(SocketAddress address) const noexcept
{
	return ::connect(fd, address.GetAddress(), address.GetSize()) == 0;
}

int
SocketDescriptor::GetError() const noexcept
{
	int error = 0;
	socklen_t length = sizeof(error);
	if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &error, &length) < 0)
		return errno;

	return error;
}

ssize_t
SocketDescriptor::Receive(std::span<std::byte> dest) const noexcept
{
	return ::recv(fd, dest.data(), dest.size(), MSG_DONTWAIT);
}

ssize_t
SocketDescriptor::Send(std::span<const std::byte> src) const noexcept
{
	return ::send(fd, src.data(), src.size(), MSG_DONTWAIT|MSG_NOSIGNAL);
}
