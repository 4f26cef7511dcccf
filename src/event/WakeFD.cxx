// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "WakeFD.hxx"
#include "net/SocketError.hxx"

#include <fcntl.h>
#include <unistd.h>

static void
SetNonBlockCloseOnExec(int fd) noexcept
{
	fcntl(fd, F_SETFD, FD_CLOEXEC);
	fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
}

WakeFD::WakeFD()
{
	if (pipe(fds) < 0)
		throw MakeSocketError("pipe() failed");

	SetNonBlockCloseOnExec(fds[0]);
	SetNonBlockCloseOnExec(fds[1]);
}

WakeFD::~WakeFD() noexcept
{
	close(fds[0]);
	close(fds[1]);
}

bool
WakeFD::Read() noexcept
{
	char buffer[256];
	bool result = false;
	while (read(fds[0], buffer, sizeof(buffer)) > 0)
		result = true;
	return result;
}

void
WakeFD::Write() noexcept
{
	static constexpr char dummy = 0;
	[[maybe_unused]] ssize_t nbytes = write(fds[1], &dummy, 1);
}
