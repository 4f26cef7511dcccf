// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SocketEvent.hxx"
#include "Loop.hxx"

#include <cassert>

void
SocketEvent::Open(SocketDescriptor _fd) noexcept
{
	assert(_fd.IsDefined());
	assert(!fd.IsDefined());
	assert(scheduled_flags == 0);

	fd = _fd;
}

void
SocketEvent::Close() noexcept
{
	if (!fd.IsDefined())
		return;

	Cancel();
	fd.Close();
}

void
SocketEvent::Schedule(unsigned flags) noexcept
{
	if (flags != 0)
		flags |= DEAD_MASK;

	if (flags == scheduled_flags)
		return;

	scheduled_flags = flags;

	if (flags == 0) {
		/* also removes it from the "ready" list */
		unlink();
		ready_flags = 0;
	} else if (!is_linked()) {
		assert(fd.IsDefined());
		loop.AddSocket(*this);
	}
}

void
SocketEvent::Dispatch() noexcept
{
	const unsigned flags = std::exchange(ready_flags, 0) & scheduled_flags;
	if (flags != 0)
		callback(flags);
}
