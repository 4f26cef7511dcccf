// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_WAKE_FD_HXX
#define MILO_EVENT_WAKE_FD_HXX

#include "net/SocketDescriptor.hxx"

/**
 * A non-blocking pipe used to wake up a sleeping #EventLoop from
 * another thread (or from a signal handler).
 */
class WakeFD {
	int fds[2];

public:
	/**
	 * Throws on error.
	 */
	WakeFD();
	~WakeFD() noexcept;

	WakeFD(const WakeFD &) = delete;
	WakeFD &operator=(const WakeFD &) = delete;

	SocketDescriptor GetSocket() const noexcept {
		return SocketDescriptor{fds[0]};
	}

	/**
	 * Drain the pipe.
	 *
	 * @return true if something was read
	 */
	bool Read() noexcept;

	/**
	 * Async-signal-safe.
	 */
	void Write() noexcept;
};

#endif
