// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_SOCKET_EVENT_HXX
#define MILO_EVENT_SOCKET_EVENT_HXX

#include "net/SocketDescriptor.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/list_hook.hpp>

#include <utility>

#include <poll.h>

class EventLoop;

/**
 * Watches a socket (or any other pollable file descriptor) in the
 * #EventLoop.  Schedule() selects the events; the callback receives
 * the subset which is ready.
 *
 * The descriptor is not owned; Close() closes it explicitly.
 */
class SocketEvent final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void(unsigned events) noexcept>;
	const Callback callback;

	SocketDescriptor fd;

	/**
	 * The events passed to poll().  The socket is linked in the
	 * #EventLoop if and only if this is non-zero.
	 */
	unsigned scheduled_flags = 0;

	/**
	 * Set by the #EventLoop after poll() while this object waits
	 * in the "ready" list.
	 */
	unsigned ready_flags = 0;

public:
	static constexpr unsigned READ = POLLIN;
	static constexpr unsigned WRITE = POLLOUT;
	static constexpr unsigned ERROR = POLLERR;
	static constexpr unsigned HANGUP = POLLHUP;

	/**
	 * Events which indicate a dead connection.  They are always
	 * reported, whether scheduled or not.
	 */
	static constexpr unsigned DEAD_MASK = ERROR|HANGUP;

	SocketEvent(EventLoop &_loop, Callback _callback,
		    SocketDescriptor _fd=SocketDescriptor::Undefined()) noexcept
		:loop(_loop), callback(_callback), fd(_fd) {}

	~SocketEvent() noexcept {
		Cancel();
	}

	SocketEvent(const SocketEvent &) = delete;
	SocketEvent &operator=(const SocketEvent &) = delete;

	SocketDescriptor GetSocket() const noexcept {
		return fd;
	}

	/**
	 * Stop watching and give up the descriptor without closing
	 * it.
	 */
	SocketDescriptor ReleaseSocket() noexcept {
		Cancel();
		return std::exchange(fd, SocketDescriptor::Undefined());
	}

	void Open(SocketDescriptor _fd) noexcept;

	/**
	 * Cancel all events and close the descriptor (if any).
	 */
	void Close() noexcept;

	void Schedule(unsigned flags) noexcept;

	void Cancel() noexcept {
		Schedule(0);
	}

	void ScheduleRead() noexcept {
		Schedule(scheduled_flags | READ);
	}

	void ScheduleWrite() noexcept {
		Schedule(scheduled_flags | WRITE);
	}

	void CancelWrite() noexcept {
		const unsigned flags = scheduled_flags & READ;
		Schedule(flags);
	}

private:
	void Dispatch() noexcept;
};

#endif
