// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_INJECT_EVENT_HXX
#define MILO_EVENT_INJECT_EVENT_HXX

#include "util/BindMethod.hxx"

#include <boost/intrusive/list_hook.hpp>

class EventLoop;

/**
 * Hands a result from a worker thread (e.g. a blocking getaddrinfo()
 * call) to the #EventLoop thread.
 *
 * Schedule() and Cancel() may be called from any thread.
 */
class InjectEvent final
	: public boost::intrusive::list_base_hook<>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	InjectEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(_callback) {}

	~InjectEvent() noexcept {
		Cancel();
	}

	InjectEvent(const InjectEvent &) = delete;
	InjectEvent &operator=(const InjectEvent &) = delete;

	/**
	 * Schedule a call to the callback in the #EventLoop thread.
	 * Multiple Schedule() calls before the callback runs are
	 * collapsed into one.
	 */
	void Schedule() noexcept;

	/**
	 * Cancel a pending call.  The callback may still be running
	 * in the #EventLoop thread after this returns.
	 */
	void Cancel() noexcept;

private:
	void Run() noexcept {
		callback();
	}
};

#endif
