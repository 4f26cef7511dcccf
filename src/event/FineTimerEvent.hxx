// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_FINE_TIMER_EVENT_HXX
#define MILO_EVENT_FINE_TIMER_EVENT_HXX

#include "Chrono.hxx"
#include "util/BindMethod.hxx"

#include <boost/intrusive/set_hook.hpp>

class EventLoop;

/**
 * A one-shot timer.  Every stage of the connection state machine owns
 * its timers and cancels them when it leaves; destroying a pending
 * timer cancels it, too.
 *
 * Not thread-safe.
 */
class FineTimerEvent final :
	public boost::intrusive::set_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

	/**
	 * Only valid while IsPending().
	 */
	Event::TimePoint due;

public:
	FineTimerEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(_callback) {}

	FineTimerEvent(const FineTimerEvent &) = delete;
	FineTimerEvent &operator=(const FineTimerEvent &) = delete;

	EventLoop &GetEventLoop() const noexcept {
		return loop;
	}

	Event::TimePoint GetDue() const noexcept {
		return due;
	}

	bool IsPending() const noexcept {
		return is_linked();
	}

	/**
	 * (Re)start the timer; a pending expiry is replaced.
	 */
	void Schedule(Event::Duration d) noexcept;

	void Cancel() noexcept {
		unlink();
	}

private:
	void Run() noexcept {
		callback();
	}
};

#endif
