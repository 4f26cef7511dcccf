// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_DEFER_EVENT_HXX
#define MILO_EVENT_DEFER_EVENT_HXX

#include "util/BindMethod.hxx"

#include <boost/intrusive/list_hook.hpp>

class EventLoop;

/**
 * Calls back in the next #EventLoop iteration.  Used to report
 * results which are known synchronously (e.g. an empty address list,
 * a static discovery result) without re-entering the caller.
 *
 * Not thread-safe.
 */
class DeferEvent final
	: public boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>
{
	friend class EventLoop;

	EventLoop &loop;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

public:
	DeferEvent(EventLoop &_loop, Callback _callback) noexcept
		:loop(_loop), callback(_callback) {}

	DeferEvent(const DeferEvent &) = delete;
	DeferEvent &operator=(const DeferEvent &) = delete;

	bool IsPending() const noexcept {
		return is_linked();
	}

	/**
	 * No-op if already pending.
	 */
	void Schedule() noexcept;

	void Cancel() noexcept {
		unlink();
	}

private:
	void Run() noexcept {
		callback();
	}
};

#endif
