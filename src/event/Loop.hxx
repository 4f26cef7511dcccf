// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_LOOP_HXX
#define MILO_EVENT_LOOP_HXX

#include "Chrono.hxx"
#include "WakeFD.hxx"
#include "SocketEvent.hxx"
#include "DeferEvent.hxx"
#include "InjectEvent.hxx"
#include "FineTimerEvent.hxx"

#include <boost/intrusive/list.hpp>
#include <boost/intrusive/set.hpp>

#include <mutex>
#include <vector>

#include <poll.h>

/**
 * The reactor which drives the whole daemon: timers, deferred calls
 * and socket readiness, multiplexed with poll().
 *
 * All methods must be called from the thread which runs the loop;
 * the only exception is InjectEvent::Schedule().
 *
 * The daemon watches only a handful of sockets (DNS-SD, a few curl
 * connections, the control stream, a latency race), so the pollfd
 * array is simply rebuilt before each poll() call.
 */
class EventLoop final
{
	friend class FineTimerEvent;
	friend class DeferEvent;
	friend class InjectEvent;
	friend class SocketEvent;

	struct CompareDue {
		bool operator()(const FineTimerEvent &a,
				const FineTimerEvent &b) const noexcept {
			return a.GetDue() < b.GetDue();
		}
	};

	using TimerSet =
		boost::intrusive::multiset<FineTimerEvent,
					   boost::intrusive::compare<CompareDue>,
					   boost::intrusive::constant_time_size<false>>;

	template<typename T>
	using EventList =
		boost::intrusive::list<T,
				       boost::intrusive::constant_time_size<false>>;

	TimerSet timers;

	EventList<DeferEvent> defer;

	/**
	 * Sockets with a non-zero event mask, waiting for poll().
	 */
	EventList<SocketEvent> sockets;

	/**
	 * Sockets reported by the last poll() call whose callback
	 * has not been invoked yet.
	 */
	EventList<SocketEvent> ready_sockets;

	std::vector<struct pollfd> poll_fds;
	std::vector<SocketEvent *> poll_sockets;

	WakeFD wake_fd;
	SocketEvent wake_event;

	/**
	 * Protects #inject and #sleeping.
	 */
	std::mutex inject_mutex;

	EventList<InjectEvent> inject;

	/**
	 * Is the loop blocked in poll()?  Only then does
	 * InjectEvent::Schedule() need to write to #wake_fd.
	 */
	bool sleeping = false;

	Event::TimePoint now;

	bool quit = false;

	/**
	 * Set when a timer or a deferred call was added by a
	 * callback; the loop then makes another pass before going
	 * to sleep.
	 */
	bool again;

public:
	/**
	 * Throws on error.
	 */
	EventLoop();
	~EventLoop() noexcept;

	EventLoop(const EventLoop &other) = delete;
	EventLoop &operator=(const EventLoop &other) = delete;

	/**
	 * The time at the start of this loop iteration.  Timers are
	 * scheduled relative to it.
	 */
	const Event::TimePoint &SteadyNow() const noexcept {
		return now;
	}

	void FlushClockCaches() noexcept {
		now = Event::Clock::now();
	}

	/**
	 * Make Run() return at the next chance.  Not thread-safe.
	 */
	void Break() noexcept {
		quit = true;
	}

	/**
	 * Dispatch events until Break() is called.  May be called
	 * again after it has returned.
	 */
	void Run() noexcept;

private:
	void AddTimer(FineTimerEvent &t) noexcept;
	void AddDefer(DeferEvent &d) noexcept;
	void AddSocket(SocketEvent &s) noexcept;

	/**
	 * Thread-safe.
	 */
	void AddInject(InjectEvent &i) noexcept;

	/**
	 * Thread-safe.
	 */
	void RemoveInject(InjectEvent &i) noexcept;

	/**
	 * Invoke all expired timers.
	 *
	 * @return the time until the next timer is due, or a
	 * negative value if there is none
	 */
	Event::Duration RunTimers() noexcept;

	void RunDeferred() noexcept;

	/**
	 * Invoke all pending #InjectEvent instances.  The lock is
	 * released while a callback runs.
	 */
	void RunInjected(std::unique_lock<std::mutex> &lock) noexcept;

	/**
	 * Call poll() and move all sockets with events to
	 * #ready_sockets.
	 */
	void Poll(Event::Duration timeout) noexcept;

	void DispatchSockets() noexcept;

	void OnWake(unsigned events) noexcept;
};

#endif
