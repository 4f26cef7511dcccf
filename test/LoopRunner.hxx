// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_TEST_LOOP_RUNNER_HXX
#define MILO_TEST_LOOP_RUNNER_HXX

#include "event/Loop.hxx"
#include "event/FineTimerEvent.hxx"

#include <chrono>
#include <functional>

/**
 * Runs an #EventLoop until a condition becomes true (checked every
 * millisecond) or a timeout expires.
 */
class LoopRunner {
	EventLoop &loop;

	FineTimerEvent timer;

	std::function<bool()> predicate;

	Event::TimePoint deadline;

	bool result = false;

public:
	explicit LoopRunner(EventLoop &_loop) noexcept
		:loop(_loop), timer(loop, BIND_THIS_METHOD(OnTimer)) {}

	/**
	 * @return true if the condition was met, false on timeout
	 */
	bool RunUntil(std::function<bool()> _predicate,
		      Event::Duration timeout=std::chrono::seconds(5)) {
		predicate = std::move(_predicate);
		if (predicate())
			return true;

		result = false;
		deadline = Event::Clock::now() + timeout;
		timer.Schedule(std::chrono::milliseconds(1));
		loop.Run();
		timer.Cancel();
		return result;
	}

	/**
	 * Run the loop for the given duration.
	 */
	void RunFor(Event::Duration duration) {
		RunUntil([]{ return false; }, duration);
	}

private:
	void OnTimer() noexcept {
		result = predicate();
		if (result || Event::Clock::now() >= deadline) {
			loop.Break();
			return;
		}

		timer.Schedule(std::chrono::milliseconds(1));
	}
};

#endif
