// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SYSTEM_SLEEP_MONITOR_HXX
#define MILO_SYSTEM_SLEEP_MONITOR_HXX

#include "event/Chrono.hxx"
#include "event/FineTimerEvent.hxx"
#include "util/BindMethod.hxx"

#include <chrono>

/**
 * Detects system suspend by comparing CLOCK_BOOTTIME (which keeps
 * running while the system sleeps) with CLOCK_MONOTONIC (which
 * does not).  The callback is invoked after each wake-up.
 */
class SleepMonitor final {
	FineTimerEvent timer;

	using Callback = BoundMethod<void() noexcept>;
	const Callback callback;

	const Event::Duration interval;

	/**
	 * The difference CLOCK_BOOTTIME - CLOCK_MONOTONIC at the last
	 * check.
	 */
	std::chrono::nanoseconds last_offset;

public:
	static constexpr Event::Duration DEFAULT_INTERVAL = std::chrono::seconds(5);

	/**
	 * Suspend periods shorter than this are not reported.
	 */
	static constexpr std::chrono::nanoseconds THRESHOLD = std::chrono::seconds(2);

	SleepMonitor(EventLoop &loop, Callback _callback,
		     Event::Duration _interval=DEFAULT_INTERVAL) noexcept;

	void Start() noexcept;

	void Stop() noexcept {
		timer.Cancel();
	}

	/**
	 * @return the time the system has spent suspended since boot
	 */
	static std::chrono::nanoseconds GetSuspendedTime() noexcept;

private:
	void OnTimer() noexcept;
};

#endif
