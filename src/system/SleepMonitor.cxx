// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SleepMonitor.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <time.h>

static constexpr Domain sleep_domain("sleep");

static std::chrono::nanoseconds
ReadClock(clockid_t id) noexcept
{
	struct timespec ts;
	if (clock_gettime(id, &ts) < 0)
		return {};

	return std::chrono::seconds(ts.tv_sec) +
		std::chrono::nanoseconds(ts.tv_nsec);
}

std::chrono::nanoseconds
SleepMonitor::GetSuspendedTime() noexcept
{
#ifdef CLOCK_BOOTTIME
	return ReadClock(CLOCK_BOOTTIME) - ReadClock(CLOCK_MONOTONIC);
#else
	return {};
#endif
}

SleepMonitor::SleepMonitor(EventLoop &loop, Callback _callback,
			   Event::Duration _interval) noexcept
	:timer(loop, BIND_THIS_METHOD(OnTimer)),
	 callback(_callback), interval(_interval),
	 last_offset(GetSuspendedTime())
{
}

void
SleepMonitor::Start() noexcept
{
	last_offset = GetSuspendedTime();
	timer.Schedule(interval);
}

void
SleepMonitor::OnTimer() noexcept
{
	timer.Schedule(interval);

	const auto offset = GetSuspendedTime();
	const auto suspended = offset - last_offset;
	last_offset = offset;

	if (suspended >= THRESHOLD) {
		FmtNotice(sleep_domain, "System was suspended for {} s",
			  std::chrono::duration_cast<std::chrono::seconds>(suspended).count());
		callback();
	}
}
