// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Loop.hxx"

#include <cassert>

EventLoop::EventLoop()
	:wake_event(*this, BIND_THIS_METHOD(OnWake), wake_fd.GetSocket()),
	 now(Event::Clock::now())
{
}

EventLoop::~EventLoop() noexcept
{
	assert(defer.empty());
	assert(inject.empty());
	assert(ready_sockets.empty());

	timers.clear();
}

void
EventLoop::AddTimer(FineTimerEvent &t) noexcept
{
	timers.insert(t);
	again = true;
}

void
EventLoop::AddDefer(DeferEvent &d) noexcept
{
	defer.push_back(d);
	again = true;
}

void
EventLoop::AddSocket(SocketEvent &s) noexcept
{
	sockets.push_back(s);
}

void
EventLoop::AddInject(InjectEvent &i) noexcept
{
	bool must_wake;

	{
		const std::scoped_lock lock{inject_mutex};
		if (i.is_linked())
			return;

		/* if the list is not empty, somebody else has
		   already woken up the loop */
		must_wake = sleeping && inject.empty();
		inject.push_back(i);
	}

	if (must_wake)
		wake_fd.Write();
}

void
EventLoop::RemoveInject(InjectEvent &i) noexcept
{
	const std::scoped_lock lock{inject_mutex};

	if (i.is_linked())
		inject.erase(inject.iterator_to(i));
}

Event::Duration
EventLoop::RunTimers() noexcept
{
	while (!timers.empty()) {
		auto &t = *timers.begin();
		const auto remaining = t.GetDue() - now;
		if (remaining > remaining.zero())
			return remaining;

		timers.erase(timers.begin());
		t.Run();
	}

	return Event::Duration(-1);
}

void
EventLoop::RunDeferred() noexcept
{
	while (!defer.empty() && !quit) {
		auto &d = defer.front();
		defer.pop_front();
		d.Run();
	}
}

void
EventLoop::RunInjected(std::unique_lock<std::mutex> &lock) noexcept
{
	while (!inject.empty() && !quit) {
		auto &i = inject.front();
		inject.pop_front();

		lock.unlock();
		i.Run();
		lock.lock();
	}
}

/**
 * Convert a timeout to the poll() argument; negative means "no
 * timeout".
 */
static constexpr int
ToPollTimeout(Event::Duration timeout) noexcept
{
	return timeout < timeout.zero()
		? -1
		: static_cast<int>(std::chrono::ceil<std::chrono::milliseconds>(timeout).count());
}

void
EventLoop::Poll(Event::Duration timeout) noexcept
{
	poll_fds.clear();
	poll_sockets.clear();

	for (auto &s : sockets) {
		struct pollfd pfd{};
		pfd.fd = s.GetSocket().Get();
		pfd.events = static_cast<short>(s.scheduled_flags);
		poll_fds.push_back(pfd);
		poll_sockets.push_back(&s);
	}

	int n = poll(poll_fds.data(), poll_fds.size(),
		     ToPollTimeout(timeout));

	for (std::size_t i = 0; n > 0 && i < poll_fds.size(); ++i) {
		if (poll_fds[i].revents == 0)
			continue;

		--n;

		auto &s = *poll_sockets[i];
		s.ready_flags = static_cast<unsigned short>(poll_fds[i].revents);
		s.unlink();
		ready_sockets.push_back(s);
	}
}

void
EventLoop::DispatchSockets() noexcept
{
	while (!ready_sockets.empty() && !quit) {
		auto &s = ready_sockets.front();

		/* back to the regular list before the callback, which
		   may cancel or destroy it */
		s.unlink();
		sockets.push_back(s);

		s.Dispatch();
	}
}

void
EventLoop::Run() noexcept
{
	quit = false;

	wake_event.ScheduleRead();

	FlushClockCaches();

	while (!quit) {
		again = false;

		const auto timeout = RunTimers();
		if (quit)
			break;

		RunDeferred();
		if (quit)
			break;

		{
			std::unique_lock lock{inject_mutex};
			RunInjected(lock);

			if (quit)
				break;

			if (again)
				/* a callback has added a timer or a
				   deferred call; the timeout is stale */
				continue;

			sleeping = true;
		}

		Poll(timeout);

		FlushClockCaches();

		{
			const std::scoped_lock lock{inject_mutex};
			sleeping = false;
		}

		DispatchSockets();
	}

	/* sockets which were ready but not dispatched stay
	   scheduled for the next Run() */
	while (!ready_sockets.empty()) {
		auto &s = ready_sockets.front();
		s.unlink();
		s.ready_flags = 0;
		sockets.push_back(s);
	}

	wake_event.Cancel();
}

void
EventLoop::OnWake(unsigned) noexcept
{
	wake_fd.Read();

	std::unique_lock lock{inject_mutex};
	RunInjected(lock);
}

void
FineTimerEvent::Schedule(Event::Duration d) noexcept
{
	Cancel();

	due = loop.SteadyNow() + d;
	loop.AddTimer(*this);
}

void
DeferEvent::Schedule() noexcept
{
	if (!IsPending())
		loop.AddDefer(*this);
}

void
InjectEvent::Schedule() noexcept
{
	loop.AddInject(*this);
}

void
InjectEvent::Cancel() noexcept
{
	loop.RemoveInject(*this);
}
