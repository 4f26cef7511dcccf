// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "StaticBrowser.hxx"
#include "Candidate.hxx"

StaticBrowser::StaticBrowser(EventLoop &loop, std::string_view _hostname,
			     ServiceBrowserHandler &_handler) noexcept
	:ServiceBrowser(_handler),
	 hostname(_hostname),
	 defer_found(loop, BIND_THIS_METHOD(OnDeferredFound))
{
}

void
StaticBrowser::Start()
{
	if (running)
		return;

	running = true;
	defer_found.Schedule();
}

void
StaticBrowser::Stop() noexcept
{
	running = false;
	defer_found.Cancel();
}

void
StaticBrowser::OnDeferredFound() noexcept
{
	handler.OnServiceFound({hostname, hostname});
}
