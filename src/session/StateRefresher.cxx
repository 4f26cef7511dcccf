// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "StateRefresher.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain refresh_domain("refresh");

StateRefresher::StateRefresher(DeviceClient &_client,
			       StateRefresherHandler &_handler,
			       Event::Duration _interval) noexcept
	:client(_client), handler(_handler), interval(_interval),
	 timer(client.GetEventLoop(), BIND_THIS_METHOD(OnTimer))
{
}

void
StateRefresher::Start() noexcept
{
	if (interval <= Event::Duration::zero())
		return;

	failures = 0;
	timer.Schedule(interval);
}

void
StateRefresher::Stop() noexcept
{
	timer.Cancel();
	request.reset();
}

void
StateRefresher::OnTimer() noexcept
{
	timer.Schedule(interval);

	/* skip this tick if the previous request is still in
	   flight */
	if (!request)
		request = client.FetchState(*this);
}

void
StateRefresher::OnDeviceState(DeviceState &&state) noexcept
{
	request.reset();
	failures = 0;

	handler.OnRefreshedState(std::move(state));
}

void
StateRefresher::OnDeviceStateError(std::exception_ptr error) noexcept
{
	request.reset();

	FmtDebug(refresh_domain, "State refresh failed: {}", error);

	if (++failures >= MAX_FAILURES) {
		FmtWarning(refresh_domain,
			   "{} consecutive refresh failures, resetting HTTP connections",
			   failures);
		failures = 0;
		client.Reset();
	}
}
