// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ReadinessProber.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain prober_domain("prober");

ReadinessProber::ReadinessProber(DeviceClient &_client,
				 ReadinessProberHandler &_handler,
				 Event::Duration _interval,
				 unsigned _max_attempts) noexcept
	:client(_client), handler(_handler),
	 interval(_interval), max_attempts(_max_attempts),
	 timer(client.GetEventLoop(), BIND_THIS_METHOD(OnTimer))
{
}

bool
ReadinessProber::Start() noexcept
{
	if (running)
		return false;

	running = true;
	attempts = 0;
	Attempt();
	return true;
}

void
ReadinessProber::Stop() noexcept
{
	timer.Cancel();
	request.reset();
	attempts = 0;
	running = false;
}

void
ReadinessProber::Attempt() noexcept
{
	++attempts;
	FmtDebug(prober_domain, "Probe {}/{}", attempts, max_attempts);

	if (attempts < max_attempts)
		timer.Schedule(interval);

	request = client.FetchState(*this);
}

void
ReadinessProber::OnTimer() noexcept
{
	if (request) {
		/* the previous probe is still in flight; wait for
		   it */
		timer.Schedule(interval);
		return;
	}

	Attempt();
}

void
ReadinessProber::OnDeviceState(DeviceState &&) noexcept
{
	FmtInfo(prober_domain, "Appliance ready after {} attempts", attempts);

	Stop();
	handler.OnProbeReady();
}

void
ReadinessProber::OnDeviceStateError(std::exception_ptr error) noexcept
{
	request.reset();

	FmtDebug(prober_domain, "Probe {} failed: {}", attempts, error);

	if (attempts >= max_attempts) {
		FmtNotice(prober_domain, "Appliance not ready after {} attempts",
			  attempts);
		Stop();
		handler.OnProbeExhausted();
	}
}
