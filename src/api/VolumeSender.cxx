// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "VolumeSender.hxx"
#include "event/Loop.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain volume_domain("volume");

VolumeSender::VolumeSender(DeviceClient &_client) noexcept
	:client(_client),
	 debounce_timer(client.GetEventLoop(), BIND_THIS_METHOD(OnDebounceTimer))
{
}

VolumeSender::~VolumeSender() noexcept = default;

void
VolumeSender::Set(double volume_db) noexcept
{
	pending = limits.Clamp(volume_db);

	if (IsBusy())
		/* will be sent when the current request finishes */
		return;

	const auto now = client.GetEventLoop().SteadyNow();
	if (now - last_send >= MIN_INTERVAL)
		SendNow();
	else
		debounce_timer.Schedule(DEBOUNCE);
}

void
VolumeSender::Cancel() noexcept
{
	debounce_timer.Cancel();
	request.reset();
	pending.reset();
}

void
VolumeSender::SendNow() noexcept
{
	debounce_timer.Cancel();

	if (!pending)
		return;

	sending = *pending;
	pending.reset();
	last_send = client.GetEventLoop().SteadyNow();

	FmtDebug(volume_domain, "Sending volume {} dB", sending);
	request = client.SetVolume(sending, *this);
}

void
VolumeSender::OnDebounceTimer() noexcept
{
	if (!IsBusy())
		SendNow();
}

void
VolumeSender::OnApiCommandDone() noexcept
{
	request.reset();

	if (pending)
		debounce_timer.Schedule(DEBOUNCE);
}

void
VolumeSender::OnApiCommandError(std::exception_ptr error) noexcept
{
	request.reset();

	LogWarning(volume_domain, error, "Failed to set volume");

	if (pending)
		/* a newer value is waiting */
		debounce_timer.Schedule(DEBOUNCE);
	else
		/* keep the failed value for the next attempt */
		pending = sending;
}
