// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "ControlStream.hxx"
#include "device/Event.hxx"
#include "event/Loop.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <stdexcept>

static constexpr Domain stream_domain("stream");

ControlStream::ControlStream(EventLoop &loop, StreamConnector &_connector,
			     ControlStreamHandler &_handler,
			     const ControlStreamConfig &_config) noexcept
	:connector(_connector), handler(_handler),
	 config(_config),
	 policy(config.reconnect),
	 reconnect_timer(loop, BIND_THIS_METHOD(OnReconnectTimer)),
	 ping_timer(loop, BIND_THIS_METHOD(OnPingTimer)),
	 stable_timer(loop, BIND_THIS_METHOD(OnStableTimer))
{
}

ControlStream::~ControlStream() noexcept = default;

void
ControlStream::Start(std::string_view _host, unsigned _port) noexcept
{
	Stop();

	host = _host;
	port = _port;
	running = true;

	if (policy.HasGivenUp())
		ResetPolicy();

	Connect();
}

void
ControlStream::Stop() noexcept
{
	running = false;
	connected = false;
	reconnect_timer.Cancel();
	ping_timer.Cancel();
	stable_timer.Cancel();
	ResetChannel();
}

void
ControlStream::ForceReconnect() noexcept
{
	if (!running)
		return;

	if (IsConnecting()) {
		LogDebug(stream_domain,
			 "Force reconnect ignored, already connecting");
		return;
	}

	LogInfo(stream_domain, "Forcing reconnect");

	connected = false;
	ping_timer.Cancel();
	stable_timer.Cancel();
	reconnect_timer.Cancel();
	ResetChannel();

	policy.OnForceReconnect();
	next_attempt.reset();
	Connect();
}

void
ControlStream::Connect() noexcept
{
	if (channel)
		/* an attempt is already in progress */
		return;

	const auto now = GetEventLoop().SteadyNow();

	auto wait = policy.GetThrottleDelay(last_attempt, now);
	if (next_attempt && *next_attempt - now > wait)
		wait = *next_attempt - now;

	if (wait > Event::Duration::zero()) {
		FmtDebug(stream_domain, "Too soon for the next attempt, waiting {} ms",
			 std::chrono::duration_cast<std::chrono::milliseconds>(wait).count());
		reconnect_timer.Schedule(wait);
		return;
	}

	reconnect_timer.Cancel();
	last_attempt = now;
	next_attempt.reset();

	FmtInfo(stream_domain, "Connecting to ws://{}:{}/ws (attempt {})",
		host, port, policy.GetAttempts() + 1);

	try {
		channel = connector.Connect(host, port, *this);
		++channel_serial;
	} catch (...) {
		OnFailure(std::current_exception());
	}
}

void
ControlStream::OnFailure(std::exception_ptr error) noexcept
{
	const auto now = GetEventLoop().SteadyNow();
	const auto uptime = last_attempt
		? now - *last_attempt
		: Event::Duration::zero();

	FmtWarning(stream_domain, "Control stream failed after {} ms: {}",
		   std::chrono::duration_cast<std::chrono::milliseconds>(uptime).count(),
		   error);

	connected = false;
	ping_timer.Cancel();
	stable_timer.Cancel();
	ResetChannel();

	const auto delay = policy.OnFailure(uptime);
	if (!delay) {
		LogError(stream_domain,
			 "Too many control stream failures, giving up");
		running = false;
		next_attempt.reset();
		handler.OnStreamGaveUp();
		return;
	}

	FmtInfo(stream_domain, "Reconnecting in {} s (attempt {}/{})",
		std::chrono::duration_cast<std::chrono::seconds>(*delay).count(),
		policy.GetAttempts(), policy.GetConfig().max_attempts);
	last_delay = *delay;
	next_attempt = now + *delay;
	reconnect_timer.Schedule(*delay);

	handler.OnStreamDisconnected(std::move(error));
}

void
ControlStream::OnReconnectTimer() noexcept
{
	if (!running || channel)
		return;

	handler.OnStreamReconnecting();

	if (running)
		Connect();
}

void
ControlStream::OnPingTimer() noexcept
{
	if (!connected)
		return;

	if (!received_since_ping) {
		OnFailure(std::make_exception_ptr(std::runtime_error("No reply to ping")));
		return;
	}

	try {
		channel->SendPing();
	} catch (...) {
		OnFailure(std::current_exception());
		return;
	}

	received_since_ping = false;
	ping_timer.Schedule(config.ping_interval);
}

bool
ControlStream::OnChannelOpen() noexcept
{
	LogNotice(stream_domain, "Control stream connected");

	connected = true;
	received_since_ping = true;
	ping_timer.Schedule(config.ping_interval);
	stable_timer.Schedule(config.reconnect.short_connection);

	const auto serial = channel_serial;
	handler.OnStreamConnected();
	return serial == channel_serial;
}

bool
ControlStream::OnChannelMessage(std::string_view text) noexcept
{
	if (!connected)
		return true;

	received_since_ping = true;

	const auto serial = channel_serial;

	auto event = ParseDeviceEvent(text);
	if (auto *state = std::get_if<DeviceState>(&event))
		handler.OnStreamState(std::move(*state));
	else if (const auto *volume = std::get_if<VolumeUpdate>(&event))
		handler.OnStreamVolume(*volume);

	return serial == channel_serial;
}

void
ControlStream::OnStableTimer() noexcept
{
	if (policy.GetAttempts() > 0)
		LogDebug(stream_domain, "Connection is stable, resetting the attempt counter");

	policy.Reset();
	last_delay = Event::Duration::zero();
}

bool
ControlStream::OnChannelActivity() noexcept
{
	received_since_ping = true;
	return true;
}

void
ControlStream::OnChannelClosed(std::exception_ptr error) noexcept
{
	OnFailure(std::move(error));
}
