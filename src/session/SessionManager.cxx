// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "SessionManager.hxx"
#include "Observer.hxx"
#include "discovery/Candidate.hxx"
#include "discovery/Hostname.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain session_domain("session");

SessionManager::SessionManager(EventLoop &loop, const SessionConfig &_config,
			       ApiTransport &transport,
			       StreamConnector &connector,
			       const ServiceBrowserFactory &browser_factory,
			       SessionObserver &_observer,
			       DeviceProvisioner *provisioner,
			       HostLookup::Function lookup_function) noexcept
	:config(_config), observer(_observer),
	 endpoint(config.hostname, config.http_port, config.stream_port),
	 client(transport, endpoint),
	 browser(browser_factory(*this)),
	 prober(client, *this, config.probe_interval, config.probe_attempts),
	 resolver(loop, config.probe_port, *this, provisioner,
		  std::move(lookup_function),
		  config.race_probe_timeout, config.race_grace_period),
	 stream(loop, connector, *this, config.stream),
	 refresher(client, *this, config.refresh_interval),
	 volume_sender(client),
	 wake_timer(loop, BIND_THIS_METHOD(OnWakeTimer))
{
}

SessionManager::~SessionManager() noexcept
{
	intent = false;
	wake_timer.Cancel();
	StopPreStream();
	stream.Stop();
	refresher.Stop();
	volume_request.reset();
	volume_sender.Cancel();
}

void
SessionManager::SetState(SessionState new_state) noexcept
{
	if (new_state == state)
		return;

	FmtDebug(session_domain, "{} -> {}", ToString(state), ToString(new_state));
	state = new_state;
}

void
SessionManager::Start() noexcept
{
	if (intent)
		return;

	FmtNotice(session_domain, "Looking for {}", config.hostname);

	intent = true;
	StartDiscovery();
}

void
SessionManager::Stop() noexcept
{
	intent = false;
	wake_timer.Cancel();

	Teardown(DisconnectReason::STOPPED);
	stream.ResetPolicy();

	/* the observer may have restarted us */
	if (!intent)
		SetState(SessionState::IDLE);
}

void
SessionManager::ForceReconnect() noexcept
{
	if (state != SessionState::CONNECTED) {
		FmtDebug(session_domain, "Force reconnect ignored while {}",
			 ToString(state));
		return;
	}

	LogNotice(session_domain, "Forcing reconnect");

	if (!LeaveConnected(DisconnectReason::FORCED))
		return;

	/* reuse the resolved address; if this attempt fails, the
	   stream failure brings us back to discovery */
	SetState(SessionState::STREAM_CONNECTING);
	stream.ForceReconnect();
}

void
SessionManager::OnSystemWake() noexcept
{
	if (!intent)
		return;

	LogNotice(session_domain, "System wake, reconnecting after settle delay");

	wake_generation = generation;
	wake_timer.Schedule(config.wake_settle);
}

void
SessionManager::SetVolume(double volume_db) noexcept
{
	if (state != SessionState::CONNECTED) {
		LogDebug(session_domain, "Not connected, ignoring volume change");
		return;
	}

	volume_sender.Set(volume_db);
}

void
SessionManager::StartDiscovery() noexcept
{
	SetState(SessionState::DISCOVERING);

	try {
		browser->Start();
	} catch (...) {
		/* no retry; a wake or a restart will try again */
		LogError(session_domain, std::current_exception(),
			 "Failed to start service discovery");
	}
}

void
SessionManager::StopPreStream() noexcept
{
	browser->Stop();
	prober.Stop();
	resolver.Cancel();
}

bool
SessionManager::Teardown(DisconnectReason reason) noexcept
{
	const bool was_connected = state == SessionState::CONNECTED;

	StopPreStream();
	stream.Stop();
	refresher.Stop();
	volume_request.reset();
	volume_sender.Cancel();
	++generation;

	if (!was_connected)
		return true;

	FmtNotice(session_domain, "Disconnected ({})", ToString(reason));

	last_disconnect_reason = reason;
	SetState(SessionState::DISCONNECTED);
	observer.OnDisconnected(reason);
	return state == SessionState::DISCONNECTED;
}

bool
SessionManager::LeaveConnected(DisconnectReason reason) noexcept
{
	refresher.Stop();
	volume_request.reset();
	volume_sender.Cancel();
	++generation;

	FmtNotice(session_domain, "Disconnected ({})", ToString(reason));

	last_disconnect_reason = reason;
	SetState(SessionState::DISCONNECTED);
	observer.OnDisconnected(reason);
	return state == SessionState::DISCONNECTED && intent;
}

void
SessionManager::OnWakeTimer() noexcept
{
	if (!intent || wake_generation != generation)
		/* somebody else has already torn down this attempt */
		return;

	if (!Teardown(DisconnectReason::SYSTEM_WAKE) || !intent)
		return;

	stream.ResetPolicy();
	client.Reset();
	StartDiscovery();
}

void
SessionManager::UpdateDeviceState(DeviceState &&new_state) noexcept
{
	device_state = std::move(new_state);
	observer.OnStateUpdate(*device_state);
}

void
SessionManager::OnServiceFound(const ServiceCandidate &candidate) noexcept
{
	if (state != SessionState::DISCOVERING)
		return;

	if (!HostnameMatches(candidate.hostname, config.hostname)) {
		FmtDebug(session_domain, "Ignoring \"{}\" on {}",
			 candidate.name, candidate.hostname);
		return;
	}

	FmtInfo(session_domain, "Found {} on {}",
		candidate.name, candidate.hostname);

	browser->Stop();
	SetState(SessionState::PROBING);
	prober.Start();
}

void
SessionManager::OnServiceRemoved(const ServiceCandidate &candidate) noexcept
{
	if (!HostnameMatches(candidate.hostname, config.hostname))
		return;

	switch (state) {
	case SessionState::IDLE:
	case SessionState::DISCOVERING:
	case SessionState::DISCONNECTED:
		break;

	case SessionState::PROBING:
	case SessionState::RESOLVING:
	case SessionState::STREAM_CONNECTING:
	case SessionState::CONNECTED:
		FmtNotice(session_domain, "{} has disappeared", candidate.name);

		if (Teardown(DisconnectReason::CANDIDATE_REMOVED) && intent)
			StartDiscovery();
		break;
	}
}

void
SessionManager::OnServiceBrowseError(std::exception_ptr error) noexcept
{
	LogError(session_domain, error, "Service discovery failed");
}

void
SessionManager::OnProbeReady() noexcept
{
	if (state != SessionState::PROBING)
		return;

	SetState(SessionState::RESOLVING);
	resolver.Start(config.hostname);
}

void
SessionManager::OnProbeExhausted() noexcept
{
	if (state != SessionState::PROBING)
		return;

	LogNotice(session_domain, "Appliance not responding, resuming discovery");
	StartDiscovery();
}

void
SessionManager::OnAddressResolved(const std::string &address,
				  bool resolved) noexcept
{
	if (state != SessionState::RESOLVING)
		return;

	if (resolved) {
		FmtInfo(session_domain, "Using address {}", address);
		endpoint.SetAddress(address);
	} else {
		FmtInfo(session_domain, "No address found, using {}", address);
		endpoint.ClearAddress();
	}

	SetState(SessionState::STREAM_CONNECTING);
	stream.Start(endpoint.GetHost(), config.stream_port);
}

void
SessionManager::OnStreamConnected() noexcept
{
	StopPreStream();
	SetState(SessionState::CONNECTED);

	FmtNotice(session_domain, "Connected to {}", endpoint.GetHost());

	refresher.Start();
	volume_request = client.FetchVolume(*this);

	observer.OnConnected();
}

void
SessionManager::OnStreamDisconnected(std::exception_ptr) noexcept
{
	switch (state) {
	case SessionState::CONNECTED:
		if (!LeaveConnected(DisconnectReason::STREAM_FAILURE))
			return;

		[[fallthrough]];

	case SessionState::STREAM_CONNECTING:
		/* the stream keeps its attempt counter and backoff
		   delay; the next Start() after rediscovery waits for
		   it */
		stream.Stop();
		StartDiscovery();
		break;

	case SessionState::IDLE:
	case SessionState::DISCOVERING:
	case SessionState::PROBING:
	case SessionState::RESOLVING:
	case SessionState::DISCONNECTED:
		break;
	}
}

void
SessionManager::OnStreamReconnecting() noexcept
{
	/* the stream is only running while STREAM_CONNECTING; this
	   is its backoff timer expiring */
	LogDebug(session_domain, "Backoff delay elapsed");
}

void
SessionManager::OnStreamGaveUp() noexcept
{
	/* start over with a fresh attempt counter once the appliance
	   has been found again */
	stream.ResetPolicy();

	if (state == SessionState::CONNECTED) {
		if (LeaveConnected(DisconnectReason::STREAM_GAVE_UP))
			StartDiscovery();
		return;
	}

	last_disconnect_reason = DisconnectReason::STREAM_GAVE_UP;

	if (state == SessionState::STREAM_CONNECTING)
		StartDiscovery();
}

void
SessionManager::OnStreamState(DeviceState &&new_state) noexcept
{
	if (state != SessionState::CONNECTED)
		return;

	UpdateDeviceState(std::move(new_state));
}

void
SessionManager::OnStreamVolume(const VolumeUpdate &update) noexcept
{
	if (state != SessionState::CONNECTED)
		return;

	volume = ApplyVolumeUpdate(volume.value_or(VolumeState{}), update);
	volume_sender.SetLimits(*volume);
	observer.OnVolumeUpdate(*volume);
}

void
SessionManager::OnRefreshedState(DeviceState &&new_state) noexcept
{
	if (state != SessionState::CONNECTED)
		return;

	UpdateDeviceState(std::move(new_state));
}

void
SessionManager::OnVolumeStatus(const VolumeState &status) noexcept
{
	volume_request.reset();

	volume = status;
	volume_sender.SetLimits(status);
	observer.OnVolumeUpdate(status);
}

void
SessionManager::OnVolumeStatusError(std::exception_ptr error) noexcept
{
	volume_request.reset();

	LogWarning(session_domain, error,
		   "Failed to fetch the volume status");
}
