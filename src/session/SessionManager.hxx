// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SESSION_MANAGER_HXX
#define MILO_SESSION_MANAGER_HXX

#include "Config.hxx"
#include "State.hxx"
#include "ReadinessProber.hxx"
#include "StateRefresher.hxx"
#include "api/Client.hxx"
#include "api/Endpoint.hxx"
#include "api/VolumeSender.hxx"
#include "discovery/Browser.hxx"
#include "resolver/AddressResolver.hxx"
#include "stream/ControlStream.hxx"
#include "event/FineTimerEvent.hxx"

#include <functional>
#include <memory>
#include <optional>

class EventLoop;
class ApiTransport;
class StreamConnector;
class SessionObserver;
class DeviceProvisioner;

/**
 * Creates the #ServiceBrowser which reports to the given handler.
 */
using ServiceBrowserFactory =
	std::function<std::unique_ptr<ServiceBrowser>(ServiceBrowserHandler &)>;

/**
 * Owns all stages of the connection to the appliance (discovery,
 * readiness probing, address resolution, control stream) and drives
 * them as one state machine.  Failures are never fatal: every one of
 * them leads back to discovery as long as the connection is wanted.
 *
 * All methods must be called in the #EventLoop thread.
 */
class SessionManager final
	: ServiceBrowserHandler, ReadinessProberHandler,
	  AddressResolverHandler, ControlStreamHandler,
	  StateRefresherHandler, VolumeStatusHandler
{
	const SessionConfig config;

	SessionObserver &observer;

	DeviceEndpoint endpoint;

	DeviceClient client;

	std::unique_ptr<ServiceBrowser> browser;

	ReadinessProber prober;

	AddressResolver resolver;

	ControlStream stream;

	StateRefresher refresher;

	VolumeSender volume_sender;

	/**
	 * The "fetch volume status" request which is sent after the
	 * stream has been opened.
	 */
	std::unique_ptr<ApiRequest> volume_request;

	FineTimerEvent wake_timer;

	std::optional<DeviceState> device_state;

	std::optional<VolumeState> volume;

	SessionState state = SessionState::IDLE;

	std::optional<DisconnectReason> last_disconnect_reason;

	/**
	 * Incremented on each teardown.
	 */
	unsigned generation = 0;

	/**
	 * The value of #generation when the wake timer was
	 * scheduled.
	 */
	unsigned wake_generation = 0;

	/**
	 * Shall we be connected?  Set by Start(), cleared by Stop().
	 */
	bool intent = false;

public:
	SessionManager(EventLoop &loop, const SessionConfig &_config,
		       ApiTransport &transport, StreamConnector &connector,
		       const ServiceBrowserFactory &browser_factory,
		       SessionObserver &_observer,
		       DeviceProvisioner *provisioner=nullptr,
		       HostLookup::Function lookup_function=HostLookup::SystemLookup) noexcept;

	~SessionManager() noexcept;

	SessionManager(const SessionManager &) = delete;
	SessionManager &operator=(const SessionManager &) = delete;

	SessionState GetState() const noexcept {
		return state;
	}

	std::optional<DisconnectReason> GetLastDisconnectReason() const noexcept {
		return last_disconnect_reason;
	}

	bool WantsConnection() const noexcept {
		return intent;
	}

	unsigned GetGeneration() const noexcept {
		return generation;
	}

	const DeviceEndpoint &GetEndpoint() const noexcept {
		return endpoint;
	}

	const ControlStream &GetStream() const noexcept {
		return stream;
	}

	/**
	 * The HTTP API of the appliance.  Requests sent before the
	 * address has been resolved go to the host name.
	 */
	DeviceClient &GetClient() noexcept {
		return client;
	}

	/**
	 * The last state snapshot received while connected.
	 */
	const std::optional<DeviceState> &GetDeviceState() const noexcept {
		return device_state;
	}

	const std::optional<VolumeState> &GetVolume() const noexcept {
		return volume;
	}

	/**
	 * Begin connecting (and keep reconnecting).  No-op if
	 * already started.
	 */
	void Start() noexcept;

	/**
	 * Tear everything down and go idle.  Idempotent.
	 */
	void Stop() noexcept;

	/**
	 * Drop the connection and reconnect.  Ignored unless
	 * connected.
	 */
	void ForceReconnect() noexcept;

	/**
	 * The system has resumed from suspend.  After a short settle
	 * delay, all connections are torn down and discovery starts
	 * from scratch.
	 */
	void OnSystemWake() noexcept;

	/**
	 * Change the volume (coalesced, clamped to the appliance's
	 * limits).  Ignored unless connected.
	 */
	void SetVolume(double volume_db) noexcept;

private:
	void SetState(SessionState new_state) noexcept;

	void StartDiscovery() noexcept;

	/**
	 * Stop discovery, probing and resolution.
	 */
	void StopPreStream() noexcept;

	/**
	 * Stop everything.  If connected, the observer is notified
	 * (last, so it may call Stop()).
	 *
	 * @return false if the observer has cleared the intent
	 */
	bool Teardown(DisconnectReason reason) noexcept;

	/**
	 * Leave the "connected" state after the stream has failed or
	 * is going to be reconnected, but keep the stream object
	 * (and its reconnect policy).
	 *
	 * @return false if the observer has cleared the intent
	 */
	bool LeaveConnected(DisconnectReason reason) noexcept;

	void OnWakeTimer() noexcept;

	void UpdateDeviceState(DeviceState &&new_state) noexcept;

	/* virtual methods from ServiceBrowserHandler */
	void OnServiceFound(const ServiceCandidate &candidate) noexcept override;
	void OnServiceRemoved(const ServiceCandidate &candidate) noexcept override;
	void OnServiceBrowseError(std::exception_ptr error) noexcept override;

	/* virtual methods from ReadinessProberHandler */
	void OnProbeReady() noexcept override;
	void OnProbeExhausted() noexcept override;

	/* virtual methods from AddressResolverHandler */
	void OnAddressResolved(const std::string &address,
			       bool resolved) noexcept override;

	/* virtual methods from ControlStreamHandler */
	void OnStreamConnected() noexcept override;
	void OnStreamDisconnected(std::exception_ptr error) noexcept override;
	void OnStreamReconnecting() noexcept override;
	void OnStreamGaveUp() noexcept override;
	void OnStreamState(DeviceState &&state) noexcept override;
	void OnStreamVolume(const VolumeUpdate &update) noexcept override;

	/* virtual methods from StateRefresherHandler */
	void OnRefreshedState(DeviceState &&state) noexcept override;

	/* virtual methods from VolumeStatusHandler */
	void OnVolumeStatus(const VolumeState &status) noexcept override;
	void OnVolumeStatusError(std::exception_ptr error) noexcept override;
};

#endif
