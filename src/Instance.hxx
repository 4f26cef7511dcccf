// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_INSTANCE_HXX
#define MILO_INSTANCE_HXX

#include "event/Loop.hxx"
#include "session/Observer.hxx"

#include <memory>

struct ConfigData;
class CurlTransport;
class WebSocketConnector;
class DeviceProvisioner;
class SessionManager;
class SleepMonitor;

/**
 * The daemon's global state.
 */
struct Instance final : SessionObserver {
	EventLoop event_loop;

	std::unique_ptr<CurlTransport> transport;

	std::unique_ptr<WebSocketConnector> connector;

	std::unique_ptr<DeviceProvisioner> provisioner;

	std::unique_ptr<SessionManager> session;

	std::unique_ptr<SleepMonitor> sleep_monitor;

	Instance() noexcept;
	~Instance() noexcept;

	Instance(const Instance &) = delete;
	Instance &operator=(const Instance &) = delete;

	/**
	 * Create all objects according to the configuration.
	 *
	 * Throws on error.
	 *
	 * @param host overrides "device_host" (may be nullptr)
	 */
	void Configure(const ConfigData &config, const char *host);

	void Run() noexcept;

private:
	void OnSignalQuit() noexcept;
	void OnSignalForceReconnect() noexcept;
	void OnSignalWake() noexcept;
	void OnSignalChild() noexcept;

	void OnSystemWake() noexcept;

	/* virtual methods from SessionObserver */
	void OnConnected() noexcept override;
	void OnDisconnected(DisconnectReason reason) noexcept override;
	void OnStateUpdate(const DeviceState &state) noexcept override;
	void OnVolumeUpdate(const VolumeState &volume) noexcept override;
};

#endif
