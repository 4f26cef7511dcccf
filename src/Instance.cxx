// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Instance.hxx"
#include "api/CurlTransport.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "discovery/Browser.hxx"
#include "discovery/Glue.hxx"
#include "event/SignalMonitor.hxx"
#include "provision/CommandProvisioner.hxx"
#include "session/SessionManager.hxx"
#include "stream/WebSocketChannel.hxx"
#include "system/SleepMonitor.hxx"
#include "device/State.hxx"
#include "device/Volume.hxx"
#include "discovery/Hostname.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <signal.h>
#include <sys/wait.h>

static constexpr Domain instance_domain("milo");

Instance::Instance() noexcept = default;

Instance::~Instance() noexcept
{
	if (session)
		session->Stop();
}

void
Instance::Configure(const ConfigData &config, const char *host)
{
	SessionConfig session_config(config);
	DiscoveryConfig discovery_config(config);

	if (host != nullptr) {
		session_config.hostname = NormalizeHostname(host);
		discovery_config.hostname = session_config.hostname;
	}

	transport = std::make_unique<CurlTransport>(event_loop);
	connector = std::make_unique<WebSocketConnector>(event_loop);

	if (const char *command = config.GetString(ConfigOption::PROVISION_COMMAND))
		provisioner = std::make_unique<CommandProvisioner>(command);

	session = std::make_unique<SessionManager>(event_loop, session_config,
						   *transport, *connector,
						   [this, &discovery_config](ServiceBrowserHandler &handler){
							   return CreateServiceBrowser(event_loop,
										       discovery_config,
										       handler);
						   },
						   *this, provisioner.get());

	sleep_monitor = std::make_unique<SleepMonitor>(event_loop,
						       BIND_THIS_METHOD(OnSystemWake));
}

void
Instance::Run() noexcept
{
	SignalMonitorRegister(SIGINT, BIND_THIS_METHOD(OnSignalQuit));
	SignalMonitorRegister(SIGTERM, BIND_THIS_METHOD(OnSignalQuit));
	SignalMonitorRegister(SIGUSR1, BIND_THIS_METHOD(OnSignalForceReconnect));
	SignalMonitorRegister(SIGUSR2, BIND_THIS_METHOD(OnSignalWake));
	SignalMonitorRegister(SIGCHLD, BIND_THIS_METHOD(OnSignalChild));

	sleep_monitor->Start();
	session->Start();

	event_loop.Run();

	sleep_monitor->Stop();
	session->Stop();
}

void
Instance::OnSignalQuit() noexcept
{
	LogNotice(instance_domain, "Shutting down");
	event_loop.Break();
}

void
Instance::OnSignalForceReconnect() noexcept
{
	session->ForceReconnect();
}

void
Instance::OnSignalWake() noexcept
{
	OnSystemWake();
}

void
Instance::OnSignalChild() noexcept
{
	/* reap the provisioning commands */
	while (waitpid(-1, nullptr, WNOHANG) > 0) {}
}

void
Instance::OnSystemWake() noexcept
{
	session->OnSystemWake();
}

void
Instance::OnConnected() noexcept
{
	LogNotice(instance_domain, "Connected");
}

void
Instance::OnDisconnected(DisconnectReason reason) noexcept
{
	FmtNotice(instance_domain, "Disconnected: {}", ToString(reason));
}

void
Instance::OnStateUpdate(const DeviceState &state) noexcept
{
	if (state.target_source)
		FmtInfo(instance_domain, "Source {} -> {} ({})",
			state.active_source, *state.target_source,
			state.plugin_state);
	else
		FmtInfo(instance_domain, "Source {} ({})",
			state.active_source, state.plugin_state);
}

void
Instance::OnVolumeUpdate(const VolumeState &volume) noexcept
{
	FmtInfo(instance_domain, "Volume {} dB [{}..{}]",
		volume.volume_db, volume.limit_min_db, volume.limit_max_db);
}
