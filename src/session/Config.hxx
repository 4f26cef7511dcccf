// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SESSION_CONFIG_HXX
#define MILO_SESSION_CONFIG_HXX

#include "ReadinessProber.hxx"
#include "StateRefresher.hxx"
#include "resolver/LatencyRace.hxx"
#include "stream/ControlStream.hxx"
#include "event/Chrono.hxx"

#include <string>

struct ConfigData;

struct SessionConfig {
	/**
	 * The host name of the appliance.  Only service instances
	 * advertising this host name are accepted.
	 */
	std::string hostname = "milo.local";

	unsigned http_port = 80;
	unsigned stream_port = 8000;

	/**
	 * The TCP port used for the address latency race.
	 */
	unsigned probe_port = 80;

	Event::Duration probe_interval = ReadinessProber::DEFAULT_INTERVAL;
	unsigned probe_attempts = ReadinessProber::DEFAULT_MAX_ATTEMPTS;

	Event::Duration race_probe_timeout = LatencyRace::DEFAULT_PROBE_TIMEOUT;
	Event::Duration race_grace_period = LatencyRace::DEFAULT_GRACE_PERIOD;

	Event::Duration refresh_interval = StateRefresher::DEFAULT_INTERVAL;

	/**
	 * How long to wait after a system wake before tearing down
	 * and reconnecting, to let the network come back.
	 */
	Event::Duration wake_settle = std::chrono::seconds(1);

	ControlStreamConfig stream;

	SessionConfig() = default;

	/**
	 * Throws on error.
	 */
	explicit SessionConfig(const ConfigData &config);
};

#endif
