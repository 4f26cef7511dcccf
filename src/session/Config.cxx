// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Config.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "discovery/Hostname.hxx"
#include "api/Endpoint.hxx"
#include "lib/fmt/RuntimeError.hxx"

using std::chrono_literals::operator""ms;

SessionConfig::SessionConfig(const ConfigData &config)
{
	hostname = NormalizeHostname(config.GetString(ConfigOption::DEVICE_HOST,
						      hostname.c_str()));
	if (!IsValidHost(hostname))
		throw FmtRuntimeError("Invalid device_host: \"{}\"", hostname);

	http_port = config.GetPort(ConfigOption::HTTP_PORT, http_port);
	stream_port = config.GetPort(ConfigOption::STREAM_PORT, stream_port);
	probe_port = config.GetPort(ConfigOption::PROBE_PORT, http_port);

	probe_interval = config.GetDuration(ConfigOption::PROBE_INTERVAL,
					    100ms, probe_interval);
	probe_attempts = config.GetPositive(ConfigOption::PROBE_ATTEMPTS,
					    probe_attempts);

	refresh_interval = config.GetDuration(ConfigOption::STATE_REFRESH_INTERVAL,
					      Event::Duration::zero(),
					      refresh_interval);
}
