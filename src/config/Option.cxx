// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Option.hxx"

#include <array>

static constexpr std::array<const char *, std::size_t(ConfigOption::MAX)> option_names{
	"device_host",
	"http_port",
	"stream_port",
	"probe_port",
	"service_type",
	"zeroconf_enabled",
	"discovery_resolve_timeout",
	"probe_interval",
	"probe_attempts",
	"state_refresh_interval",
	"provision_command",
	"log_level",
	"log_timestamp",
};

static_assert(option_names.back() != nullptr,
	      "option_names does not cover all ConfigOption values");

ConfigOption
ParseConfigOptionName(std::string_view name) noexcept
{
	for (std::size_t i = 0; i < option_names.size(); ++i)
		if (name == option_names[i])
			return ConfigOption(i);

	return ConfigOption::MAX;
}

const char *
GetConfigOptionName(ConfigOption option) noexcept
{
	return option_names[std::size_t(option)];
}
