// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_CONFIG_OPTION_HXX
#define MILO_CONFIG_OPTION_HXX

#include <cstdint>
#include <string_view>

enum class ConfigOption : uint8_t {
	DEVICE_HOST,
	HTTP_PORT,
	STREAM_PORT,
	PROBE_PORT,
	SERVICE_TYPE,
	ZEROCONF_ENABLED,
	DISCOVERY_RESOLVE_TIMEOUT,
	PROBE_INTERVAL,
	PROBE_ATTEMPTS,
	STATE_REFRESH_INTERVAL,
	PROVISION_COMMAND,
	LOG_LEVEL,
	LOG_TIMESTAMP,
	MAX
};

/**
 * @return #ConfigOption::MAX if not found
 */
[[gnu::pure]]
ConfigOption
ParseConfigOptionName(std::string_view name) noexcept;

/**
 * The name of the option as it appears in the configuration file.
 */
[[gnu::const]]
const char *
GetConfigOptionName(ConfigOption option) noexcept;

#endif
