// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DISCOVERY_HOSTNAME_HXX
#define MILO_DISCOVERY_HOSTNAME_HXX

#include <string>
#include <string_view>

/**
 * Convert a host name to lower case and strip leading and trailing
 * dots (i.e. "Milo.Local." becomes "milo.local").
 */
std::string
NormalizeHostname(std::string_view hostname) noexcept;

/**
 * Does the advertised host name match the target exactly (after
 * normalization)?  There is no prefix or suffix matching.
 */
[[gnu::pure]]
bool
HostnameMatches(std::string_view advertised, std::string_view target) noexcept;

#endif
