// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Hostname.hxx"
#include "util/ASCII.hxx"

static constexpr std::string_view
StripDots(std::string_view s) noexcept
{
	while (!s.empty() && s.front() == '.')
		s.remove_prefix(1);

	while (!s.empty() && s.back() == '.')
		s.remove_suffix(1);

	return s;
}

std::string
NormalizeHostname(std::string_view hostname) noexcept
{
	return ToLowerASCII(StripDots(hostname));
}

bool
HostnameMatches(std::string_view advertised, std::string_view target) noexcept
{
	advertised = StripDots(advertised);
	target = StripDots(target);

	return !target.empty() && StringEqualsCaseASCII(advertised, target);
}
