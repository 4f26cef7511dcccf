// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Endpoint.hxx"
#include "Error.hxx"

#include <fmt/format.h>

static constexpr bool
IsAlphaNumericASCII(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9');
}

bool
IsValidHost(std::string_view host) noexcept
{
	if (host.empty() || host.size() > 253)
		return false;

	for (char ch : host)
		if (!IsAlphaNumericASCII(ch) && ch != '-' && ch != '.')
			return false;

	return true;
}

bool
IsValidIdentifier(std::string_view id) noexcept
{
	if (id.empty() || id == "." || id == "..")
		return false;

	for (char ch : id)
		if (!IsAlphaNumericASCII(ch) && ch != '-' && ch != '_' &&
		    ch != '.')
			return false;

	return true;
}

static void
CheckHost(const std::string &host)
{
	if (!IsValidHost(host))
		throw ApiError(ApiError::Kind::INVALID_TARGET,
			       fmt::format("Invalid host name \"{}\"", host));
}

std::string
DeviceEndpoint::MakeHttpUrl(std::string_view path) const
{
	const auto &host = GetHost();
	CheckHost(host);

	if (path.empty() || path.front() != '/')
		throw ApiError(ApiError::Kind::INVALID_TARGET,
			       fmt::format("Invalid API path \"{}\"", path));

	return fmt::format("http://{}:{}{}", host, http_port, path);
}

std::string
DeviceEndpoint::MakeStreamUrl() const
{
	const auto &host = GetHost();
	CheckHost(host);

	return fmt::format("ws://{}:{}/ws", host, stream_port);
}
