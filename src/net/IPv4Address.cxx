// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "IPv4Address.hxx"

#include <arpa/inet.h>

std::optional<IPv4Address>
IPv4Address::Parse(const char *numeric, uint16_t port) noexcept
{
	IPv4Address result;
	if (inet_pton(AF_INET, numeric, &result.address.sin_addr) != 1)
		return std::nullopt;

	result.address.sin_family = AF_INET;
	result.address.sin_port = htons(port);
	return result;
}
