// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_NET_RESOLVER_HXX
#define MILO_NET_RESOLVER_HXX

#include <string>
#include <system_error>
#include <vector>

/**
 * The std::error_category of getaddrinfo() error codes (EAI_*).
 */
class ResolverErrorCategory final : public std::error_category {
public:
	const char *name() const noexcept override {
		return "gai";
	}

	std::string message(int condition) const override;
};

extern ResolverErrorCategory resolver_error_category;

/**
 * Resolve a host name with getaddrinfo() and return the numeric
 * addresses in the order the system resolver returned them.  This
 * function blocks.
 *
 * Throws std::system_error with #resolver_error_category on error.
 *
 * @param family AF_INET, AF_INET6 or AF_UNSPEC
 */
std::vector<std::string>
ResolveHostAddresses(const char *host, int family);

#endif
