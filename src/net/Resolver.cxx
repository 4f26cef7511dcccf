// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Resolver.hxx"
#include "SocketAddress.hxx"
#include "ToString.hxx"

#include <fmt/format.h>

#include <memory>

#include <sys/socket.h>
#include <netdb.h>

ResolverErrorCategory resolver_error_category;

std::string
ResolverErrorCategory::message(int condition) const
{
	return gai_strerror(condition);
}

struct AddressInfoDeleter {
	void operator()(struct addrinfo *ai) const noexcept {
		freeaddrinfo(ai);
	}
};

std::vector<std::string>
ResolveHostAddresses(const char *host, int family)
{
	struct addrinfo hints{};
	hints.ai_family = family;
	/* one entry per address instead of one per socket type */
	hints.ai_socktype = SOCK_STREAM;

	struct addrinfo *ai;
	int error = getaddrinfo(host, nullptr, &hints, &ai);
	if (error != 0)
		throw std::system_error(error, resolver_error_category,
					fmt::format("Failed to resolve '{}'", host));

	const std::unique_ptr<struct addrinfo, AddressInfoDeleter> list{ai};

	std::vector<std::string> result;
	for (const auto *i = ai; i != nullptr; i = i->ai_next) {
		auto s = HostToString({i->ai_addr, i->ai_addrlen});
		if (!s.empty())
			result.emplace_back(std::move(s));
	}

	return result;
}
