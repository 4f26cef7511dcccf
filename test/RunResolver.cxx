// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Resolve a host name and race all of its IPv4 addresses, the way
 * the daemon chooses the address of the appliance.
 */

#include "ShutdownHandler.hxx"
#include "resolver/AddressResolver.hxx"
#include "config/Parser.hxx"
#include "event/Loop.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <cstdlib>

class PrintResolverHandler final : public AddressResolverHandler {
	EventLoop &event_loop;

public:
	explicit PrintResolverHandler(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	/* virtual methods from AddressResolverHandler */
	void OnAddressResolved(const std::string &address,
			       bool resolved) noexcept override {
		if (resolved)
			fmt::print("{}\n", address);
		else
			fmt::print("{} (not resolved)\n", address);

		event_loop.Break();
	}
};

int
main(int argc, char **argv) noexcept
try {
	if (argc < 2 || argc > 3) {
		fmt::print(stderr, "Usage: RunResolver HOST [PORT]\n");
		return EXIT_FAILURE;
	}

	const unsigned port = argc > 2 ? ParsePort(argv[2]) : 80;

	EventLoop event_loop;
	const ShutdownHandler shutdown_handler(event_loop);

	PrintResolverHandler handler(event_loop);
	AddressResolver resolver(event_loop, port, handler, nullptr);
	resolver.Start(argv[1]);

	event_loop.Run();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
