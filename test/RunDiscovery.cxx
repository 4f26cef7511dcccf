// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

/*
 * Browse for appliances and print all service instances which come
 * and go.
 */

#include "ShutdownHandler.hxx"
#include "discovery/Browser.hxx"
#include "discovery/Candidate.hxx"
#include "discovery/Glue.hxx"
#include "event/Loop.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <cstdlib>

class PrintBrowserHandler final : public ServiceBrowserHandler {
	EventLoop &event_loop;

public:
	explicit PrintBrowserHandler(EventLoop &_event_loop) noexcept
		:event_loop(_event_loop) {}

	/* virtual methods from ServiceBrowserHandler */
	void OnServiceFound(const ServiceCandidate &candidate) noexcept override {
		fmt::print("+ {} on {}\n", candidate.name, candidate.hostname);
	}

	void OnServiceRemoved(const ServiceCandidate &candidate) noexcept override {
		fmt::print("- {} on {}\n", candidate.name, candidate.hostname);
	}

	void OnServiceBrowseError(std::exception_ptr error) noexcept override {
		fmt::print(stderr, "{}\n", error);
		event_loop.Break();
	}
};

int
main(int argc, char **argv) noexcept
try {
	if (argc > 2) {
		fmt::print(stderr, "Usage: RunDiscovery [SERVICE_TYPE]\n");
		return EXIT_FAILURE;
	}

	DiscoveryConfig config;
	if (argc > 1)
		config.service_type = argv[1];

	EventLoop event_loop;
	const ShutdownHandler shutdown_handler(event_loop);

	PrintBrowserHandler handler(event_loop);
	auto browser = CreateServiceBrowser(event_loop, config, handler);
	browser->Start();

	event_loop.Run();

	browser->Stop();
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
