// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DISCOVERY_GLUE_HXX
#define MILO_DISCOVERY_GLUE_HXX

#include "event/Chrono.hxx"

#include <memory>
#include <string>

struct ConfigData;
class EventLoop;
class ServiceBrowser;
class ServiceBrowserHandler;

struct DiscoveryConfig {
	std::string service_type = "_http._tcp";

	/**
	 * The host name reported by the static browser.
	 */
	std::string hostname = "milo.local";

	Event::Duration resolve_timeout = std::chrono::seconds(5);

	bool zeroconf_enabled = true;

	DiscoveryConfig() = default;

	/**
	 * Throws on error.
	 */
	explicit DiscoveryConfig(const ConfigData &config);
};

/**
 * Create the #ServiceBrowser according to the configuration: DNS-SD
 * if enabled and compiled in, the static host name otherwise.
 */
std::unique_ptr<ServiceBrowser>
CreateServiceBrowser(EventLoop &loop, const DiscoveryConfig &config,
		     ServiceBrowserHandler &handler);

#endif
