// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Glue.hxx"
#include "StaticBrowser.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"
#include "config.h"

#ifdef HAVE_BONJOUR
#include "BonjourBrowser.hxx"
#endif

static constexpr Domain discovery_domain("discovery");

DiscoveryConfig::DiscoveryConfig(const ConfigData &config)
{
	service_type = config.GetString(ConfigOption::SERVICE_TYPE,
					service_type.c_str());
	hostname = config.GetString(ConfigOption::DEVICE_HOST,
				    hostname.c_str());
	resolve_timeout = config.GetDuration(ConfigOption::DISCOVERY_RESOLVE_TIMEOUT,
					     std::chrono::milliseconds(100),
					     resolve_timeout);
	zeroconf_enabled = config.GetBool(ConfigOption::ZEROCONF_ENABLED,
					  zeroconf_enabled);
}

std::unique_ptr<ServiceBrowser>
CreateServiceBrowser(EventLoop &loop, const DiscoveryConfig &config,
		     ServiceBrowserHandler &handler)
{
	if (config.zeroconf_enabled) {
#ifdef HAVE_BONJOUR
		FmtDebug(discovery_domain, "Using DNS-SD to find '{}'",
			 config.hostname);
		return std::make_unique<BonjourBrowser>(loop,
							config.service_type,
							config.resolve_timeout,
							handler);
#else
		LogWarning(discovery_domain,
			   "Zeroconf support is not compiled in, using the static host name");
#endif
	}

	return std::make_unique<StaticBrowser>(loop, config.hostname, handler);
}
