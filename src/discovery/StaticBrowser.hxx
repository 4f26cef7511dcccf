// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DISCOVERY_STATIC_BROWSER_HXX
#define MILO_DISCOVERY_STATIC_BROWSER_HXX

#include "Browser.hxx"
#include "event/DeferEvent.hxx"

#include <string>

/**
 * A #ServiceBrowser which does not browse at all; it reports the
 * configured host name as the only candidate.  This is used if
 * zeroconf is disabled or unavailable.
 */
class StaticBrowser final : public ServiceBrowser {
	const std::string hostname;

	DeferEvent defer_found;

	bool running = false;

public:
	StaticBrowser(EventLoop &loop, std::string_view _hostname,
		      ServiceBrowserHandler &_handler) noexcept;

	/* virtual methods from ServiceBrowser */
	bool IsRunning() const noexcept override {
		return running;
	}

	void Start() override;
	void Stop() noexcept override;

private:
	void OnDeferredFound() noexcept;
};

#endif
