// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DISCOVERY_BROWSER_HXX
#define MILO_DISCOVERY_BROWSER_HXX

#include <exception>

struct ServiceCandidate;

/**
 * An interface that receives events from a #ServiceBrowser.  All
 * methods are invoked in the #EventLoop thread.
 */
class ServiceBrowserHandler {
public:
	/**
	 * A service instance was found and its host name was
	 * resolved.
	 */
	virtual void OnServiceFound(const ServiceCandidate &candidate) noexcept = 0;

	/**
	 * A previously found service instance has disappeared.
	 */
	virtual void OnServiceRemoved(const ServiceCandidate &candidate) noexcept = 0;

	/**
	 * The browser has failed and stopped itself.
	 */
	virtual void OnServiceBrowseError(std::exception_ptr error) noexcept = 0;
};

/**
 * Browses the local network for instances of a service type.
 *
 * As soon as this object is started, it will start browsing, and
 * notify the #ServiceBrowserHandler when it found or lost
 * something.
 */
class ServiceBrowser {
protected:
	ServiceBrowserHandler &handler;

	explicit ServiceBrowser(ServiceBrowserHandler &_handler) noexcept
		:handler(_handler) {}

public:
	virtual ~ServiceBrowser() noexcept = default;

	virtual bool IsRunning() const noexcept = 0;

	/**
	 * Start browsing.  This is a no-op if the browser is already
	 * running.
	 *
	 * Throws on error.
	 */
	virtual void Start() = 0;

	/**
	 * Stop browsing and cancel all pending host name
	 * resolutions.  Idempotent.
	 */
	virtual void Stop() noexcept = 0;
};

#endif
