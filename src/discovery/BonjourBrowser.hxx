// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DISCOVERY_BONJOUR_BROWSER_HXX
#define MILO_DISCOVERY_BONJOUR_BROWSER_HXX

#include "Browser.hxx"
#include "event/Chrono.hxx"
#include "event/SocketEvent.hxx"

#include <dns_sd.h>

#include <cstdint>
#include <list>
#include <map>
#include <string>
#include <vector>

/**
 * A #ServiceBrowser implementation based on the DNS-SD API
 * (mDNSResponder or the Avahi compatibility library).  Each instance
 * found is resolved to its host name (with a timeout) before it is
 * reported.
 */
class BonjourBrowser final : public ServiceBrowser {
	class Resolver;

	EventLoop &loop;

	const std::string service_type;

	const Event::Duration resolve_timeout;

	DNSServiceRef browse_ref = nullptr;

	SocketEvent browse_event;

	std::list<Resolver> resolvers;

	/**
	 * Instances which have been reported as found, mapped to
	 * their host names.
	 */
	std::map<std::string, std::string, std::less<>> found;

	/**
	 * Instances removed by BrowseCallback(), to be reported after
	 * DNSServiceProcessResult() has returned.
	 */
	std::vector<std::string> removed;

	DNSServiceErrorType browse_error = kDNSServiceErr_NoError;

public:
	BonjourBrowser(EventLoop &_loop, std::string_view _service_type,
		       Event::Duration _resolve_timeout,
		       ServiceBrowserHandler &_handler) noexcept;
	~BonjourBrowser() noexcept override;

	/* virtual methods from ServiceBrowser */
	bool IsRunning() const noexcept override {
		return browse_ref != nullptr;
	}

	void Start() override;
	void Stop() noexcept override;

private:
	void Fail(const char *msg, DNSServiceErrorType error) noexcept;

	void OnAdd(const char *name, const char *regtype, const char *domain,
		   uint32_t interface_index) noexcept;
	void OnRemove(std::string_view name) noexcept;

	void OnResolved(Resolver &resolver, const char *hostname) noexcept;
	void OnResolveFailed(Resolver &resolver) noexcept;
	void RemoveResolver(Resolver &resolver) noexcept;

	static void BrowseCallback(DNSServiceRef sdRef, DNSServiceFlags flags,
				   uint32_t interfaceIndex,
				   DNSServiceErrorType errorCode,
				   const char *serviceName,
				   const char *regtype,
				   const char *replyDomain,
				   void *context) noexcept;

	void OnBrowseSocketReady(unsigned flags) noexcept;
};

#endif
