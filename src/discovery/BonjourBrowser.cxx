// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "BonjourBrowser.hxx"
#include "Candidate.hxx"
#include "event/FineTimerEvent.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <utility>

static constexpr Domain bonjour_domain("bonjour");

/**
 * Resolves one service instance to its host name.
 */
class BonjourBrowser::Resolver final {
	BonjourBrowser &browser;

	const std::string name;

	DNSServiceRef ref = nullptr;

	SocketEvent socket_event;

	FineTimerEvent timeout_event;

	/**
	 * Set by the callback; the object is removed after
	 * DNSServiceProcessResult() has returned.
	 */
	bool done = false;

	std::string hostname;

public:
	Resolver(BonjourBrowser &_browser, const char *_name) noexcept
		:browser(_browser), name(_name),
		 socket_event(browser.loop, BIND_THIS_METHOD(OnSocketReady)),
		 timeout_event(browser.loop, BIND_THIS_METHOD(OnTimeout)) {}

	~Resolver() noexcept {
		socket_event.Cancel();

		if (ref != nullptr)
			DNSServiceRefDeallocate(ref);
	}

	Resolver(const Resolver &) = delete;
	Resolver &operator=(const Resolver &) = delete;

	const std::string &GetName() const noexcept {
		return name;
	}

	/**
	 * Throws on error.
	 */
	void Start(const char *regtype, const char *domain,
		   uint32_t interface_index) {
		auto error = DNSServiceResolve(&ref, 0, interface_index,
					       name.c_str(), regtype, domain,
					       Callback, this);
		if (error != kDNSServiceErr_NoError) {
			ref = nullptr;
			throw FmtRuntimeError("DNSServiceResolve() failed: {}",
					      (int)error);
		}

		socket_event.Open(SocketDescriptor(DNSServiceRefSockFD(ref)));
		socket_event.ScheduleRead();
		timeout_event.Schedule(browser.resolve_timeout);
	}

private:
	static void Callback([[maybe_unused]] DNSServiceRef sdRef,
			     [[maybe_unused]] DNSServiceFlags flags,
			     [[maybe_unused]] uint32_t interfaceIndex,
			     DNSServiceErrorType errorCode,
			     [[maybe_unused]] const char *fullname,
			     const char *hosttarget,
			     [[maybe_unused]] uint16_t port,
			     [[maybe_unused]] uint16_t txtLen,
			     [[maybe_unused]] const unsigned char *txtRecord,
			     void *context) noexcept {
		auto &r = *(Resolver *)context;
		r.done = true;
		if (errorCode == kDNSServiceErr_NoError && hosttarget != nullptr)
			r.hostname = hosttarget;
	}

	void OnSocketReady([[maybe_unused]] unsigned flags) noexcept {
		auto error = DNSServiceProcessResult(ref);
		if (error != kDNSServiceErr_NoError) {
			FmtDebug(bonjour_domain,
				 "DNSServiceProcessResult() failed: {}",
				 (int)error);
			browser.OnResolveFailed(*this);
			return;
		}

		if (!done)
			return;

		if (hostname.empty())
			browser.OnResolveFailed(*this);
		else
			browser.OnResolved(*this, hostname.c_str());
	}

	void OnTimeout() noexcept {
		FmtDebug(bonjour_domain, "Timeout resolving '{}'", name);
		browser.OnResolveFailed(*this);
	}
};

BonjourBrowser::BonjourBrowser(EventLoop &_loop,
			       std::string_view _service_type,
			       Event::Duration _resolve_timeout,
			       ServiceBrowserHandler &_handler) noexcept
	:ServiceBrowser(_handler),
	 loop(_loop),
	 service_type(_service_type),
	 resolve_timeout(_resolve_timeout),
	 browse_event(loop, BIND_THIS_METHOD(OnBrowseSocketReady))
{
}

BonjourBrowser::~BonjourBrowser() noexcept
{
	Stop();
}

void
BonjourBrowser::Start()
{
	if (IsRunning())
		return;

	DNSServiceRef ref;
	auto error = DNSServiceBrowse(&ref, 0, kDNSServiceInterfaceIndexAny,
				      service_type.c_str(), "local.",
				      BrowseCallback, this);
	if (error != kDNSServiceErr_NoError)
		throw FmtRuntimeError("DNSServiceBrowse() failed: {}",
				      (int)error);

	browse_ref = ref;
	browse_event.Open(SocketDescriptor(DNSServiceRefSockFD(browse_ref)));
	browse_event.ScheduleRead();

	FmtDebug(bonjour_domain, "Browsing for '{}'", service_type);
}

void
BonjourBrowser::Stop() noexcept
{
	resolvers.clear();
	found.clear();
	removed.clear();
	browse_error = kDNSServiceErr_NoError;

	if (browse_ref == nullptr)
		return;

	/* the socket is owned by the DNSServiceRef */
	browse_event.ReleaseSocket();
	DNSServiceRefDeallocate(std::exchange(browse_ref, nullptr));
}

void
BonjourBrowser::Fail(const char *msg, DNSServiceErrorType error) noexcept
{
	Stop();
	handler.OnServiceBrowseError(std::make_exception_ptr(FmtRuntimeError("{}: {}",
									   msg, (int)error)));
}

void
BonjourBrowser::OnAdd(const char *name, const char *regtype,
		      const char *domain, uint32_t interface_index) noexcept
{
	for (const auto &i : resolvers)
		if (i.GetName() == name)
			/* already resolving */
			return;

	auto &resolver = resolvers.emplace_back(*this, name);

	try {
		resolver.Start(regtype, domain, interface_index);
	} catch (...) {
		LogError(bonjour_domain, std::current_exception(),
			 "Failed to resolve service instance");
		resolvers.pop_back();
	}
}

void
BonjourBrowser::OnRemove(std::string_view name) noexcept
{
	resolvers.remove_if([name](const Resolver &r){
		return r.GetName() == name;
	});

	auto i = found.find(name);
	if (i == found.end())
		return;

	const ServiceCandidate candidate{i->first, i->second};
	found.erase(i);

	handler.OnServiceRemoved(candidate);
}

void
BonjourBrowser::OnResolved(Resolver &resolver, const char *hostname) noexcept
{
	const ServiceCandidate candidate{resolver.GetName(), hostname};
	RemoveResolver(resolver);

	FmtDebug(bonjour_domain, "Resolved '{}' to '{}'",
		 candidate.name, candidate.hostname);

	found.insert_or_assign(candidate.name, candidate.hostname);
	handler.OnServiceFound(candidate);
}

void
BonjourBrowser::OnResolveFailed(Resolver &resolver) noexcept
{
	FmtDebug(bonjour_domain, "Failed to resolve '{}'",
		 resolver.GetName());
	RemoveResolver(resolver);
}

void
BonjourBrowser::RemoveResolver(Resolver &resolver) noexcept
{
	resolvers.remove_if([&resolver](const Resolver &r){
		return &r == &resolver;
	});
}

void
BonjourBrowser::BrowseCallback([[maybe_unused]] DNSServiceRef sdRef,
			       DNSServiceFlags flags,
			       uint32_t interfaceIndex,
			       DNSServiceErrorType errorCode,
			       const char *serviceName,
			       const char *regtype,
			       const char *replyDomain,
			       void *context) noexcept
{
	auto &browser = *(BonjourBrowser *)context;

	if (errorCode != kDNSServiceErr_NoError) {
		browser.browse_error = errorCode;
		return;
	}

	if (flags & kDNSServiceFlagsAdd)
		browser.OnAdd(serviceName, regtype, replyDomain,
			      interfaceIndex);
	else
		browser.removed.emplace_back(serviceName);
}

void
BonjourBrowser::OnBrowseSocketReady([[maybe_unused]] unsigned flags) noexcept
{
	auto error = DNSServiceProcessResult(browse_ref);
	if (error != kDNSServiceErr_NoError) {
		Fail("DNSServiceProcessResult() failed", error);
		return;
	}

	if (browse_error != kDNSServiceErr_NoError) {
		Fail("Service browse failed",
		     std::exchange(browse_error, kDNSServiceErr_NoError));
		return;
	}

	/* the handler may stop this browser */
	while (IsRunning() && !removed.empty()) {
		const auto name = std::move(removed.front());
		removed.erase(removed.begin());
		OnRemove(name);
	}
}
