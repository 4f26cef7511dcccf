// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "AddressResolver.hxx"
#include "provision/Provisioner.hxx"
#include "lib/fmt/ExceptionFormatter.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

static constexpr Domain resolver_domain("resolver");

AddressResolver::AddressResolver(EventLoop &loop, unsigned probe_port,
				 AddressResolverHandler &_handler,
				 DeviceProvisioner *_provisioner,
				 HostLookup::Function lookup_function,
				 Event::Duration probe_timeout,
				 Event::Duration grace_period) noexcept
	:handler(_handler), provisioner(_provisioner),
	 lookup(loop, *this, std::move(lookup_function)),
	 race(loop, probe_port, *this, probe_timeout, grace_period)
{
}

void
AddressResolver::Start(std::string_view _host) noexcept
{
	Cancel();

	host = _host;
	FmtDebug(resolver_domain, "Resolving '{}'", host);

	try {
		lookup.Start(host);
	} catch (...) {
		OnHostLookupError(std::current_exception());
	}
}

void
AddressResolver::Cancel() noexcept
{
	lookup.Cancel();
	race.Cancel();
}

void
AddressResolver::Select(const std::string &address) noexcept
{
	if (address != current_best) {
		FmtNotice(resolver_domain, "Best address of '{}' is now {}",
			  host, address);
		current_best = address;

		if (provisioner != nullptr)
			provisioner->UpdateTargetHost(address);
	} else
		FmtDebug(resolver_domain, "Best address of '{}' is still {}",
			 host, address);

	handler.OnAddressResolved(address, true);
}

void
AddressResolver::Fallback() noexcept
{
	FmtWarning(resolver_domain,
		   "No IPv4 address for '{}', using the host name", host);
	handler.OnAddressResolved(host, false);
}

void
AddressResolver::OnHostLookupSuccess(std::vector<std::string> &&addresses) noexcept
{
	auto ipv4 = FilterIPv4Addresses(addresses);

	switch (ipv4.size()) {
	case 0:
		Fallback();
		break;

	case 1:
		/* nothing to race against */
		Select(ipv4.front());
		break;

	default:
		race.Start(ipv4);
		break;
	}
}

void
AddressResolver::OnHostLookupError(std::exception_ptr error) noexcept
{
	FmtWarning(resolver_domain, "Failed to resolve '{}': {}", host, error);
	Fallback();
}

void
AddressResolver::OnLatencyRaceDone(std::vector<AddressLatency> &&results) noexcept
{
	const auto best = SelectBestAddress(results);
	if (best)
		Select(*best);
	else
		Fallback();
}
