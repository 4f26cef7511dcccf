// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_RESOLVER_ADDRESS_RESOLVER_HXX
#define MILO_RESOLVER_ADDRESS_RESOLVER_HXX

#include "HostLookup.hxx"
#include "LatencyRace.hxx"

#include <string>

class DeviceProvisioner;

class AddressResolverHandler {
public:
	/**
	 * @param address the best numeric IPv4 address, or the host
	 * name itself if name resolution returned nothing usable
	 * @param resolved true if #address is a resolved address
	 */
	virtual void OnAddressResolved(const std::string &address,
				       bool resolved) noexcept = 0;
};

/**
 * Resolves the appliance's host name to the best IPv4 address: the
 * lowest connect latency wins.  The provisioning tool is notified
 * whenever the best address changes.
 */
class AddressResolver final : HostLookupHandler, LatencyRaceHandler {
	AddressResolverHandler &handler;

	DeviceProvisioner *const provisioner;

	HostLookup lookup;

	LatencyRace race;

	/**
	 * The host name currently being resolved.
	 */
	std::string host;

	/**
	 * The last address selected; empty if none.
	 */
	std::string current_best;

public:
	AddressResolver(EventLoop &loop, unsigned probe_port,
			AddressResolverHandler &_handler,
			DeviceProvisioner *_provisioner,
			HostLookup::Function lookup_function=HostLookup::SystemLookup,
			Event::Duration probe_timeout=LatencyRace::DEFAULT_PROBE_TIMEOUT,
			Event::Duration grace_period=LatencyRace::DEFAULT_GRACE_PERIOD) noexcept;

	bool IsBusy() const noexcept {
		return lookup.IsBusy() || race.IsRunning();
	}

	const std::string &GetCurrentBest() const noexcept {
		return current_best;
	}

	/**
	 * Start resolving.  The handler will be invoked in a later
	 * #EventLoop iteration, unless the worker thread could not be
	 * created.
	 */
	void Start(std::string_view _host) noexcept;

	/**
	 * Idempotent.
	 */
	void Cancel() noexcept;

private:
	void Select(const std::string &address) noexcept;
	void Fallback() noexcept;

	/* virtual methods from HostLookupHandler */
	void OnHostLookupSuccess(std::vector<std::string> &&addresses) noexcept override;
	void OnHostLookupError(std::exception_ptr error) noexcept override;

	/* virtual methods from LatencyRaceHandler */
	void OnLatencyRaceDone(std::vector<AddressLatency> &&results) noexcept override;
};

#endif
