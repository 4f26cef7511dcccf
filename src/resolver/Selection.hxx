// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_RESOLVER_SELECTION_HXX
#define MILO_RESOLVER_SELECTION_HXX

#include "event/Chrono.hxx"

#include <optional>
#include <string>
#include <vector>

/**
 * The result of one latency probe.
 */
struct AddressLatency {
	std::string address;

	/**
	 * The time it took to establish a TCP connection; empty if
	 * the probe has failed or timed out.
	 */
	std::optional<Event::Duration> latency;
};

/**
 * Keep only numeric IPv4 addresses (no ':'), drop duplicates and
 * preserve the order.
 */
std::vector<std::string>
FilterIPv4Addresses(const std::vector<std::string> &addresses);

/**
 * Choose the address with the lowest latency.  If no probe has
 * succeeded, the first address is chosen.  Returns an empty value if
 * the list is empty.
 */
[[gnu::pure]]
std::optional<std::string>
SelectBestAddress(const std::vector<AddressLatency> &results) noexcept;

#endif
