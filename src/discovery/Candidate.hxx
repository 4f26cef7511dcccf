// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DISCOVERY_CANDIDATE_HXX
#define MILO_DISCOVERY_CANDIDATE_HXX

#include <string>

/**
 * A service instance found on the network.
 */
struct ServiceCandidate {
	/**
	 * The DNS-SD instance name.
	 */
	std::string name;

	/**
	 * The host name the instance resolved to, e.g. "milo.local.".
	 */
	std::string hostname;
};

#endif
