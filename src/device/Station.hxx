// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DEVICE_STATION_HXX
#define MILO_DEVICE_STATION_HXX

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

/**
 * A radio station as listed by the appliance.
 */
struct RadioStation {
	std::string id;

	std::string name;

	/**
	 * All other attributes (favicon, country, ...), unparsed.
	 */
	nlohmann::json extra = nlohmann::json::object();
};

using RadioStationList = std::vector<RadioStation>;

#endif
