// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DEVICE_JSON_HXX
#define MILO_DEVICE_JSON_HXX

#include "State.hxx"
#include "Station.hxx"
#include "Volume.hxx"

#include <nlohmann/json_fwd.hpp>

#include <string_view>

/**
 * Missing or mistyped attributes fall back to the defaults of
 * #DeviceState; a non-object throws.
 */
void
from_json(const nlohmann::json &j, DeviceState &state);

/**
 * Parse the "data" object of /api/volume/status.
 */
void
from_json(const nlohmann::json &j, VolumeState &volume);

/**
 * Parse the "data" object of a "volume_changed" event.
 */
void
from_json(const nlohmann::json &j, VolumeUpdate &update);

/**
 * Stations without "id" or "name" throw.
 */
void
from_json(const nlohmann::json &j, RadioStation &station);

/**
 * Parse the body of GET /api/audio/state.
 *
 * Throws on error.
 */
DeviceState
ParseDeviceState(std::string_view body);

/**
 * Parse the body of GET /api/volume/status.
 *
 * Throws on error.
 */
VolumeState
ParseVolumeStatus(std::string_view body);

/**
 * Parse the body of GET /api/radio/stations.
 *
 * Throws on error.
 */
RadioStationList
ParseStationList(std::string_view body);

#endif
