// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Json.hxx"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <type_traits>

using std::string_view_literals::operator""sv;

/**
 * Look up an attribute of the expected type; returns the fallback if
 * it is missing or has a different type.
 */
template<typename T>
static T
GetOr(const nlohmann::json &j, std::string_view key, T fallback)
{
	const auto i = j.find(key);
	if (i == j.end())
		return fallback;

	if constexpr (std::is_same_v<T, bool>) {
		if (!i->is_boolean())
			return fallback;
	} else if constexpr (std::is_arithmetic_v<T>) {
		if (!i->is_number())
			return fallback;
	} else {
		if (!i->is_string())
			return fallback;
	}

	return i->template get<T>();
}

/**
 * Like GetOr(), but without a fallback: a missing attribute (or one
 * with a different type) yields std::nullopt.
 */
template<typename T>
static std::optional<T>
GetOptional(const nlohmann::json &j, std::string_view key)
{
	const auto i = j.find(key);
	if (i == j.end())
		return std::nullopt;

	if constexpr (std::is_same_v<T, bool>) {
		if (!i->is_boolean())
			return std::nullopt;
	} else {
		if (!i->is_number())
			return std::nullopt;
	}

	return i->template get<T>();
}

void
from_json(const nlohmann::json &j, DeviceState &state)
{
	if (!j.is_object())
		throw std::runtime_error("State is not an object");

	DeviceState defaults;

	state.active_source = GetOr(j, "active_source"sv, defaults.active_source);
	state.plugin_state = GetOr(j, "plugin_state"sv, defaults.plugin_state);
	state.transitioning = GetOr(j, "transitioning"sv, false);

	if (auto i = j.find("target_source"sv);
	    i != j.end() && i->is_string())
		state.target_source = i->get<std::string>();
	else
		state.target_source.reset();

	state.multiroom_enabled = GetOr(j, "multiroom_enabled"sv, false);
	state.equalizer_enabled = GetOr(j, "equalizer_enabled"sv, false);

	if (auto i = j.find("metadata"sv);
	    i != j.end() && i->is_object())
		state.metadata = *i;
	else
		state.metadata = nlohmann::json::object();
}

void
from_json(const nlohmann::json &j, VolumeState &volume)
{
	if (!j.is_object())
		throw std::runtime_error("Volume status is not an object");

	if (!j.contains("volume_db"sv))
		throw std::runtime_error("No volume_db in volume status");

	VolumeState defaults;

	volume.volume_db = j.at("volume_db"sv).get<double>();
	volume.multiroom_enabled = GetOr(j, "multiroom_enabled"sv, false);
	volume.dsp_available = GetOr(j, "dsp_available"sv, defaults.dsp_available);

	volume.limit_min_db = defaults.limit_min_db;
	volume.limit_max_db = defaults.limit_max_db;
	volume.step_db = defaults.step_db;

	if (auto i = j.find("config"sv); i != j.end() && i->is_object()) {
		volume.limit_min_db = GetOr(*i, "limit_min_db"sv, defaults.limit_min_db);
		volume.limit_max_db = GetOr(*i, "limit_max_db"sv, defaults.limit_max_db);
		volume.step_db = GetOr(*i, "step_mobile_db"sv, defaults.step_db);
	}
}

void
from_json(const nlohmann::json &j, VolumeUpdate &update)
{
	if (!j.is_object())
		throw std::runtime_error("Volume event is not an object");

	update.volume_db = GetOptional<double>(j, "volume_db"sv);
	update.multiroom_enabled = GetOptional<bool>(j, "multiroom_enabled"sv);
	update.step_db = GetOptional<double>(j, "step_mobile_db"sv);
}

/**
 * Station ids may be numeric or strings; both are stored as
 * strings.
 */
static std::string
StationIdToString(const nlohmann::json &id)
{
	if (id.is_string())
		return id.get<std::string>();
	else if (id.is_number_integer())
		return std::to_string(id.get<long long>());
	else
		throw std::runtime_error("Invalid station id");
}

void
from_json(const nlohmann::json &j, RadioStation &station)
{
	station.id = StationIdToString(j.at("id"sv));
	j.at("name"sv).get_to(station.name);

	station.extra = j;
	station.extra.erase("id");
	station.extra.erase("name");
}

DeviceState
ParseDeviceState(std::string_view body)
{
	return nlohmann::json::parse(body).get<DeviceState>();
}

VolumeState
ParseVolumeStatus(std::string_view body)
{
	const auto j = nlohmann::json::parse(body);
	return j.at("data"sv).get<VolumeState>();
}

RadioStationList
ParseStationList(std::string_view body)
{
	const auto j = nlohmann::json::parse(body);
	return j.at("stations"sv).get<RadioStationList>();
}
