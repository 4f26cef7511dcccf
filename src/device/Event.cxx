// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Event.hxx"
#include "Json.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <nlohmann/json.hpp>

using std::string_view_literals::operator""sv;

static constexpr Domain event_domain("event");

[[gnu::pure]]
static bool
IsStateEvent(std::string_view category, std::string_view type) noexcept
{
	if (category == "system"sv)
		return type == "state_changed"sv ||
			type == "transition_start"sv ||
			type == "transition_complete"sv;

	if (category == "plugin"sv)
		return type == "state_changed"sv;

	return false;
}

static DeviceEvent
ParseStateEvent(const nlohmann::json &data)
{
	const auto i = data.find("full_state"sv);
	if (i == data.end())
		/* a state event without a snapshot is useless */
		return std::monostate{};

	/* the control stream reports "ready" for a missing plugin
	   state */
	DeviceState state = i->get<DeviceState>();
	if (!i->contains("plugin_state"sv))
		state.plugin_state = "ready";

	return state;
}

DeviceEvent
ParseDeviceEvent(std::string_view text) noexcept
try {
	const auto j = nlohmann::json::parse(text);
	if (!j.is_object())
		return std::monostate{};

	const auto category = j.value("category", std::string{});
	const auto type = j.value("type", std::string{});

	if (category == "system"sv && type == "ping"sv)
		return std::monostate{};

	const auto data = j.find("data"sv);
	if (data == j.end() || !data->is_object())
		return std::monostate{};

	if (IsStateEvent(category, type))
		return ParseStateEvent(*data);

	if (category == "volume"sv && type == "volume_changed"sv)
		return data->get<VolumeUpdate>();

	FmtDebug(event_domain, "Ignoring event {}/{}", category, type);
	return std::monostate{};
} catch (const std::exception &e) {
	FmtDebug(event_domain, "Ignoring malformed event: {}", e.what());
	return std::monostate{};
}
