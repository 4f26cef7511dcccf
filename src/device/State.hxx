// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DEVICE_STATE_HXX
#define MILO_DEVICE_STATE_HXX

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>

/**
 * A snapshot of the appliance's audio state.  Each update replaces
 * the previous snapshot completely.
 */
struct DeviceState {
	std::string active_source = "none";

	std::string plugin_state = "inactive";

	/**
	 * Sent by the appliance for compatibility with older
	 * clients.  It is parsed, but nothing may depend on it;
	 * #target_source is the authoritative transition flag.
	 */
	bool transitioning = false;

	/**
	 * The source the appliance is switching to.  Present if and
	 * only if a source transition is in progress.
	 */
	std::optional<std::string> target_source;

	bool multiroom_enabled = false;

	bool equalizer_enabled = false;

	/**
	 * Opaque per-source metadata (always a JSON object).
	 */
	nlohmann::json metadata = nlohmann::json::object();

	bool IsTransitioning() const noexcept {
		return target_source.has_value();
	}

	/**
	 * Is the given source currently being loaded?
	 */
	[[gnu::pure]]
	bool IsSourceLoading(std::string_view source) const noexcept {
		return target_source && *target_source == source;
	}
};

#endif
