// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DEVICE_VOLUME_HXX
#define MILO_DEVICE_VOLUME_HXX

#include <optional>

/**
 * The appliance's volume, including the limits which are only
 * available through the HTTP API.
 */
struct VolumeState {
	double volume_db = -30.0;

	bool multiroom_enabled = false;

	bool dsp_available = true;

	double limit_min_db = -80.0;

	double limit_max_db = -21.0;

	double step_db = 3.0;

	[[gnu::pure]]
	double Clamp(double db) const noexcept {
		if (db < limit_min_db)
			return limit_min_db;
		if (db > limit_max_db)
			return limit_max_db;
		return db;
	}
};

/**
 * A volume change pushed over the control stream.  It carries no
 * limits, and each attribute is optional.
 */
struct VolumeUpdate {
	std::optional<double> volume_db;

	std::optional<bool> multiroom_enabled;

	std::optional<double> step_db;
};

/**
 * Merge a stream update into the current state: the attributes
 * present in the update replace the old ones; all others (including
 * the limits of the last HTTP fetch) are kept.
 */
constexpr VolumeState
ApplyVolumeUpdate(VolumeState state, const VolumeUpdate &update) noexcept
{
	if (update.volume_db)
		state.volume_db = *update.volume_db;
	if (update.multiroom_enabled)
		state.multiroom_enabled = *update.multiroom_enabled;
	if (update.step_db)
		state.step_db = *update.step_db;
	return state;
}

#endif
