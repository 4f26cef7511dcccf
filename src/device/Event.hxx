// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_DEVICE_EVENT_HXX
#define MILO_DEVICE_EVENT_HXX

#include "State.hxx"
#include "Volume.hxx"

#include <string_view>
#include <variant>

/**
 * A decoded control stream frame.  std::monostate stands for frames
 * which carry nothing of interest (keepalive pings, unknown
 * categories, malformed payloads).
 */
using DeviceEvent = std::variant<std::monostate, DeviceState, VolumeUpdate>;

/**
 * Decode one control stream text frame of the form
 * {"category":..., "type":..., "data":{...}}.
 *
 * This function does not throw; malformed frames are returned as
 * std::monostate.
 */
DeviceEvent
ParseDeviceEvent(std::string_view text) noexcept;

#endif
