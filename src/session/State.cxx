// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "State.hxx"

const char *
ToString(SessionState state) noexcept
{
	switch (state) {
	case SessionState::IDLE:
		return "idle";

	case SessionState::DISCOVERING:
		return "discovering";

	case SessionState::PROBING:
		return "probing";

	case SessionState::RESOLVING:
		return "resolving";

	case SessionState::STREAM_CONNECTING:
		return "stream connecting";

	case SessionState::CONNECTED:
		return "connected";

	case SessionState::DISCONNECTED:
		return "disconnected";
	}

	return "?";
}

const char *
ToString(DisconnectReason reason) noexcept
{
	switch (reason) {
	case DisconnectReason::STOPPED:
		return "stopped";

	case DisconnectReason::STREAM_FAILURE:
		return "stream failure";

	case DisconnectReason::CANDIDATE_REMOVED:
		return "candidate removed";

	case DisconnectReason::FORCED:
		return "forced reconnect";

	case DisconnectReason::SYSTEM_WAKE:
		return "system wake";

	case DisconnectReason::STREAM_GAVE_UP:
		return "stream gave up";
	}

	return "?";
}
