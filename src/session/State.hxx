// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SESSION_STATE_HXX
#define MILO_SESSION_STATE_HXX

#include <cstdint>

enum class SessionState : uint8_t {
	IDLE,
	DISCOVERING,
	PROBING,
	RESOLVING,
	STREAM_CONNECTING,
	CONNECTED,

	/**
	 * The connection was lost; see #DisconnectReason.  This is
	 * transient while the intent to connect is set.
	 */
	DISCONNECTED,
};

enum class DisconnectReason : uint8_t {
	/**
	 * Stop() was called.
	 */
	STOPPED,

	STREAM_FAILURE,

	/**
	 * The service instance has disappeared from the network.
	 */
	CANDIDATE_REMOVED,

	/**
	 * ForceReconnect() was called.
	 */
	FORCED,

	/**
	 * The system has resumed from suspend.
	 */
	SYSTEM_WAKE,

	/**
	 * The control stream's reconnect policy has given up.
	 */
	STREAM_GAVE_UP,
};

[[gnu::const]]
const char *
ToString(SessionState state) noexcept;

[[gnu::const]]
const char *
ToString(DisconnectReason reason) noexcept;

#endif
