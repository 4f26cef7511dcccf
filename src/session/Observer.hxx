// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_SESSION_OBSERVER_HXX
#define MILO_SESSION_OBSERVER_HXX

#include "State.hxx"

struct DeviceState;
struct VolumeState;

/**
 * Receives the high-level notifications of the #SessionManager (the
 * user interface).  All methods are invoked in the #EventLoop
 * thread.
 */
class SessionObserver {
public:
	virtual void OnConnected() noexcept = 0;
	virtual void OnDisconnected(DisconnectReason reason) noexcept = 0;
	virtual void OnStateUpdate(const DeviceState &state) noexcept = 0;
	virtual void OnVolumeUpdate(const VolumeState &volume) noexcept = 0;
};

#endif
