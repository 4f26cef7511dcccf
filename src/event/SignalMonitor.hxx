// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_EVENT_SIGNAL_MONITOR_HXX
#define MILO_EVENT_SIGNAL_MONITOR_HXX

#include "util/BindMethod.hxx"

class EventLoop;

using SignalHandler = BoundMethod<void() noexcept>;

/**
 * Start catching signals.  The handlers registered with
 * SignalMonitorRegister() run inside the #EventLoop, not in signal
 * context.
 *
 * Throws on error.
 */
void
SignalMonitorInit(EventLoop &loop);

/**
 * Restore the previous signal dispositions and stop monitoring.
 */
void
SignalMonitorFinish() noexcept;

/**
 * Throws on error.
 */
void
SignalMonitorRegister(int signo, SignalHandler handler);

#endif
