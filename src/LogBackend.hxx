// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_LOG_BACKEND_HXX
#define MILO_LOG_BACKEND_HXX

#include "LogLevel.hxx"

/**
 * Messages below this level are discarded.
 */
void
SetLogThreshold(LogLevel threshold) noexcept;

/**
 * Prefix each stderr line with the local time.  Has no effect on
 * syslog output.
 */
void
EnableLogTimestamp() noexcept;

/**
 * Send all further messages to syslog (facility LOG_DAEMON) instead
 * of stderr.
 */
void
LogInitSysLog() noexcept;

void
LogFinishSysLog() noexcept;

#endif
