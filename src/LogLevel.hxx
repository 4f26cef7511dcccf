// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_LOG_LEVEL_HXX
#define MILO_LOG_LEVEL_HXX

#include <string_view>

/**
 * Message severity, in ascending order.  The "log_level" setting
 * selects the lowest level which is printed.
 */
enum class LogLevel {
	/* state machine transitions, protocol details */
	DEBUG,

	INFO,

	/* connect/disconnect and other events the user cares about */
	NOTICE,

	/* something failed, but will be retried */
	WARNING,

	ERROR,
};

/**
 * Parse a log level name ("debug", "info", "notice", "warning",
 * "error"; "verbose" and "default" are accepted as aliases).
 *
 * Throws std::invalid_argument on error.
 */
LogLevel
ParseLogLevel(std::string_view value);

#endif
