// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_COMMAND_LINE_HXX
#define MILO_COMMAND_LINE_HXX

struct CommandLineOptions {
	/**
	 * The configuration file; nullptr if none was given.
	 */
	const char *config_path = nullptr;

	/**
	 * Overrides "device_host" from the configuration file.
	 */
	const char *host = nullptr;

	bool log_stderr = false;
	bool log_syslog = false;
	bool verbose = false;
};

/**
 * Throws on error.  Exits the process after "--help" and
 * "--version".
 */
void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options);

#endif
