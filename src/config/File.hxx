// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_CONFIG_FILE_HXX
#define MILO_CONFIG_FILE_HXX

#include <istream>

struct ConfigData;

/**
 * Load a configuration file.
 *
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &config_data, const char *path);

/**
 * Parse configuration lines from a stream.  The file name is used
 * only in error messages.
 *
 * Throws on error.
 */
void
ReadConfigFile(ConfigData &config_data, std::istream &is,
	       const char *name);

#endif
