// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_LOG_INIT_HXX
#define MILO_LOG_INIT_HXX

struct ConfigData;

/**
 * Configure the log threshold and the output.
 *
 * Throws on error.
 *
 * @param verbose true to log everything (overrides "log_level")
 * @param use_syslog true to send messages to syslog instead of
 * stderr
 */
void
log_init(const ConfigData &config, bool verbose, bool use_syslog);

void
log_deinit() noexcept;

#endif
