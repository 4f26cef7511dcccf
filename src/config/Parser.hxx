// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_CONFIG_PARSER_HXX
#define MILO_CONFIG_PARSER_HXX

#include <chrono>
#include <string_view>

/*
 * Conversion of configuration values.  All functions throw
 * std::runtime_error if the value is malformed.
 */

/**
 * Accepts "yes"/"no", "true"/"false", "on"/"off" and "1"/"0",
 * ignoring case.
 */
bool
ParseBool(std::string_view value);

long
ParseLong(std::string_view s);

unsigned
ParsePositive(std::string_view s);

/**
 * Parse a TCP port number (1..65535).
 */
unsigned
ParsePort(std::string_view s);

/**
 * Parse a duration.  The number may be followed by "ms", "s" or
 * "min"; without a suffix, seconds are assumed.
 */
std::chrono::steady_clock::duration
ParseDuration(std::string_view s);

#endif
