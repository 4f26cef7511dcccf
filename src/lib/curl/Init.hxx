// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

/**
 * Reference-counted curl_global_init() / curl_global_cleanup()
 * guard.  Create one instance per subsystem that uses libcurl.
 *
 * Throws on error.
 */
class ScopeCurlInit {
public:
	ScopeCurlInit();
	~ScopeCurlInit() noexcept;

	ScopeCurlInit(const ScopeCurlInit &) = delete;
	ScopeCurlInit &operator=(const ScopeCurlInit &) = delete;
};

/**
 * Was the libcurl we run with built with support for the given URL
 * scheme (e.g. "ws")?
 */
[[gnu::pure]]
bool
CurlHasProtocol(const char *scheme) noexcept;
