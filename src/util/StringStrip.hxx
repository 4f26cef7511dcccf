// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_UTIL_STRING_STRIP_HXX
#define MILO_UTIL_STRING_STRIP_HXX

#include <string_view>

/**
 * Treats all control characters and the space as whitespace.
 */
constexpr bool
IsWhitespaceOrNull(char ch) noexcept
{
	return static_cast<unsigned char>(ch) <= 0x20;
}

[[gnu::pure]]
std::string_view
StripLeft(std::string_view s) noexcept;

[[gnu::pure]]
std::string_view
StripRight(std::string_view s) noexcept;

/**
 * Remove leading and trailing whitespace.
 */
[[gnu::pure]]
std::string_view
Strip(std::string_view s) noexcept;

#endif
