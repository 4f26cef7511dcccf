// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "StringStrip.hxx"

#include <algorithm>

std::string_view
StripLeft(std::string_view s) noexcept
{
	const auto i = std::find_if_not(s.begin(), s.end(),
					IsWhitespaceOrNull);
	s.remove_prefix(std::size_t(i - s.begin()));
	return s;
}

std::string_view
StripRight(std::string_view s) noexcept
{
	const auto i = std::find_if_not(s.rbegin(), s.rend(),
					IsWhitespaceOrNull);
	s.remove_suffix(std::size_t(i - s.rbegin()));
	return s;
}

std::string_view
Strip(std::string_view s) noexcept
{
	return StripRight(StripLeft(s));
}
