// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#pragma once

#include <string>
#include <string_view>

constexpr char
ToLowerASCII(char ch) noexcept
{
	return ch >= 'A' && ch <= 'Z'
		? char(ch - 'A' + 'a')
		: ch;
}

/**
 * Compare two strings, ignoring the case of ASCII letters.
 */
[[gnu::pure]]
constexpr bool
StringEqualsCaseASCII(std::string_view a, std::string_view b) noexcept
{
	if (a.size() != b.size())
		return false;

	for (std::size_t i = 0; i < a.size(); ++i)
		if (ToLowerASCII(a[i]) != ToLowerASCII(b[i]))
			return false;

	return true;
}

inline std::string
ToLowerASCII(std::string_view s) noexcept
{
	std::string result{s};
	for (auto &ch : result)
		ch = ToLowerASCII(ch);
	return result;
}
