// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Exception.hxx"
#include "StringStrip.hxx"

#include <fmt/core.h>

#include <stdio.h>

static void
AppendOneLine(std::string &dest, std::string_view src) noexcept
{
	src = Strip(src);
	if (src.empty())
		return;

	if (!dest.empty())
		dest += "; ";

	bool pending_space = false;
	for (char ch : src) {
		if (IsWhitespaceOrNull(ch)) {
			pending_space = true;
		} else {
			if (pending_space)
				dest.push_back(' ');
			pending_space = false;
			dest.push_back(ch);
		}
	}
}

std::string
GetFullMessage(std::exception_ptr ep) noexcept
{
	std::string result;

	while (ep) {
		std::exception_ptr inner;

		try {
			std::rethrow_exception(ep);
		} catch (const std::exception &e) {
			AppendOneLine(result, e.what());

			if (const auto *ne = dynamic_cast<const std::nested_exception *>(&e))
				inner = ne->nested_ptr();
		} catch (const std::nested_exception &ne) {
			inner = ne.nested_ptr();
		} catch (...) {
			AppendOneLine(result, "Unknown exception");
		}

		ep = std::move(inner);
	}

	return result;
}

void
PrintException(std::exception_ptr ep) noexcept
{
	fmt::print(stderr, "{}\n", GetFullMessage(std::move(ep)));
}
