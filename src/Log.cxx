// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Log.hxx"
#include "util/Exception.hxx"

#include <fmt/format.h>

#include <iterator> // for std::back_inserter()

void
LogVFmt(LogLevel level, const Domain &domain,
	fmt::string_view format_str, fmt::format_args args) noexcept
{
	fmt::memory_buffer buffer;
	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	Log(level, domain, {buffer.data(), buffer.size()});
}

void
Log(LogLevel level, const Domain &domain,
    std::exception_ptr ep, std::string_view msg) noexcept
{
	const auto what = GetFullMessage(ep);
	if (msg.empty())
		Log(level, domain, what);
	else
		LogFmt(level, domain, "{}: {}", msg, what);
}
