// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/ASCII.hxx"
#include "util/StringStrip.hxx"

#include <charconv>

using std::string_view_literals::operator""sv;

bool
ParseBool(std::string_view value)
{
	for (auto i : {"yes"sv, "true"sv, "on"sv, "1"sv})
		if (StringEqualsCaseASCII(value, i))
			return true;

	for (auto i : {"no"sv, "false"sv, "off"sv, "0"sv})
		if (StringEqualsCaseASCII(value, i))
			return false;

	throw FmtRuntimeError(R"(Not a valid boolean ("yes" or "no"): "{}")",
			      value);
}

/**
 * Parse the decimal number at the start of the string and advance
 * #s past it.
 */
static long
ParseLeadingNumber(std::string_view &s)
{
	const char *const end = s.data() + s.size();

	long value;
	const auto [ptr, ec] = std::from_chars(s.data(), end, value);
	if (ec == std::errc::result_out_of_range)
		throw std::runtime_error("Number is out of range");
	if (ec != std::errc{})
		throw std::runtime_error("Failed to parse number");

	s = {ptr, std::size_t(end - ptr)};
	return value;
}

long
ParseLong(std::string_view s)
{
	const long value = ParseLeadingNumber(s);
	if (!s.empty())
		throw FmtRuntimeError("Garbage after number: \"{}\"", s);

	return value;
}

unsigned
ParsePositive(std::string_view s)
{
	const long value = ParseLong(s);
	if (value <= 0)
		throw std::runtime_error("Value must be positive");

	return unsigned(value);
}

unsigned
ParsePort(std::string_view s)
{
	const long value = ParseLong(s);
	if (value < 1 || value > 65535)
		throw std::runtime_error("Not a valid port number");

	return unsigned(value);
}

std::chrono::steady_clock::duration
ParseDuration(std::string_view s)
{
	using Duration = std::chrono::steady_clock::duration;

	const long value = ParseLeadingNumber(s);
	if (value < 0)
		throw std::runtime_error("Duration must not be negative");

	const auto unit = Strip(s);
	if (unit.empty() || unit == "s"sv)
		return std::chrono::duration_cast<Duration>(std::chrono::seconds(value));

	if (unit == "ms"sv)
		return std::chrono::duration_cast<Duration>(std::chrono::milliseconds(value));

	if (unit == "min"sv)
		return std::chrono::duration_cast<Duration>(std::chrono::minutes(value));

	throw FmtRuntimeError("Unknown duration unit \"{}\"", unit);
}
