// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "File.hxx"
#include "Data.hxx"
#include "Param.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/StringStrip.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <fmt/format.h>

#include <fstream>
#include <string>
#include <system_error>

#include <errno.h>

static constexpr char CONF_COMMENT = '#';

static constexpr Domain config_file_domain("config_file");

static constexpr bool
IsOptionNameChar(char ch) noexcept
{
	return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
		(ch >= '0' && ch <= '9') || ch == '_';
}

/**
 * Split the option name off the start of the line.
 */
static std::string_view
ReadOptionName(std::string_view &line)
{
	std::size_t length = 0;
	while (length < line.size() && IsOptionNameChar(line[length]))
		++length;

	if (length == 0)
		throw FmtRuntimeError("Option name expected near \"{}\"", line);

	const auto name = line.substr(0, length);
	line = StripLeft(line.substr(length));
	return name;
}

/**
 * Split a double-quoted value off the start of the line.  A
 * backslash escapes the following character.
 */
static std::string
ReadQuotedValue(std::string_view &line)
{
	if (line.empty() || line.front() == CONF_COMMENT)
		throw std::runtime_error("Value missing");

	if (line.front() != '"')
		throw std::runtime_error("Value must be quoted");

	std::string value;
	std::size_t i = 1;
	while (true) {
		if (i >= line.size())
			throw std::runtime_error("Missing closing quote");

		char ch = line[i++];
		if (ch == '"')
			break;

		if (ch == '\\') {
			if (i >= line.size())
				throw std::runtime_error("Missing closing quote");
			ch = line[i++];
		}

		value.push_back(ch);
	}

	line = StripLeft(line.substr(i));
	return value;
}

static void
ParseConfigLine(ConfigData &config_data, unsigned line_number,
		std::string_view line)
{
	const auto name = ReadOptionName(line);
	const ConfigOption option = ParseConfigOptionName(name);
	if (option == ConfigOption::MAX)
		throw FmtRuntimeError("unrecognized parameter: {}", name);

	auto value = ReadQuotedValue(line);
	if (!line.empty() && line.front() != CONF_COMMENT)
		throw std::runtime_error("Unknown tokens after value");

	config_data.AddParam(option, ConfigParam(std::move(value),
						 line_number));
}

void
ReadConfigFile(ConfigData &config_data, std::istream &is, const char *name)
{
	unsigned line_number = 0;
	std::string buffer;

	try {
		while (std::getline(is, buffer)) {
			++line_number;

			const auto line = StripLeft(std::string_view{buffer});
			if (line.empty() || line.front() == CONF_COMMENT)
				continue;

			ParseConfigLine(config_data, line_number, line);
		}
	} catch (...) {
		std::throw_with_nested(FmtRuntimeError("Error in {} line {}",
						       name, line_number));
	}
}

void
ReadConfigFile(ConfigData &config_data, const char *path)
{
	FmtDebug(config_file_domain, "loading file {}", path);

	std::ifstream file(path);
	if (!file)
		throw std::system_error(errno, std::system_category(),
					fmt::format("Failed to open {}", path));

	ReadConfigFile(config_data, file, path);
}
