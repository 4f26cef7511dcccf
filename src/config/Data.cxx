// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Data.hxx"
#include "Parser.hxx"
#include "lib/fmt/RuntimeError.hxx"

void
ConfigData::AddParam(ConfigOption option, ConfigParam &&param)
{
	auto &slot = params[std::size_t(option)];
	if (slot)
		throw FmtRuntimeError("\"{}\" was already set on line {}",
				      GetConfigOptionName(option), slot->line);

	slot.emplace(std::move(param));
}

/**
 * Look up an option and convert its value with the given parser, or
 * return the default if it is not set.
 */
template<typename T, typename P>
static T
GetParsed(const ConfigData &data, ConfigOption option,
	  T default_value, P parse)
{
	const auto *param = data.GetParam(option);
	if (param == nullptr)
		return default_value;

	return param->With(parse);
}

const char *
ConfigData::GetString(ConfigOption option,
		      const char *default_value) const noexcept
{
	const auto *param = GetParam(option);
	return param != nullptr
		? param->value.c_str()
		: default_value;
}

unsigned
ConfigData::GetPositive(ConfigOption option, unsigned default_value) const
{
	return GetParsed(*this, option, default_value, [](const char *s){
		return ParsePositive(s);
	});
}

unsigned
ConfigData::GetPort(ConfigOption option, unsigned default_value) const
{
	return GetParsed(*this, option, default_value, [](const char *s){
		return ParsePort(s);
	});
}

std::chrono::steady_clock::duration
ConfigData::GetDuration(ConfigOption option,
			std::chrono::steady_clock::duration min_value,
			std::chrono::steady_clock::duration default_value) const
{
	return GetParsed(*this, option, default_value, [min_value](const char *s){
		const auto value = ParseDuration(s);
		if (value < min_value)
			throw std::runtime_error{"Duration is too short"};

		return value;
	});
}

bool
ConfigData::GetBool(ConfigOption option, bool default_value) const
{
	return GetParsed(*this, option, default_value, [](const char *s){
		return ParseBool(s);
	});
}
