// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_CONFIG_PARAM_HXX
#define MILO_CONFIG_PARAM_HXX

#include <string>

/**
 * One "name value" line from the configuration file.
 */
struct ConfigParam {
	std::string value;

	/**
	 * The line number in the configuration file.
	 */
	unsigned line;

	ConfigParam(std::string &&_value, unsigned _line) noexcept
		:value(std::move(_value)), line(_line) {}

	/**
	 * Rethrow the current exception nested inside one which names
	 * the line of this setting.  Must be called from a "catch"
	 * block.
	 */
	[[noreturn]]
	void ThrowWithNested() const;

	template<typename F>
	auto With(F &&f) const {
		try {
			return f(value.c_str());
		} catch (...) {
			ThrowWithNested();
		}
	}
};

#endif
