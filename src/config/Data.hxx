// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_CONFIG_DATA_HXX
#define MILO_CONFIG_DATA_HXX

#include "Option.hxx"
#include "Param.hxx"

#include <array>
#include <chrono>
#include <optional>

/**
 * All settings loaded from the configuration file, indexed by
 * #ConfigOption.  Unset options fall back to the default passed to
 * the getters.
 */
struct ConfigData {
	std::array<std::optional<ConfigParam>, std::size_t(ConfigOption::MAX)> params;

	/**
	 * Throws if the option was already set.
	 */
	void AddParam(ConfigOption option, ConfigParam &&param);

	[[gnu::pure]]
	const ConfigParam *GetParam(ConfigOption option) const noexcept {
		const auto &p = params[std::size_t(option)];
		return p ? &*p : nullptr;
	}

	/**
	 * Invoke the function with the value, or with nullptr if the
	 * option is not set.  Exceptions thrown by the function are
	 * nested inside one which names the line.
	 */
	template<typename F>
	auto With(ConfigOption option, F &&f) const {
		if (const auto *param = GetParam(option))
			return param->With(std::forward<F>(f));

		return f(nullptr);
	}

	[[gnu::pure]]
	const char *GetString(ConfigOption option,
			      const char *default_value=nullptr) const noexcept;

	unsigned GetPositive(ConfigOption option,
			     unsigned default_value) const;

	unsigned GetPort(ConfigOption option,
			 unsigned default_value) const;

	/**
	 * Throws if the configured value is below #min_value.
	 */
	std::chrono::steady_clock::duration
	GetDuration(ConfigOption option,
		    std::chrono::steady_clock::duration min_value,
		    std::chrono::steady_clock::duration default_value) const;

	bool GetBool(ConfigOption option, bool default_value) const;
};

#endif
