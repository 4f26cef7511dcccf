// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogInit.hxx"
#include "LogBackend.hxx"
#include "config/Data.hxx"
#include "config/Option.hxx"

void
log_init(const ConfigData &config, bool verbose, bool use_syslog)
{
	if (verbose)
		SetLogThreshold(LogLevel::DEBUG);
	else
		SetLogThreshold(config.With(ConfigOption::LOG_LEVEL, [](const char *s){
			return s != nullptr
				? ParseLogLevel(s)
				: LogLevel::NOTICE;
		}));

	if (use_syslog)
		LogInitSysLog();
	else if (config.GetBool(ConfigOption::LOG_TIMESTAMP, false))
		EnableLogTimestamp();
}

void
log_deinit() noexcept
{
	LogFinishSysLog();
}
