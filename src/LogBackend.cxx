// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "LogBackend.hxx"
#include "Log.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "util/Domain.hxx"
#include "util/StringStrip.hxx"
#include "Version.h"

#include <fmt/chrono.h>

#include <ctime>

#include <stdio.h>
#include <syslog.h>

namespace {

struct LogLevelName {
	std::string_view name;
	LogLevel level;
};

/* "verbose" and "default" are aliases accepted for compatibility
   with older configuration files */
constexpr LogLevelName log_level_names[] = {
	{ "debug", LogLevel::DEBUG },
	{ "verbose", LogLevel::DEBUG },
	{ "info", LogLevel::INFO },
	{ "notice", LogLevel::NOTICE },
	{ "default", LogLevel::NOTICE },
	{ "warning", LogLevel::WARNING },
	{ "error", LogLevel::ERROR },
};

/**
 * Where log messages go; configured once at startup by log_init().
 */
struct LogSink {
	LogLevel threshold = LogLevel::NOTICE;
	bool timestamp = false;
	bool syslog = false;
};

LogSink sink;

} // anonymous namespace

void
SetLogThreshold(LogLevel threshold) noexcept
{
	sink.threshold = threshold;
}

void
EnableLogTimestamp() noexcept
{
	sink.timestamp = true;
}

LogLevel
ParseLogLevel(std::string_view value)
{
	for (const auto &i : log_level_names)
		if (i.name == value)
			return i.level;

	throw FmtInvalidArgument("unknown log level \"{}\"", value);
}

[[gnu::const]]
static int
GetSysLogPriority(LogLevel level) noexcept
{
	switch (level) {
	case LogLevel::DEBUG:
		return LOG_DEBUG;
	case LogLevel::INFO:
		return LOG_INFO;
	case LogLevel::NOTICE:
		return LOG_NOTICE;
	case LogLevel::WARNING:
		return LOG_WARNING;
	case LogLevel::ERROR:
		break;
	}

	return LOG_ERR;
}

void
LogInitSysLog() noexcept
{
	openlog(MILO_PACKAGE, 0, LOG_DAEMON);
	sink.syslog = true;
}

void
LogFinishSysLog() noexcept
{
	if (!sink.syslog)
		return;

	closelog();
	sink.syslog = false;
}

/**
 * Write one line to stderr, optionally prefixed with the local time.
 */
static void
WriteStderr(const Domain &domain, std::string_view text) noexcept
{
	if (sink.timestamp) {
		const std::time_t now = std::time(nullptr);
		struct tm tm;
		if (localtime_r(&now, &tm) != nullptr) {
			fmt::print(stderr, "{:%FT%T} {}: {}\n",
				   tm, domain.GetName(), text);
			return;
		}
	}

	fmt::print(stderr, "{}: {}\n", domain.GetName(), text);
}

void
Log(LogLevel level, const Domain &domain, std::string_view msg) noexcept
{
	if (level < sink.threshold)
		return;

	msg = StripRight(msg);

	if (sink.syslog)
		syslog(GetSysLogPriority(level), "%s: %.*s",
		       domain.GetName(), int(msg.size()), msg.data());
	else
		WriteStderr(domain, msg);
}
