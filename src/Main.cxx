// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "Instance.hxx"
#include "CommandLine.hxx"
#include "LogInit.hxx"
#include "Log.hxx"
#include "config/Data.hxx"
#include "config/File.hxx"
#include "event/SignalMonitor.hxx"
#include "util/Domain.hxx"
#include "util/Exception.hxx"
#include "Version.h"

#include <cstdlib>

static constexpr Domain main_domain("main");

static void
MainConfigured(const CommandLineOptions &options, const ConfigData &config)
{
	log_init(config, options.verbose, options.log_syslog);

	FmtNotice(main_domain, "{} {} starting", MILO_PACKAGE, MILO_VERSION);

	Instance instance;
	instance.Configure(config, options.host);

	SignalMonitorInit(instance.event_loop);

	instance.Run();

	SignalMonitorFinish();
}

static void
MainOrThrow(int argc, char *argv[])
{
	CommandLineOptions options;
	ParseCommandLine(argc, argv, options);

	ConfigData config;
	if (options.config_path != nullptr)
		ReadConfigFile(config, options.config_path);

	MainConfigured(options, config);
}

int
main(int argc, char *argv[]) noexcept
try {
	MainOrThrow(argc, argv);
	log_deinit();
	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	log_deinit();
	return EXIT_FAILURE;
}
