// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "config.h"
#include "CommandLine.hxx"
#include "lib/fmt/RuntimeError.hxx"
#include "Version.h"

#include <fmt/core.h>

#include <cstdlib>
#include <span>
#include <string>
#include <string_view>

namespace {

enum class Option {
	HOST,
	STDERR,
	SYSLOG,
	VERBOSE,
	VERSION,
	HELP,
};

struct OptionDef {
	Option id;
	const char *long_name;
	char short_name;

	/**
	 * Name of the value in the help text; nullptr if the option
	 * is a flag.
	 */
	const char *value_name;

	/**
	 * nullptr hides the option from the help text.
	 */
	const char *description;
};

constexpr OptionDef option_defs[] = {
	{Option::HOST, "host", 'H', "HOST",
	 "the appliance's host name (overrides device_host)"},
	{Option::STDERR, "stderr", 0, nullptr, "print messages to stderr"},
	{Option::SYSLOG, "syslog", 0, nullptr, "send messages to syslog"},
	{Option::VERBOSE, "verbose", 'v', nullptr, "verbose logging"},
	{Option::VERSION, "version", 'V', nullptr, "print version number"},
	{Option::HELP, "help", 'h', nullptr, "show help options"},
	{Option::HELP, nullptr, '?', nullptr, nullptr},
};

/**
 * An option found on the command line, with its value (if it takes
 * one).
 */
struct ParsedOption {
	const OptionDef &def;
	const char *value;
};

} // anonymous namespace

[[noreturn]]
static void
PrintVersion() noexcept
{
	fmt::print(MILO_PACKAGE " " MILO_VERSION "\n"
		   "\n"
		   "Features:"
#ifdef HAVE_BONJOUR
		   " dns-sd"
#endif
		   "\n");

	std::exit(EXIT_SUCCESS);
}

[[noreturn]]
static void
PrintHelp() noexcept
{
	fmt::print("Usage:\n"
		   "  milo-link [OPTION...] [path/to/milo-link.conf]\n"
		   "\n"
		   "Connects to a Milo audio appliance on the local network.\n"
		   "\n"
		   "Options:\n");

	for (const auto &i : option_defs) {
		if (i.description == nullptr)
			continue;

		std::string left = i.long_name;
		if (i.value_name != nullptr) {
			left += ' ';
			left += i.value_name;
		}

		if (i.short_name != 0)
			fmt::print("  -{}, --{:<16}{}\n",
				   i.short_name, left, i.description);
		else
			fmt::print("      --{:<16}{}\n", left, i.description);
	}

	std::exit(EXIT_SUCCESS);
}

/**
 * Consume the value of an option: either the "=value" suffix of a
 * long option, or the next argument.
 */
static const char *
TakeValue(const OptionDef &def, const char *arg, const char *inline_value,
	  std::span<char *> &args)
{
	if (def.value_name == nullptr) {
		if (inline_value != nullptr)
			throw FmtRuntimeError("Option {} does not take a value",
					      arg);
		return nullptr;
	}

	if (inline_value != nullptr)
		return inline_value;

	if (args.empty())
		throw FmtRuntimeError("Value expected after {}", arg);

	const char *value = args.front();
	args = args.subspan(1);
	return value;
}

static ParsedOption
IdentifyOption(const char *arg, std::span<char *> &args)
{
	const std::string_view s{arg};

	if (s.starts_with("--")) {
		auto name = s.substr(2);
		const char *inline_value = nullptr;
		if (const auto eq = name.find('='); eq != name.npos) {
			inline_value = arg + 2 + eq + 1;
			name = name.substr(0, eq);
		}

		for (const auto &i : option_defs)
			if (i.long_name != nullptr && name == i.long_name)
				return {i, TakeValue(i, arg, inline_value, args)};
	} else if (s.size() == 2) {
		for (const auto &i : option_defs)
			if (i.short_name != 0 && s[1] == i.short_name)
				return {i, TakeValue(i, arg, nullptr, args)};
	}

	throw FmtRuntimeError("Unknown option: {}", arg);
}

void
ParseCommandLine(int argc, char **argv, CommandLineOptions &options)
{
	std::span<char *> args{argv + 1, std::size_t(argc - 1)};
	unsigned n_positional = 0;

	while (!args.empty()) {
		const char *arg = args.front();
		args = args.subspan(1);

		if (arg[0] != '-' || arg[1] == 0) {
			if (++n_positional > 1)
				throw std::runtime_error("Too many arguments");

			options.config_path = arg;
			continue;
		}

		const auto o = IdentifyOption(arg, args);
		switch (o.def.id) {
		case Option::HOST:
			options.host = o.value;
			break;

		case Option::STDERR:
			options.log_stderr = true;
			break;

		case Option::SYSLOG:
			options.log_syslog = true;
			break;

		case Option::VERBOSE:
			options.verbose = true;
			break;

		case Option::VERSION:
			PrintVersion();

		case Option::HELP:
			PrintHelp();
		}
	}

	if (options.log_stderr && options.log_syslog)
		throw std::runtime_error("--stderr and --syslog are mutually exclusive");
}
