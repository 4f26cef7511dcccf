// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandProvisioner.hxx"
#include "util/Domain.hxx"
#include "Log.hxx"

#include <cstring>

#include <spawn.h>

extern char **environ;

static constexpr Domain provision_domain("provision");

std::string
ExpandProvisionCommand(std::string_view command, std::string_view address)
{
	std::string result;
	result.reserve(command.size() + address.size());

	while (true) {
		const auto i = command.find("%h");
		if (i == command.npos)
			break;

		result.append(command.substr(0, i));
		result.append(address);
		command.remove_prefix(i + 2);
	}

	result.append(command);
	return result;
}

void
CommandProvisioner::UpdateTargetHost(std::string_view address) noexcept
{
	const auto line = ExpandProvisionCommand(command, address);

	FmtInfo(provision_domain, "Running: {}", line);

	const char *const argv[] = {
		"/bin/sh", "-c", line.c_str(), nullptr,
	};

	pid_t pid;
	int error = posix_spawn(&pid, argv[0], nullptr, nullptr,
				const_cast<char *const*>(argv), environ);
	if (error != 0)
		FmtError(provision_domain, "Failed to run \"{}\": {}",
			 line, std::strerror(error));
}
