// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_PROVISION_COMMAND_PROVISIONER_HXX
#define MILO_PROVISION_COMMAND_PROVISIONER_HXX

#include "Provisioner.hxx"

#include <string>

/**
 * A #DeviceProvisioner which runs a shell command.  Each "%h" in the
 * command is replaced with the new address.  The process is not
 * waited for; the daemon reaps it in its SIGCHLD handler.
 */
class CommandProvisioner final : public DeviceProvisioner {
	const std::string command;

public:
	explicit CommandProvisioner(std::string_view _command) noexcept
		:command(_command) {}

	/* virtual methods from DeviceProvisioner */
	void UpdateTargetHost(std::string_view address) noexcept override;
};

/**
 * Replace each "%h" in the template with the address.
 */
std::string
ExpandProvisionCommand(std::string_view command, std::string_view address);

#endif
