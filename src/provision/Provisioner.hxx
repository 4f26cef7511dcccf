// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#ifndef MILO_PROVISION_PROVISIONER_HXX
#define MILO_PROVISION_PROVISIONER_HXX

#include <string_view>

/**
 * The external device provisioning tool.  It is told (fire and
 * forget) whenever the best address of the appliance changes.
 */
class DeviceProvisioner {
public:
	virtual ~DeviceProvisioner() noexcept = default;

	virtual void UpdateTargetHost(std::string_view address) noexcept = 0;
};

#endif
