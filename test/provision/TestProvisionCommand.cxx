// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "provision/CommandProvisioner.hxx"

#include <gtest/gtest.h>

TEST(ProvisionCommand, Expand)
{
	EXPECT_EQ(ExpandProvisionCommand("roc-vad update %h", "192.168.1.20"),
		  "roc-vad update 192.168.1.20");
	EXPECT_EQ(ExpandProvisionCommand("%h:%h", "10.0.0.1"),
		  "10.0.0.1:10.0.0.1");
	EXPECT_EQ(ExpandProvisionCommand("true", "10.0.0.1"), "true");
	EXPECT_EQ(ExpandProvisionCommand("", "10.0.0.1"), "");
}

TEST(ProvisionCommand, PercentWithoutH)
{
	EXPECT_EQ(ExpandProvisionCommand("echo 100% %x", "10.0.0.1"),
		  "echo 100% %x");
	EXPECT_EQ(ExpandProvisionCommand("echo %", "10.0.0.1"), "echo %");
}
