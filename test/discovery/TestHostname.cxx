// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "discovery/Hostname.hxx"

#include <gtest/gtest.h>

TEST(Hostname, Normalize)
{
	EXPECT_EQ(NormalizeHostname("milo.local"), "milo.local");
	EXPECT_EQ(NormalizeHostname("Milo.Local."), "milo.local");
	EXPECT_EQ(NormalizeHostname(".milo.local.."), "milo.local");
	EXPECT_EQ(NormalizeHostname(""), "");
	EXPECT_EQ(NormalizeHostname("..."), "");
}

TEST(Hostname, Matches)
{
	EXPECT_TRUE(HostnameMatches("milo.local", "milo.local"));
	EXPECT_TRUE(HostnameMatches("milo.local.", "milo.local"));
	EXPECT_TRUE(HostnameMatches("MILO.LOCAL.", "milo.local"));
	EXPECT_TRUE(HostnameMatches("milo.local", "Milo.Local."));
}

TEST(Hostname, ExactMatchOnly)
{
	EXPECT_FALSE(HostnameMatches("milo2.local", "milo.local"));
	EXPECT_FALSE(HostnameMatches("my-milo.local", "milo.local"));
	EXPECT_FALSE(HostnameMatches("milo.local.lan", "milo.local"));
	EXPECT_FALSE(HostnameMatches("milo", "milo.local"));
	EXPECT_FALSE(HostnameMatches("", "milo.local"));
}

TEST(Hostname, EmptyTargetMatchesNothing)
{
	EXPECT_FALSE(HostnameMatches("", ""));
	EXPECT_FALSE(HostnameMatches(".", "."));
	EXPECT_FALSE(HostnameMatches("milo.local", ""));
}
