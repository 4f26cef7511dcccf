// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "CommandLine.hxx"

#include <gtest/gtest.h>

#include <stdexcept>
#include <vector>

static CommandLineOptions
Parse(std::vector<const char *> args)
{
	args.insert(args.begin(), "milo-link");

	CommandLineOptions options;
	ParseCommandLine(int(args.size()), const_cast<char **>(args.data()),
			 options);
	return options;
}

TEST(CommandLine, Empty)
{
	const auto options = Parse({});
	EXPECT_EQ(options.config_path, nullptr);
	EXPECT_EQ(options.host, nullptr);
	EXPECT_FALSE(options.verbose);
	EXPECT_FALSE(options.log_stderr);
	EXPECT_FALSE(options.log_syslog);
}

TEST(CommandLine, Options)
{
	auto options = Parse({"-v", "--host", "milo.local", "--stderr",
			      "/etc/milo-link.conf"});
	EXPECT_TRUE(options.verbose);
	EXPECT_TRUE(options.log_stderr);
	EXPECT_STREQ(options.host, "milo.local");
	EXPECT_STREQ(options.config_path, "/etc/milo-link.conf");

	options = Parse({"--host=192.168.1.7", "--syslog"});
	EXPECT_STREQ(options.host, "192.168.1.7");
	EXPECT_TRUE(options.log_syslog);

	options = Parse({"-H", "milo"});
	EXPECT_STREQ(options.host, "milo");
}

TEST(CommandLine, Errors)
{
	EXPECT_THROW(Parse({"--bogus"}), std::runtime_error);
	EXPECT_THROW(Parse({"-x"}), std::runtime_error);
	EXPECT_THROW(Parse({"--host"}), std::runtime_error);
	EXPECT_THROW(Parse({"--verbose=yes"}), std::runtime_error);
	EXPECT_THROW(Parse({"a.conf", "b.conf"}), std::runtime_error);
	EXPECT_THROW(Parse({"--stderr", "--syslog"}), std::runtime_error);
}
