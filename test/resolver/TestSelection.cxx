// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "resolver/Selection.hxx"

#include <gtest/gtest.h>

using std::chrono_literals::operator""ms;

TEST(Selection, FilterIPv4)
{
	const std::vector<std::string> input{
		"fe80::1",
		"192.168.1.20",
		"",
		"10.0.0.5",
		"192.168.1.20",
		"::1",
		"10.0.0.5",
	};

	const std::vector<std::string> expected{"192.168.1.20", "10.0.0.5"};
	EXPECT_EQ(FilterIPv4Addresses(input), expected);
	EXPECT_TRUE(FilterIPv4Addresses({}).empty());
	EXPECT_TRUE(FilterIPv4Addresses({"fe80::1%eth0"}).empty());
}

TEST(Selection, Empty)
{
	EXPECT_FALSE(SelectBestAddress({}));
}

TEST(Selection, LowestLatencyWins)
{
	const std::vector<AddressLatency> results{
		{"10.0.0.1", 40ms},
		{"10.0.0.2", 12ms},
		{"10.0.0.3", std::nullopt},
		{"10.0.0.4", 30ms},
	};

	EXPECT_EQ(SelectBestAddress(results), "10.0.0.2");
}

TEST(Selection, TieKeepsOrder)
{
	const std::vector<AddressLatency> results{
		{"10.0.0.1", std::nullopt},
		{"10.0.0.2", 5ms},
		{"10.0.0.3", 5ms},
	};

	EXPECT_EQ(SelectBestAddress(results), "10.0.0.2");
}

TEST(Selection, NoSuccessFallsBackToFirst)
{
	const std::vector<AddressLatency> results{
		{"10.0.0.1", std::nullopt},
		{"10.0.0.2", std::nullopt},
	};

	EXPECT_EQ(SelectBestAddress(results), "10.0.0.1");
}

TEST(Selection, Single)
{
	EXPECT_EQ(SelectBestAddress({{"10.0.0.9", std::nullopt}}), "10.0.0.9");
	EXPECT_EQ(SelectBestAddress({{"10.0.0.9", 1ms}}), "10.0.0.9");
}
