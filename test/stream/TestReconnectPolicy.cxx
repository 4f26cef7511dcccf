// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "stream/ReconnectPolicy.hxx"

#include <gtest/gtest.h>

using std::chrono_literals::operator""s;
using std::chrono_literals::operator""ms;
using std::chrono_literals::operator""min;

TEST(ReconnectPolicy, DelayTable)
{
	const ReconnectConfig config;

	EXPECT_EQ(config.GetDelay(0), 5s);
	EXPECT_EQ(config.GetDelay(1), 10s);
	EXPECT_EQ(config.GetDelay(2), 15s);
	EXPECT_EQ(config.GetDelay(3), 20s);
	EXPECT_EQ(config.GetDelay(4), 25s);
	EXPECT_EQ(config.GetDelay(5), 30s);
	EXPECT_EQ(config.GetDelay(6), 30s);
	EXPECT_EQ(config.GetDelay(14), 30s);
}

TEST(ReconnectPolicy, LongConnections)
{
	ReconnectPolicy policy;

	EXPECT_EQ(policy.OnFailure(10s), 10s);
	EXPECT_EQ(policy.GetAttempts(), 1U);
	EXPECT_EQ(policy.OnFailure(10s), 15s);
	EXPECT_EQ(policy.OnFailure(3s), 20s);
	EXPECT_EQ(policy.OnFailure(60s), 25s);
	EXPECT_EQ(policy.OnFailure(60s), 30s);
	EXPECT_EQ(policy.OnFailure(60s), 30s);
	EXPECT_EQ(policy.GetAttempts(), 6U);
	EXPECT_FALSE(policy.HasGivenUp());
}

TEST(ReconnectPolicy, ShortConnectionPenalty)
{
	ReconnectPolicy policy;

	/* closed 1.5 s after opening: counts twice */
	EXPECT_EQ(policy.OnFailure(1500ms), 15s);
	EXPECT_EQ(policy.GetAttempts(), 2U);

	EXPECT_EQ(policy.OnFailure(2999ms), 25s);
	EXPECT_EQ(policy.GetAttempts(), 4U);

	/* a connection which outlives the short connection window
	   resets the counter */
	policy.Reset();
	EXPECT_EQ(policy.GetAttempts(), 0U);
	EXPECT_EQ(policy.OnFailure(5s), 10s);
}

TEST(ReconnectPolicy, GiveUp)
{
	ReconnectPolicy policy;

	for (unsigned i = 1; i < 15; ++i) {
		EXPECT_TRUE(policy.OnFailure(10s)) << i;
		EXPECT_FALSE(policy.HasGivenUp());
	}

	EXPECT_FALSE(policy.OnFailure(10s));
	EXPECT_TRUE(policy.HasGivenUp());
	EXPECT_EQ(policy.GetAttempts(), 15U);

	policy.Reset();
	EXPECT_FALSE(policy.HasGivenUp());
	EXPECT_EQ(policy.GetAttempts(), 0U);
}

TEST(ReconnectPolicy, GiveUpWithPenalty)
{
	ReconnectPolicy policy;

	for (unsigned i = 0; i < 7; ++i)
		EXPECT_TRUE(policy.OnFailure(0s));

	EXPECT_EQ(policy.GetAttempts(), 14U);
	EXPECT_FALSE(policy.OnFailure(0s));
	EXPECT_TRUE(policy.HasGivenUp());
}

TEST(ReconnectPolicy, ForceReconnect)
{
	ReconnectPolicy policy;

	policy.OnFailure(10s);
	policy.OnFailure(10s);
	policy.OnFailure(10s);
	EXPECT_EQ(policy.GetAttempts(), 3U);

	policy.OnForceReconnect();
	EXPECT_EQ(policy.GetAttempts(), 1U);

	policy.OnForceReconnect();
	EXPECT_EQ(policy.GetAttempts(), 0U);

	policy.OnForceReconnect();
	EXPECT_EQ(policy.GetAttempts(), 0U);
}

TEST(ReconnectPolicy, Throttle)
{
	const ReconnectPolicy policy;
	const Event::TimePoint t0{std::chrono::seconds(1000)};

	EXPECT_EQ(policy.GetThrottleDelay(std::nullopt, t0), Event::Duration::zero());
	EXPECT_EQ(policy.GetThrottleDelay(t0, t0), 2s);
	EXPECT_EQ(policy.GetThrottleDelay(t0, t0 + 500ms), 1500ms);
	EXPECT_EQ(policy.GetThrottleDelay(t0, t0 + 2s), Event::Duration::zero());
	EXPECT_EQ(policy.GetThrottleDelay(t0, t0 + 1min), Event::Duration::zero());
}

TEST(ReconnectPolicy, CustomConfig)
{
	ReconnectConfig config;
	config.delay_base = 100ms;
	config.delay_step = 50ms;
	config.max_delay = 200ms;
	config.max_attempts = 3;
	config.short_connection = Event::Duration::zero();

	ReconnectPolicy policy(config);
	EXPECT_EQ(policy.OnFailure(0s), 150ms);
	EXPECT_EQ(policy.OnFailure(0s), 200ms);
	EXPECT_FALSE(policy.OnFailure(0s));
}
