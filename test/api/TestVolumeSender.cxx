// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "FakeTransport.hxx"
#include "LoopRunner.hxx"
#include "api/VolumeSender.hxx"
#include "api/Endpoint.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

namespace {

class VolumeSenderTest : public ::testing::Test {
protected:
	EventLoop loop;
	FakeTransport transport{loop};
	DeviceEndpoint endpoint{"milo.local", 80, 8000};
	DeviceClient client{transport, endpoint};
	VolumeSender sender{client};

	double GetSentVolume(std::size_t i) const {
		return nlohmann::json::parse(transport.sent.at(i).body)["volume_db"].get<double>();
	}
};

} // anonymous namespace

TEST_F(VolumeSenderTest, FirstValueIsSentImmediately)
{
	sender.Set(-40);
	ASSERT_EQ(transport.sent.size(), 1u);
	EXPECT_EQ(transport.sent[0].url, "http://milo.local:80/api/volume/set");
	EXPECT_DOUBLE_EQ(GetSentVolume(0), -40);
	EXPECT_TRUE(sender.IsBusy());
	EXPECT_FALSE(sender.GetPending());
}

TEST_F(VolumeSenderTest, Clamp)
{
	VolumeState limits;
	limits.limit_min_db = -60;
	limits.limit_max_db = -20;
	sender.SetLimits(limits);

	sender.Set(0);
	ASSERT_EQ(transport.sent.size(), 1u);
	EXPECT_DOUBLE_EQ(GetSentVolume(0), -20);
	transport.Respond("{}");

	/* same loop time: the next value is debounced */
	sender.Set(-100);
	EXPECT_EQ(transport.sent.size(), 1u);
	EXPECT_DOUBLE_EQ(*sender.GetPending(), -60);

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return transport.sent.size() == 2; }));
	EXPECT_DOUBLE_EQ(GetSentVolume(1), -60);
}

TEST_F(VolumeSenderTest, CoalesceWhileBusy)
{
	sender.Set(-40);
	sender.Set(-39);
	sender.Set(-38);
	sender.Set(-37);

	/* only one request in flight; the newest value waits */
	ASSERT_EQ(transport.sent.size(), 1u);
	EXPECT_DOUBLE_EQ(*sender.GetPending(), -37);

	transport.Respond("{}");
	EXPECT_FALSE(sender.IsBusy());

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return transport.sent.size() == 2; }));
	EXPECT_DOUBLE_EQ(GetSentVolume(1), -37);
	EXPECT_FALSE(sender.GetPending());

	transport.Respond("{}");
	runner.RunFor(std::chrono::milliseconds(100));
	EXPECT_EQ(transport.sent.size(), 2u);
}

TEST_F(VolumeSenderTest, SentImmediatelyAfterQuietPeriod)
{
	sender.Set(-40);
	transport.Respond("{}");

	LoopRunner runner(loop);
	runner.RunFor(std::chrono::milliseconds(150));

	loop.FlushClockCaches();
	sender.Set(-30);
	ASSERT_EQ(transport.sent.size(), 2u);
	EXPECT_DOUBLE_EQ(GetSentVolume(1), -30);
}

TEST_F(VolumeSenderTest, FailureKeepsValuePending)
{
	sender.Set(-40);
	transport.Fail();

	EXPECT_FALSE(sender.IsBusy());
	ASSERT_TRUE(sender.GetPending());
	EXPECT_DOUBLE_EQ(*sender.GetPending(), -40);
}

TEST_F(VolumeSenderTest, FailureWithNewerValue)
{
	sender.Set(-40);
	sender.Set(-35);
	transport.Fail();

	LoopRunner runner(loop);
	ASSERT_TRUE(runner.RunUntil([this]{ return transport.sent.size() == 2; }));
	EXPECT_DOUBLE_EQ(GetSentVolume(1), -35);
}

TEST_F(VolumeSenderTest, Cancel)
{
	sender.Set(-40);
	sender.Set(-35);
	sender.Cancel();

	EXPECT_FALSE(sender.IsBusy());
	EXPECT_FALSE(sender.GetPending());
	EXPECT_EQ(transport.n_canceled, 1u);

	LoopRunner runner(loop);
	runner.RunFor(std::chrono::milliseconds(100));
	EXPECT_EQ(transport.sent.size(), 1u);
}
