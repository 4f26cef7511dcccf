// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright The Music Player Daemon Project

#include "api/FakeTransport.hxx"
#include "LoopRunner.hxx"
#include "session/StateRefresher.hxx"
#include "api/Endpoint.hxx"
#include "event/Loop.hxx"

#include <gtest/gtest.h>

#include <vector>

using std::chrono_literals::operator""ms;

namespace {

struct RecordingRefreshHandler final : StateRefresherHandler {
	std::vector<DeviceState> states;

	void OnRefreshedState(DeviceState &&state) noexcept override {
		states.emplace_back(std::move(state));
	}
};

class StateRefresherTest : public ::testing::Test {
protected:
	EventLoop loop;
	FakeTransport transport{loop};
	DeviceEndpoint endpoint{"milo.local", 80, 8000};
	DeviceClient client{transport, endpoint};
	RecordingRefreshHandler handler;
	LoopRunner runner{loop};

	bool WaitRequest() {
		return runner.RunUntil([this]{ return transport.HasPending(); });
	}
};

} // anonymous namespace

TEST_F(StateRefresherTest, Refresh)
{
	StateRefresher refresher(client, handler, 10ms);
	refresher.Start();
	EXPECT_TRUE(refresher.IsRunning());
	EXPECT_TRUE(transport.sent.empty());

	ASSERT_TRUE(WaitRequest());
	transport.Respond(R"({"active_source":"bluetooth","plugin_state":"connected"})");
	ASSERT_EQ(handler.states.size(), 1U);
	EXPECT_EQ(handler.states.front().active_source, "bluetooth");

	ASSERT_TRUE(WaitRequest());
	transport.Respond(R"({"active_source":"none"})");
	ASSERT_EQ(handler.states.size(), 2U);
	EXPECT_EQ(handler.states.back().plugin_state, "inactive");
}

TEST_F(StateRefresherTest, SkipWhileInFlight)
{
	StateRefresher refresher(client, handler, 10ms);
	refresher.Start();

	ASSERT_TRUE(WaitRequest());
	runner.RunFor(50ms);
	EXPECT_EQ(transport.sent.size(), 1U);
}

TEST_F(StateRefresherTest, ResetAfterFailures)
{
	StateRefresher refresher(client, handler, 10ms);
	refresher.Start();

	for (unsigned i = 1; i < StateRefresher::MAX_FAILURES; ++i) {
		ASSERT_TRUE(WaitRequest());
		transport.Fail();
		EXPECT_EQ(refresher.GetFailures(), i);
	}

	EXPECT_EQ(transport.n_resets, 0U);

	ASSERT_TRUE(WaitRequest());
	transport.Fail();
	EXPECT_EQ(transport.n_resets, 1U);
	EXPECT_EQ(refresher.GetFailures(), 0U);

	/* keeps going */
	EXPECT_TRUE(refresher.IsRunning());
	ASSERT_TRUE(WaitRequest());
}

TEST_F(StateRefresherTest, Disabled)
{
	StateRefresher refresher(client, handler, Event::Duration::zero());
	refresher.Start();
	EXPECT_FALSE(refresher.IsRunning());

	runner.RunFor(30ms);
	EXPECT_TRUE(transport.sent.empty());
}

TEST_F(StateRefresherTest, Stop)
{
	StateRefresher refresher(client, handler, 10ms);
	refresher.Start();
	ASSERT_TRUE(WaitRequest());

	refresher.Stop();
	EXPECT_FALSE(refresher.IsRunning());
	EXPECT_EQ(transport.n_canceled, 1U);

	runner.RunFor(30ms);
	EXPECT_EQ(transport.sent.size(), 1U);
}
